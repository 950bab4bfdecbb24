#pragma once

#include <cstdint>

namespace flywheel::param {
constexpr float DEFAULT_VELOCITY_TOLERANCE = 0.05f;
constexpr float DEFAULT_PULSE_DURATION_SEC = 0.5f;
}  // namespace flywheel::param

namespace flywheel {

enum class Actuator : uint8_t {
  CENTRE = 0,
  OUTER,
};

constexpr uint8_t ACTUATOR_NUM = 2;

/**
 * @brief 摩擦轮前馈模型
 * @details 静摩擦电压 + 反电动势比例项，单位 V 与 V/rps。
 */
struct FeedforwardModel {
  float static_voltage;
  float velocity_gain;
};

/**
 * @brief 驱动原生速度单位与 rps 的换算
 * @details 原生速度 = 每采样周期计数值，rps = 原生 / 每转计数 / 采样周期。
 * RMMotor 反馈 RPM，即每转一计数、采样周期 60s。
 */
struct VelocityScale {
  float counts_per_revolution;
  float sample_period_sec;

  float ToRps(float native) const {
    return native / (counts_per_revolution * sample_period_sec);
  }

  float FromRps(float rps) const {
    return rps * counts_per_revolution * sample_period_sec;
  }
};

constexpr VelocityScale TALON_FX_SCALE{.counts_per_revolution = 2048.0f,
                                       .sample_period_sec = 0.1f};
constexpr VelocityScale RPM_SCALE{.counts_per_revolution = 1.0f,
                                  .sample_period_sec = 60.0f};

struct LauncherParam {
  /*到速容差，相对目标转速*/
  float velocity_tolerance;
  /*推弹气缸脉冲时长*/
  float pulse_duration_sec;
  /*中心摩擦轮前馈*/
  FeedforwardModel centre_feedforward;
  /*外侧摩擦轮前馈*/
  FeedforwardModel outer_feedforward;
};

constexpr LauncherParam DEFAULT_LAUNCHER_PARAM{
    .velocity_tolerance = param::DEFAULT_VELOCITY_TOLERANCE,
    .pulse_duration_sec = param::DEFAULT_PULSE_DURATION_SEC,
    .centre_feedforward = {.static_voltage = 0.158f, .velocity_gain = 0.11f},
    .outer_feedforward = {.static_voltage = 0.187f, .velocity_gain = 0.11f},
};

/**
 * @brief 摩擦轮目标状态
 * @details 由距离映射写入，也可被操作台直接调整。
 */
struct TargetState {
  float centre_target_rps;
  float outer_target_rps;
  bool in_range;
};

}  // namespace flywheel
