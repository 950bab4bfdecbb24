#pragma once

#include <cmath>

#include "LauncherParam.hpp"
#include "libxr_def.hpp"

namespace flywheel {

struct VelocityCommand {
  /*闭环速度设定值，rps*/
  float setpoint_rps;
  /*前馈，占电源电压的比例*/
  float feedforward;
};

/**
 * @brief 单个摩擦轮的速度控制
 * @details 设定值直通给驱动闭环，前馈按电源电压归一化。只保存前馈模型。
 */
class VelocityController {
 public:
  explicit VelocityController(FeedforwardModel model) : model_(model) {}

  VelocityCommand Update(float target_rps, float measured_rps,
                         float supply_voltage) const {
    UNUSED(measured_rps);
    return VelocityCommand{
        .setpoint_rps = target_rps,
        .feedforward = Feedforward(target_rps, supply_voltage),
    };
  }

  /**
   * @brief 计算归一化前馈
   * @param target_rps 目标转速
   * @param supply_voltage 电源电压，为0或非有限值时前馈为0
   * @return float (kS*sign(v) + kV*v) / U
   */
  float Feedforward(float target_rps, float supply_voltage) const {
    if (!std::isfinite(supply_voltage) || supply_voltage == 0.0f) {
      return 0.0f;
    }
    float volts =
        model_.static_voltage * Sign(target_rps) +
        model_.velocity_gain * target_rps;
    return volts / supply_voltage;
  }

  static bool IsAtSpeed(float target_rps, float measured_rps,
                        float tolerance = param::DEFAULT_VELOCITY_TOLERANCE) {
    return std::fabs(target_rps - measured_rps) <=
           std::fabs(target_rps) * tolerance;
  }

 private:
  FeedforwardModel model_;

  static float Sign(float value) {
    if (value > 0.0f) {
      return 1.0f;
    }
    if (value < 0.0f) {
      return -1.0f;
    }
    return 0.0f;
  }
};

}  // namespace flywheel
