#pragma once

#include <algorithm>

#include "Actuator.hpp"
#include "LauncherParam.hpp"
#include "RMMotor.hpp"
#include "pid.hpp"

namespace flywheel {

/**
 * @brief RMMotor 摩擦轮驱动
 * @details 板上 PID 速度环输出叠加归一化前馈，以电流模式下发。
 * 前馈是占电源电压的比例，这里直接作为归一化电流偏置叠加，与 PID 输出
 * 共用 [-1, 1] 满量程。reverse 用于电机反装，测量值与输出同时取反。
 */
class RMMotorVelocityActuator : public VelocityActuator {
 public:
  RMMotorVelocityActuator(RMMotor *motor, LibXR::PID<float>::Param pid_param,
                          bool reverse)
      : motor_(motor), pid_(pid_param), reverse_(reverse) {}

  /**
   * @brief 刷新电机反馈
   * @param dt 控制周期
   */
  void Update(float dt) {
    dt_ = dt;
    motor_->Update();
    float rps = RPM_SCALE.ToRps(motor_->GetRPM());
    measured_rps_ = reverse_ ? -rps : rps;
  }

  void SetVelocityCommand(float setpoint_rps, float feedforward) override {
    out_ = pid_.Calculate(setpoint_rps, measured_rps_, dt_) + feedforward;
    out_ = std::clamp(out_, -1.0f, 1.0f);
    motor_->CurrentControl(reverse_ ? -out_ : out_);
  }

  float GetMeasuredVelocity() override { return measured_rps_; }

  void Stop() override {
    pid_.Reset();
    out_ = 0.0f;
    motor_->Relax();
  }

 private:
  RMMotor *motor_;
  LibXR::PID<float> pid_;
  bool reverse_;

  float dt_ = 0.0f;
  float measured_rps_ = 0.0f;
  float out_ = 0.0f;
};

}  // namespace flywheel
