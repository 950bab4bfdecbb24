#pragma once

namespace flywheel {

/**
 * @brief 摩擦轮驱动接口
 * @details 速度闭环由驱动完成，core 只下发设定值与前馈。
 */
class VelocityActuator {
 public:
  virtual ~VelocityActuator() = default;

  virtual void SetVelocityCommand(float setpoint_rps, float feedforward) = 0;
  virtual float GetMeasuredVelocity() = 0;
  /*停转，进入安全空闲状态*/
  virtual void Stop() = 0;
};

/**
 * @brief 推弹气缸驱动接口
 */
class PulseActuator {
 public:
  virtual ~PulseActuator() = default;

  virtual void StartPulse() = 0;
  virtual bool IsPulsing() = 0;
};

}  // namespace flywheel
