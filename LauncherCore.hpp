#pragma once

#include <cmath>
#include <initializer_list>

#include "Actuator.hpp"
#include "CalibrationTable.hpp"
#include "FiringSequencer.hpp"
#include "LauncherParam.hpp"
#include "RangeMapper.hpp"
#include "Readiness.hpp"
#include "VelocityController.hpp"
#include "libxr_def.hpp"
#include "logger.hpp"

namespace flywheel {

/**
 * @brief 双摩擦轮发射机构控制核心
 * @details 不依赖具体硬件与线程，由外部按固定周期依次调用 SetRange、Execute。
 * 调用方保证所有接口串行执行。
 */
class LauncherCore {
 public:
  LauncherCore(const LauncherParam &param, VelocityActuator *centre_motor,
               VelocityActuator *outer_motor, PulseActuator *loading_piston)
      : param_(param),
        mapper_(table_, target_),
        controller_{VelocityController(param.centre_feedforward),
                    VelocityController(param.outer_feedforward)},
        motor_{centre_motor, outer_motor},
        sequencer_(loading_piston) {}

  LauncherCore(const LauncherCore &) = delete;
  LauncherCore &operator=(const LauncherCore &) = delete;

  ErrorCode LoadCalibration(std::initializer_list<CalibrationSample> samples) {
    return table_.Load(samples);
  }

  /**
   * @brief 使能，先将两摩擦轮停转
   * @return ErrorCode 标定表未加载时返回 STATE_ERR 并保持失能
   */
  ErrorCode OnEnable() {
    StopMotors();
    if (table_.Empty()) {
      XR_LOG_ERROR("launcher enable refused: no calibration table");
      enabled_ = false;
      return ErrorCode::STATE_ERR;
    }
    enabled_ = true;
    XR_LOG_INFO("launcher enabled");
    return ErrorCode::OK;
  }

  void OnDisable() {
    StopMotors();
    if (enabled_) {
      XR_LOG_INFO("launcher disabled");
    }
    enabled_ = false;
    last_fire_cmd_ = false;
  }

  bool IsEnabled() const { return enabled_; }

  /**
   * @brief 设置目标平面距离，换算为两摩擦轮目标转速
   * @param distance 到目标的平面距离
   */
  void SetRange(float distance) { mapper_.SetRange(distance); }

  /**
   * @brief 控制周期
   * @param supply_voltage 当前电源电压
   * @details 依次下发两摩擦轮速度指令，再处理挂起的发射请求。失能时不输出。
   */
  void Execute(float supply_voltage) {
    if (!enabled_) {
      return;
    }

    const float TARGET[ACTUATOR_NUM] = {target_.centre_target_rps,
                                        target_.outer_target_rps};
    for (uint8_t i = 0; i < ACTUATOR_NUM; i++) {
      last_cmd_[i] = controller_[i].Update(
          TARGET[i], motor_[i]->GetMeasuredVelocity(), supply_voltage);
      motor_[i]->SetVelocityCommand(last_cmd_[i].setpoint_rps,
                                    last_cmd_[i].feedforward);
    }

    if (sequencer_.Tick()) {
      XR_LOG_INFO("launcher fire: centre %f outer %f",
                  static_cast<double>(target_.centre_target_rps),
                  static_cast<double>(target_.outer_target_rps));
    }
  }

  /* 下一个控制周期推弹，不检查是否就绪 */
  void RequestFire() { sequencer_.RequestFire(); }

  bool IsFirePending() const { return sequencer_.IsPending(); }

  /**
   * @brief 操作手发射指令边沿检测
   * @param fire_cmd 当前周期的发射指令
   * @return bool 本周期是否锁存了推弹请求
   * @details 只在上升沿且已使能、已就绪时锁存一次，其余上升沿丢弃。
   * 保持按下不会重复发射，失能后重新计边沿。
   */
  bool UpdateFireCommand(bool fire_cmd) {
    bool rising = fire_cmd && !last_fire_cmd_;
    last_fire_cmd_ = fire_cmd;
    if (!rising) {
      return false;
    }
    if (!enabled_ || !IsReady()) {
      XR_LOG_WARN(
          "launcher fire dropped: enabled %d range %d speed %d firing %d",
          enabled_, IsInRange(), IsAtSpeed(), IsFiring());
      return false;
    }
    sequencer_.RequestFire();
    return true;
  }

  float GetCentreVelocity() {
    return motor_[static_cast<uint8_t>(Actuator::CENTRE)]
        ->GetMeasuredVelocity();
  }

  float GetOuterVelocity() {
    return motor_[static_cast<uint8_t>(Actuator::OUTER)]
        ->GetMeasuredVelocity();
  }

  bool IsCentreAtSpeed() {
    return VelocityController::IsAtSpeed(target_.centre_target_rps,
                                         GetCentreVelocity(),
                                         param_.velocity_tolerance);
  }

  bool IsOuterAtSpeed() {
    return VelocityController::IsAtSpeed(target_.outer_target_rps,
                                         GetOuterVelocity(),
                                         param_.velocity_tolerance);
  }

  bool IsAtSpeed() {
    return ReadinessEvaluator::IsAtSpeed(IsCentreAtSpeed(), IsOuterAtSpeed());
  }

  bool IsFiring() { return sequencer_.IsPulseInProgress(); }

  bool IsInRange() const { return target_.in_range; }

  bool IsReady() {
    return ReadinessEvaluator::IsReady(IsInRange(), IsCentreAtSpeed(),
                                       IsOuterAtSpeed(), IsFiring());
  }

  const TargetState &GetTargets() const { return target_; }

  /**
   * @brief 操作台直接设置目标转速
   * @details 不修改射程标志，下一次 SetRange 会覆盖。
   */
  ErrorCode SetTargets(float centre_rps, float outer_rps) {
    if (!std::isfinite(centre_rps) || !std::isfinite(outer_rps) ||
        centre_rps < 0.0f || outer_rps < 0.0f) {
      XR_LOG_WARN("launcher target rejected: centre %f outer %f",
                  static_cast<double>(centre_rps),
                  static_cast<double>(outer_rps));
      return ErrorCode::ARG_ERR;
    }
    target_.centre_target_rps = centre_rps;
    target_.outer_target_rps = outer_rps;
    return ErrorCode::OK;
  }

  const VelocityCommand &GetLastCommand(Actuator actuator) const {
    return last_cmd_[static_cast<uint8_t>(actuator)];
  }

 private:
  const LauncherParam param_;
  CalibrationTable table_;
  TargetState target_{
      .centre_target_rps = 0.0f, .outer_target_rps = 0.0f, .in_range = false};
  RangeToVelocityMapper mapper_;

  VelocityController controller_[ACTUATOR_NUM];
  VelocityActuator *motor_[ACTUATOR_NUM];
  VelocityCommand last_cmd_[ACTUATOR_NUM] = {
      {.setpoint_rps = 0.0f, .feedforward = 0.0f},
      {.setpoint_rps = 0.0f, .feedforward = 0.0f}};

  FiringSequencer sequencer_;
  bool enabled_ = false;
  bool last_fire_cmd_ = false;

  void StopMotors() {
    for (uint8_t i = 0; i < ACTUATOR_NUM; i++) {
      motor_[i]->Stop();
      last_cmd_[i] = {.setpoint_rps = 0.0f, .feedforward = 0.0f};
    }
  }
};

}  // namespace flywheel
