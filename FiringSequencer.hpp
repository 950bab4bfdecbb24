#pragma once

#include <cstdint>

#include "Actuator.hpp"

namespace flywheel {

/**
 * @brief 单发推弹时序
 * @details 请求在下一个控制周期发出一个脉冲，不排队，请求一旦锁存不可撤销。
 */
class FiringSequencer {
 public:
  enum class STATE : uint8_t {
    IDLE = 0,
    PULSE_PENDING,
  };

  explicit FiringSequencer(PulseActuator *piston) : piston_(piston) {}

  void RequestFire() { state_ = STATE::PULSE_PENDING; }

  /**
   * @brief 每个控制周期调用一次
   * @return true 本周期发出了脉冲
   */
  bool Tick() {
    if (state_ != STATE::PULSE_PENDING) {
      return false;
    }
    piston_->StartPulse();
    state_ = STATE::IDLE;
    return true;
  }

  bool IsPulseInProgress() { return piston_->IsPulsing(); }

  bool IsPending() const { return state_ == STATE::PULSE_PENDING; }

  STATE GetState() const { return state_; }

 private:
  PulseActuator *piston_;
  STATE state_ = STATE::IDLE;
};

}  // namespace flywheel
