#pragma once

#include "Actuator.hpp"
#include "gpio.hpp"
#include "libxr_def.hpp"
#include "libxr_time.hpp"
#include "logger.hpp"
#include "timebase.hpp"

namespace flywheel {

/**
 * @brief 电磁阀推弹气缸
 * @details StartPulse 拉高输出并计时，Poll 在脉冲时长到达后拉低。
 * Poll 需要每个控制周期调用。
 */
class GpioPulseActuator : public PulseActuator {
 public:
  GpioPulseActuator(LibXR::GPIO *gpio, float pulse_duration_sec)
      : gpio_(gpio), pulse_duration_sec_(pulse_duration_sec) {
    ErrorCode ans = gpio_->SetConfig({LibXR::GPIO::Direction::OUTPUT_PUSH_PULL,
                                      LibXR::GPIO::Pull::NONE});
    if (ans != ErrorCode::OK) {
      XR_LOG_ERROR("launcher piston gpio config failed: %d",
                   static_cast<int>(ans));
    }
    Output(false);
  }

  void StartPulse() override {
    if (Output(true) != ErrorCode::OK) {
      return;
    }
    pulse_start_time_ = LibXR::Timebase::GetMilliseconds();
    pulsing_ = true;
  }

  bool IsPulsing() override { return pulsing_; }

  void Poll() {
    if (!pulsing_) {
      return;
    }
    auto now = LibXR::Timebase::GetMilliseconds();
    if ((now - pulse_start_time_).ToSecondf() >= pulse_duration_sec_) {
      Output(false);
      pulsing_ = false;
    }
  }

  /* 失能时立即收回 */
  void Cancel() {
    Output(false);
    pulsing_ = false;
  }

 private:
  LibXR::GPIO *gpio_;
  float pulse_duration_sec_;
  bool pulsing_ = false;
  LibXR::MillisecondTimestamp pulse_start_time_ = 0;

  ErrorCode Output(bool value) {
    ErrorCode ans = gpio_->Write(value);
    if (ans != ErrorCode::OK) {
      XR_LOG_ERROR("launcher piston gpio write failed: %d",
                   static_cast<int>(ans));
    }
    return ans;
  }
};

}  // namespace flywheel
