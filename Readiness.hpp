#pragma once

namespace flywheel {

/* 射程内、两摩擦轮到速且气缸未在动作时允许发射 */
class ReadinessEvaluator {
 public:
  static bool IsReady(bool in_range, bool centre_at_speed, bool outer_at_speed,
                      bool pulse_in_progress) {
    return in_range && IsAtSpeed(centre_at_speed, outer_at_speed) &&
           !pulse_in_progress;
  }

  static bool IsAtSpeed(bool centre_at_speed, bool outer_at_speed) {
    return centre_at_speed && outer_at_speed;
  }
};

}  // namespace flywheel
