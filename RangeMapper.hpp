#pragma once

#include <algorithm>
#include <cmath>

#include "CalibrationTable.hpp"
#include "LauncherParam.hpp"

namespace flywheel {

/**
 * @brief 距离到摩擦轮转速的映射
 * @details 超出标定范围时钳位到边界并标记不在射程内，不做外推。
 */
class RangeToVelocityMapper {
 public:
  RangeToVelocityMapper(const CalibrationTable &table, TargetState &target)
      : table_(table), target_(target) {}

  void SetRange(float distance) {
    if (table_.Empty()) {
      target_.in_range = false;
      return;
    }

    const float MIN_DIST = table_.MinDistance();
    const float MAX_DIST = table_.MaxDistance();

    if (distance >= MIN_DIST && distance <= MAX_DIST) {
      target_.in_range = true;
    } else {
      distance = std::isnan(distance)
                     ? MIN_DIST
                     : std::clamp(distance, MIN_DIST, MAX_DIST);
      target_.in_range = false;
    }

    CalibrationSample sample = table_.Interpolate(distance);
    target_.centre_target_rps = sample.centre_rps;
    target_.outer_target_rps = sample.outer_rps;
  }

 private:
  const CalibrationTable &table_;
  TargetState &target_;
};

}  // namespace flywheel
