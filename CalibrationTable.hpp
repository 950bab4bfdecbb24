#pragma once

#include <cmath>
#include <cstddef>
#include <initializer_list>
#include <vector>

#include "libxr_def.hpp"
#include "logger.hpp"

namespace flywheel {

struct CalibrationSample {
  float distance;
  float centre_rps;
  float outer_rps;
};

/**
 * @brief 距离-转速标定表
 * @details 距离严格递增，至少两个采样点，转速非负。加载后不再修改。
 */
class CalibrationTable {
 public:
  CalibrationTable() = default;

  /**
   * @brief 加载标定数据
   * @param samples 标定采样点，按距离升序
   * @return ErrorCode 数据非法时返回 SIZE_ERR/ARG_ERR，表保持为空
   */
  ErrorCode Load(std::initializer_list<CalibrationSample> samples) {
    return Load(samples.begin(), samples.size());
  }

  ErrorCode Load(const CalibrationSample *samples, size_t size) {
    samples_.clear();

    if (samples == nullptr || size < 2) {
      XR_LOG_ERROR("calibration table needs at least 2 samples, got %u",
                   static_cast<unsigned>(size));
      return ErrorCode::SIZE_ERR;
    }

    for (size_t i = 0; i < size; i++) {
      const CalibrationSample &s = samples[i];
      if (!std::isfinite(s.distance) || !std::isfinite(s.centre_rps) ||
          !std::isfinite(s.outer_rps)) {
        XR_LOG_ERROR("calibration sample %u is not finite",
                     static_cast<unsigned>(i));
        return ErrorCode::ARG_ERR;
      }
      if (s.centre_rps < 0.0f || s.outer_rps < 0.0f) {
        XR_LOG_ERROR("calibration sample %u has negative velocity",
                     static_cast<unsigned>(i));
        return ErrorCode::ARG_ERR;
      }
      if (i > 0 && !(s.distance > samples[i - 1].distance)) {
        XR_LOG_ERROR(
            "calibration distances must increase strictly: [%u]=%f after "
            "[%u]=%f",
            static_cast<unsigned>(i), static_cast<double>(s.distance),
            static_cast<unsigned>(i - 1),
            static_cast<double>(samples[i - 1].distance));
        return ErrorCode::ARG_ERR;
      }
    }

    samples_.assign(samples, samples + size);
    return ErrorCode::OK;
  }

  bool Empty() const { return samples_.empty(); }
  size_t Size() const { return samples_.size(); }

  /* 空表返回0 */
  float MinDistance() const {
    return samples_.empty() ? 0.0f : samples_.front().distance;
  }
  float MaxDistance() const {
    return samples_.empty() ? 0.0f : samples_.back().distance;
  }

  /* 调用方保证 index < Size() */
  const CalibrationSample &operator[](size_t index) const {
    return samples_[index];
  }

  /**
   * @brief 分段线性插值
   * @param distance 查询距离，超出范围时取边界值
   * @return CalibrationSample 插值结果，distance 字段为实际使用的距离。
   * 空表返回全0
   */
  CalibrationSample Interpolate(float distance) const {
    if (samples_.empty()) {
      return CalibrationSample{
          .distance = 0.0f, .centre_rps = 0.0f, .outer_rps = 0.0f};
    }
    if (!(distance > samples_.front().distance)) {
      return samples_.front();
    }
    if (!(distance < samples_.back().distance)) {
      return samples_.back();
    }

    size_t upper = 1;
    while (samples_[upper].distance < distance) {
      upper++;
    }
    const CalibrationSample &lo = samples_[upper - 1];
    const CalibrationSample &hi = samples_[upper];

    float ratio = (distance - lo.distance) / (hi.distance - lo.distance);
    return CalibrationSample{
        .distance = distance,
        .centre_rps = lo.centre_rps + ratio * (hi.centre_rps - lo.centre_rps),
        .outer_rps = lo.outer_rps + ratio * (hi.outer_rps - lo.outer_rps),
    };
  }

 private:
  std::vector<CalibrationSample> samples_;
};

}  // namespace flywheel
