#pragma once

#ifndef FLYWHEEL_LAUNCHER_DEBUG_IMPL
#include "FlywheelLauncher.hpp"
#endif

#include <array>
#include <cstdlib>
#include <cstring>

inline int FlywheelLauncher::DebugCommand(int argc, char **argv) {
  /* launcher set <centre_rps> <outer_rps> */
  if (argc >= 2 && std::strcmp(argv[1], "set") == 0) {
    if (argc != 4) {
      XR_LOG_WARN("usage: launcher set <centre_rps> <outer_rps>");
      return -1;
    }
    char *centre_end = nullptr;
    char *outer_end = nullptr;
    float centre = std::strtof(argv[2], &centre_end);
    float outer = std::strtof(argv[3], &outer_end);
    if (centre_end == argv[2] || *centre_end != '\0' || outer_end == argv[3] ||
        *outer_end != '\0') {
      XR_LOG_WARN("launcher set: invalid number");
      return -1;
    }

    mutex_.Lock();
    ErrorCode ans = core_.SetTargets(centre, outer);
    mutex_.Unlock();
    if (ans != ErrorCode::OK) {
      return -1;
    }
    XR_LOG_INFO("launcher target: centre %f outer %f",
                static_cast<double>(centre), static_cast<double>(outer));
    return 0;
  }

  enum class DebugView : uint8_t { STATE, MOTOR, TARGET, FULL };

  constexpr uint8_t view_state = static_cast<uint8_t>(DebugView::STATE);
  constexpr uint8_t view_motor = static_cast<uint8_t>(DebugView::MOTOR);
  constexpr uint8_t view_target = static_cast<uint8_t>(DebugView::TARGET);
  constexpr uint8_t view_full = static_cast<uint8_t>(DebugView::FULL);

  constexpr debug_core::ViewMask mask_state = debug_core::view_bit(view_state);
  constexpr debug_core::ViewMask mask_motor = debug_core::view_bit(view_motor);
  constexpr debug_core::ViewMask mask_target =
      debug_core::view_bit(view_target);

  static constexpr std::array<debug_core::ViewEntry<uint8_t>, 4> view_table{{
      {"state", view_state},
      {"motor", view_motor},
      {"target", view_target},
      {"full", view_full},
  }};

  static const debug_core::LiveFieldDesc<FlywheelLauncher> fields[] = {
      DEBUG_CORE_LIVE_BOOL(FlywheelLauncher, "enabled", mask_state,
                           self->status_.enabled),
      DEBUG_CORE_LIVE_BOOL(FlywheelLauncher, "ready", mask_state,
                           self->status_.ready),
      DEBUG_CORE_LIVE_BOOL(FlywheelLauncher, "in_range", mask_state,
                           self->status_.in_range),
      DEBUG_CORE_LIVE_BOOL(FlywheelLauncher, "at_speed", mask_state,
                           self->status_.at_speed),
      DEBUG_CORE_LIVE_BOOL(FlywheelLauncher, "firing", mask_state,
                           self->status_.firing),
      DEBUG_CORE_LIVE_BOOL(FlywheelLauncher, "fire_pending", mask_state,
                           self->status_.fire_pending),
      DEBUG_CORE_LIVE_BOOL(FlywheelLauncher, "is_fire_cmd", mask_state,
                           self->launcher_cmd_.isfire),
      DEBUG_CORE_LIVE_F32(FlywheelLauncher, "dt", mask_state, self->dt_),
      DEBUG_CORE_LIVE_F32(FlywheelLauncher, "centre_velocity", mask_motor,
                          self->status_.centre_velocity),
      DEBUG_CORE_LIVE_F32(FlywheelLauncher, "outer_velocity", mask_motor,
                          self->status_.outer_velocity),
      DEBUG_CORE_LIVE_F32(FlywheelLauncher, "centre_ff", mask_motor,
                          self->status_.centre_feedforward),
      DEBUG_CORE_LIVE_F32(FlywheelLauncher, "outer_ff", mask_motor,
                          self->status_.outer_feedforward),
      DEBUG_CORE_LIVE_F32(FlywheelLauncher, "supply_voltage", mask_motor,
                          self->supply_voltage_),
      DEBUG_CORE_LIVE_F32(FlywheelLauncher, "distance", mask_target,
                          self->distance_),
      DEBUG_CORE_LIVE_F32(FlywheelLauncher, "centre_target", mask_target,
                          self->status_.centre_target),
      DEBUG_CORE_LIVE_F32(FlywheelLauncher, "outer_target", mask_target,
                          self->status_.outer_target),
  };

  auto lock_self = +[](FlywheelLauncher *self) { self->mutex_.Lock(); };
  auto unlock_self = +[](FlywheelLauncher *self) { self->mutex_.Unlock(); };

  return debug_core::run_live_command(
      this, "launcher", "state|motor|target|full|set", view_table, fields,
      sizeof(fields) / sizeof(fields[0]), argc, argv, view_full, lock_self,
      unlock_self);
}
