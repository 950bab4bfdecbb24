#pragma once

// clang-format off
/* === MODULE MANIFEST V2 ===
module_description: Dual flywheel launcher with distance based targeting
constructor_args:
  - motor_centre: '@&motor_fric_centre'
  - motor_outer: '@&motor_fric_outer'
  - task_stack_depth: 2048
  - pid_param_centre:
      k: 1.0
      p: 0.0042
      i: 0.0
      d: 0.0
      i_limit: 0.0
      out_limit: 1.0
      cycle: false
  - pid_param_outer:
      k: 1.0
      p: 0.00394
      i: 0.0
      d: 0.0
      i_limit: 0.0
      out_limit: 1.0
      cycle: false
  - motor_param:
      centre_reverse: false
      outer_reverse: true
  - launcher_param:
      velocity_tolerance: 0.05
      pulse_duration_sec: 0.5
      centre_feedforward:
        static_voltage: 0.158
        velocity_gain: 0.11
      outer_feedforward:
        static_voltage: 0.187
        velocity_gain: 0.11
  - calibration:
      - distance: 0.0
        centre_rps: 0.0
        outer_rps: 5000.0
      - distance: 7.0
        centre_rps: 880.0
        outer_rps: 5000.0
      - distance: 8.0
        centre_rps: 1120.0
        outer_rps: 5000.0
      - distance: 9.0
        centre_rps: 1500.0
        outer_rps: 5000.0
      - distance: 10.0
        centre_rps: 2150.0
        outer_rps: 5000.0
      - distance: 11.0
        centre_rps: 2400.0
        outer_rps: 5000.0
  - cmd: '@&cmd'
template_args: []
required_hardware:
  - launcher_piston
  - ramfs
  - can
depends:
  - qdu-future/CMD
  - qdu-future/RMMotor
=== END MANIFEST === */
// clang-format on

#include <cstdint>
#include <initializer_list>

#include "CMD.hpp"
#ifdef DEBUG
#include "DebugCore.hpp"
#include "ramfs.hpp"
#endif
#include "CalibrationTable.hpp"
#include "GpioPulseActuator.hpp"
#include "LauncherCore.hpp"
#include "LauncherParam.hpp"
#include "RMMotor.hpp"
#include "RMMotorVelocityActuator.hpp"
#include "app_framework.hpp"
#include "event.hpp"
#include "gpio.hpp"
#include "libxr_cb.hpp"
#include "libxr_def.hpp"
#include "libxr_time.hpp"
#include "logger.hpp"
#include "message.hpp"
#include "mutex.hpp"
#include "pid.hpp"
#include "thread.hpp"
#include "timebase.hpp"

class FlywheelLauncher : public LibXR::Application {
 public:
  enum class LauncherEvent : uint8_t {
    SET_MODE_DISABLE,
    SET_MODE_ENABLE,
  };

  struct MotorParam {
    /*中心摩擦轮反装*/
    bool centre_reverse;
    /*外侧摩擦轮反装*/
    bool outer_reverse;
  };

  /**
   * @brief 双摩擦轮发射器构造函数
   * @param hw 硬件容器
   * @param app 应用管理器
   * @param motor_centre 中心摩擦轮电机
   * @param motor_outer 外侧摩擦轮电机
   * @param task_stack_depth 控制线程栈深度
   * @param pid_param_centre 中心摩擦轮速度环参数
   * @param pid_param_outer 外侧摩擦轮速度环参数
   * @param motor_param 电机安装方向
   * @param launcher_param 发射机构参数
   * @param calibration 距离-转速标定表
   * @param cmd CMD模块指针
   * @details 标定表非法时模块保持失能，摩擦轮不会被驱动。
   */
  FlywheelLauncher(LibXR::HardwareContainer &hw,
                   LibXR::ApplicationManager &app, RMMotor *motor_centre,
                   RMMotor *motor_outer, uint32_t task_stack_depth,
                   LibXR::PID<float>::Param pid_param_centre,
                   LibXR::PID<float>::Param pid_param_outer,
                   MotorParam motor_param,
                   flywheel::LauncherParam launcher_param,
                   std::initializer_list<flywheel::CalibrationSample>
                       calibration,
                   CMD *cmd)
      : centre_motor_(motor_centre, pid_param_centre,
                      motor_param.centre_reverse),
        outer_motor_(motor_outer, pid_param_outer, motor_param.outer_reverse),
        piston_(hw.template FindOrExit<LibXR::GPIO>({"launcher_piston"}),
                launcher_param.pulse_duration_sec),
        core_(launcher_param, &centre_motor_, &outer_motor_, &piston_),
        cmd_(cmd)
#ifdef DEBUG
        ,
        cmd_file_(LibXR::RamFS::CreateFile(
            "launcher",
            debug_core::command_thunk<FlywheelLauncher,
                                      &FlywheelLauncher::DebugCommand>,
            this))
#endif
  {
    UNUSED(app);

    if (core_.LoadCalibration(calibration) != ErrorCode::OK) {
      XR_LOG_ERROR("launcher calibration invalid, launcher stays disabled");
    }

    auto lost_ctrl_callback = LibXR::Callback<uint32_t>::Create(
        [](bool in_isr, FlywheelLauncher *launcher, uint32_t event_id) {
          UNUSED(in_isr);
          UNUSED(event_id);
          launcher->LostCtrl();
        },
        this);
    cmd_->GetEvent().Register(CMD::CMD_EVENT_LOST_CTRL, lost_ctrl_callback);

    auto mode_callback = LibXR::Callback<uint32_t>::Create(
        [](bool in_isr, FlywheelLauncher *launcher, uint32_t event_id) {
          UNUSED(in_isr);
          launcher->SetMode(event_id);
        },
        this);
    launcher_event_.Register(
        static_cast<uint32_t>(LauncherEvent::SET_MODE_DISABLE), mode_callback);
    launcher_event_.Register(
        static_cast<uint32_t>(LauncherEvent::SET_MODE_ENABLE), mode_callback);

#ifdef DEBUG
    hw.template FindOrExit<LibXR::RamFS>({"ramfs"})->Add(cmd_file_);
#endif

    thread_.Create(this, ThreadFunction, "LauncherThread", task_stack_depth,
                   LibXR::Thread::Priority::HIGH);
  }

  /**
   * @brief 发射器主线程函数
   * @param launcher FlywheelLauncher对象指针
   * @details 读取距离、电压和发射指令，执行一个控制周期并发布状态话题。
   */
  static void ThreadFunction(FlywheelLauncher *launcher) {
    LibXR::Topic::ASyncSubscriber<CMD::LauncherCMD> launcher_cmd_sub(
        "launcher_cmd");
    LibXR::Topic::ASyncSubscriber<float> distance_sub("target_distance");
    LibXR::Topic::ASyncSubscriber<float> voltage_sub("supply_voltage");
    launcher_cmd_sub.StartWaiting();
    distance_sub.StartWaiting();
    voltage_sub.StartWaiting();

    launcher->last_online_time_ = LibXR::Timebase::GetMilliseconds();

    while (true) {
      auto last_time = LibXR::Timebase::GetMilliseconds();

      launcher->mutex_.Lock();
      if (launcher_cmd_sub.Available()) {
        launcher->launcher_cmd_ = launcher_cmd_sub.GetData();
        launcher_cmd_sub.StartWaiting();
      }
      if (distance_sub.Available()) {
        launcher->distance_ = distance_sub.GetData();
        launcher->core_.SetRange(launcher->distance_);
        distance_sub.StartWaiting();
      }
      if (voltage_sub.Available()) {
        launcher->supply_voltage_ = voltage_sub.GetData();
        voltage_sub.StartWaiting();
      }

      launcher->Update();
      launcher->core_.UpdateFireCommand(launcher->launcher_cmd_.isfire);
      launcher->core_.Execute(launcher->supply_voltage_);
      launcher->UpdateStatus();
      launcher->PublishTopics();
      launcher->mutex_.Unlock();

      LibXR::Thread::SleepUntil(last_time, 2);
    }
  }

  /**
   * @brief 设置发射器模式
   * @param mode 事件ID，对应 LauncherEvent
   */
  void SetMode(uint32_t mode) {
    mutex_.Lock();
    switch (static_cast<LauncherEvent>(mode)) {
      case LauncherEvent::SET_MODE_DISABLE:
        Disable();
        break;
      case LauncherEvent::SET_MODE_ENABLE:
        if (core_.OnEnable() != ErrorCode::OK) {
          XR_LOG_WARN("launcher stays disabled");
        }
        break;
      default:
        break;
    }
    mutex_.Unlock();
  }

  void OnMonitor() override {}

  LibXR::Event &GetEvent() { return launcher_event_; }

#ifdef DEBUG
  int DebugCommand(int argc, char **argv);
#endif

 private:
  struct Status {
    float centre_velocity;
    float outer_velocity;
    float centre_target;
    float outer_target;
    float centre_feedforward;
    float outer_feedforward;
    bool enabled;
    bool in_range;
    bool at_speed;
    bool firing;
    bool fire_pending;
    bool ready;
  };

  flywheel::RMMotorVelocityActuator centre_motor_;
  flywheel::RMMotorVelocityActuator outer_motor_;
  flywheel::GpioPulseActuator piston_;
  flywheel::LauncherCore core_;

  CMD *cmd_;
  CMD::LauncherCMD launcher_cmd_{};

  float dt_ = 0.0f;
  float distance_ = 0.0f;
  float supply_voltage_ = 0.0f;
  Status status_{};

  LibXR::MillisecondTimestamp last_online_time_ = 0;

  LibXR::Thread thread_;
  LibXR::Mutex mutex_;
  LibXR::Event launcher_event_;

  /* 输入话题由本模块创建，测距与电源模块通过 Topic::Find 发布 */
  LibXR::Topic distance_topic_ =
      LibXR::Topic::CreateTopic<float>("target_distance");
  LibXR::Topic voltage_topic_ =
      LibXR::Topic::CreateTopic<float>("supply_voltage");

  LibXR::Topic centre_velocity_topic_ =
      LibXR::Topic::CreateTopic<float>("launcher_centre_velocity");
  LibXR::Topic outer_velocity_topic_ =
      LibXR::Topic::CreateTopic<float>("launcher_outer_velocity");
  LibXR::Topic centre_target_topic_ =
      LibXR::Topic::CreateTopic<float>("launcher_centre_target");
  LibXR::Topic outer_target_topic_ =
      LibXR::Topic::CreateTopic<float>("launcher_outer_target");
  LibXR::Topic ready_topic_ = LibXR::Topic::CreateTopic<bool>("launcher_ready");
  LibXR::Topic in_range_topic_ =
      LibXR::Topic::CreateTopic<bool>("launcher_in_range");
  LibXR::Topic firing_topic_ =
      LibXR::Topic::CreateTopic<bool>("launcher_firing");

  /*-----------------工具函数---------------------------------------------------*/

  /**
   * @brief 更新控制周期与电机反馈
   */
  void Update() {
    auto now = LibXR::Timebase::GetMilliseconds();
    dt_ = (now - last_online_time_).ToSecondf();
    last_online_time_ = now;

    centre_motor_.Update(dt_);
    outer_motor_.Update(dt_);
    piston_.Poll();
  }

  void UpdateStatus() {
    const flywheel::TargetState &target = core_.GetTargets();
    status_.centre_velocity = core_.GetCentreVelocity();
    status_.outer_velocity = core_.GetOuterVelocity();
    status_.centre_target = target.centre_target_rps;
    status_.outer_target = target.outer_target_rps;
    status_.centre_feedforward =
        core_.GetLastCommand(flywheel::Actuator::CENTRE).feedforward;
    status_.outer_feedforward =
        core_.GetLastCommand(flywheel::Actuator::OUTER).feedforward;
    status_.enabled = core_.IsEnabled();
    status_.in_range = core_.IsInRange();
    status_.at_speed = core_.IsAtSpeed();
    status_.firing = core_.IsFiring();
    status_.fire_pending = core_.IsFirePending();
    status_.ready = core_.IsReady();
  }

  void PublishTopics() {
    centre_velocity_topic_.Publish(status_.centre_velocity);
    outer_velocity_topic_.Publish(status_.outer_velocity);
    centre_target_topic_.Publish(status_.centre_target);
    outer_target_topic_.Publish(status_.outer_target);
    ready_topic_.Publish(status_.ready);
    in_range_topic_.Publish(status_.in_range);
    firing_topic_.Publish(status_.firing);
  }

  /* 调用方持有 mutex_ */
  void Disable() {
    core_.OnDisable();
    piston_.Cancel();
    launcher_cmd_.isfire = false;
  }

  /**
   * @brief 失控处理
   * @details 摩擦轮停转并收回气缸，需重新使能。
   */
  void LostCtrl() {
    mutex_.Lock();
    Disable();
    mutex_.Unlock();
  }

#ifdef DEBUG
  LibXR::RamFS::File cmd_file_;
#endif
};

#ifdef DEBUG
#define FLYWHEEL_LAUNCHER_DEBUG_IMPL
#include "FlywheelLauncherDebug.inl"
#undef FLYWHEEL_LAUNCHER_DEBUG_IMPL
#endif
