#include "drivetrain_config/module_config.hpp"
#include "drivetrain_config/errors.hpp"
#include "drivetrain_config/utils.hpp"
#include <algorithm>

namespace drivetrain_config
{

namespace
{
// 최고속 토크 손실 계산에 사용하는 배터리 전압 (V)
constexpr double kNominalBatteryVoltage = 12.0;
}  // namespace

ModuleConfig::ModuleConfig(
  double wheel_radius_meters,
  double max_drive_velocity_mps,
  double wheel_cof,
  std::shared_ptr<const DriveMotorModel> drive_motor,
  double drive_current_limit_amps)
: wheel_radius_meters_(wheel_radius_meters),
  max_drive_velocity_mps_(max_drive_velocity_mps),
  wheel_cof_(wheel_cof),
  drive_motor_(std::move(drive_motor)),
  drive_current_limit_amps_(drive_current_limit_amps)
{
  requirePositive(wheel_radius_meters_, "wheel_radius");
  requirePositive(max_drive_velocity_mps_, "max_drive_velocity");
  requireNonNegative(wheel_cof_, "wheel_cof");
  requirePositive(drive_current_limit_amps_, "drive_current_limit");
  if (!drive_motor_) {
    throw ConfigurationError("ModuleConfig requires a drive motor model");
  }

  max_drive_velocity_rad_per_sec_ = max_drive_velocity_mps_ / wheel_radius_meters_;
  double max_speed_current_draw =
    drive_motor_->current(max_drive_velocity_rad_per_sec_, kNominalBatteryVoltage);
  torque_loss_ = std::max(
    drive_motor_->torque(std::min(max_speed_current_draw, drive_current_limit_amps_)), 0.0);
}

}  // namespace drivetrain_config
