#ifndef DRIVETRAIN_CONFIG__MODULE_CONFIG_HPP_
#define DRIVETRAIN_CONFIG__MODULE_CONFIG_HPP_

#include <memory>

#include "drivetrain_config/drive_motor_model.hpp"

namespace drivetrain_config
{

/**
 * @brief 구동 모듈(바퀴 1개) 물리 파라미터
 *
 * 모든 모듈이 동일하다고 가정합니다. 생성 후 불변.
 */
class ModuleConfig
{
public:
  /**
   * @param wheel_radius_meters 바퀴 반지름 (> 0)
   * @param max_drive_velocity_mps 최대 바퀴 선속도 (> 0)
   * @param wheel_cof 바퀴-바닥 마찰 계수 (>= 0)
   * @param drive_motor 감속비가 적용된 구동 모터 모델 (non-null)
   * @param drive_current_limit_amps 모터 전류 제한 (> 0)
   * @throws ConfigurationError 위 조건 위반
   */
  ModuleConfig(
    double wheel_radius_meters,
    double max_drive_velocity_mps,
    double wheel_cof,
    std::shared_ptr<const DriveMotorModel> drive_motor,
    double drive_current_limit_amps);

  double wheelRadiusMeters() const { return wheel_radius_meters_; }
  double maxDriveVelocityMps() const { return max_drive_velocity_mps_; }
  double wheelCOF() const { return wheel_cof_; }
  const DriveMotorModel& driveMotor() const { return *drive_motor_; }
  double driveCurrentLimitAmps() const { return drive_current_limit_amps_; }

  /** @brief max_drive_velocity_mps / wheel_radius (rad/s) */
  double maxDriveVelocityRadPerSec() const { return max_drive_velocity_rad_per_sec_; }

  /** @brief 최고속에서 소모되는 토크 (전류 제한 반영, >= 0) */
  double torqueLoss() const { return torque_loss_; }

private:
  double wheel_radius_meters_;
  double max_drive_velocity_mps_;
  double wheel_cof_;
  std::shared_ptr<const DriveMotorModel> drive_motor_;
  double drive_current_limit_amps_;

  double max_drive_velocity_rad_per_sec_;
  double torque_loss_;
};

}  // namespace drivetrain_config

#endif  // DRIVETRAIN_CONFIG__MODULE_CONFIG_HPP_
