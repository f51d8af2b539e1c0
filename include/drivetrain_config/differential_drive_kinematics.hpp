#ifndef DRIVETRAIN_CONFIG__DIFFERENTIAL_DRIVE_KINEMATICS_HPP_
#define DRIVETRAIN_CONFIG__DIFFERENTIAL_DRIVE_KINEMATICS_HPP_

#include "drivetrain_config/chassis_speeds.hpp"
#include "drivetrain_config/module_state.hpp"

namespace drivetrain_config
{

/**
 * @brief Differential Drive 기구학
 *
 *   v_left  = vx - omega * trackwidth / 2
 *   v_right = vx + omega * trackwidth / 2
 *
 * 역변환:
 *   vx    = (v_left + v_right) / 2
 *   omega = (v_right - v_left) / trackwidth
 *   vy    = 0 (표현 불가)
 */
class DifferentialDriveKinematics
{
public:
  /**
   * @param trackwidth 좌우 바퀴 간 거리 (m)
   * @throws ConfigurationError trackwidth <= 0
   */
  explicit DifferentialDriveKinematics(double trackwidth);

  double trackwidth() const { return trackwidth_; }

  /** @brief vy는 무시됩니다 */
  DifferentialDriveWheelSpeeds toWheelSpeeds(const ChassisSpeeds& speeds) const;

  ChassisSpeeds toChassisSpeeds(const DifferentialDriveWheelSpeeds& wheel_speeds) const;

  /**
   * @brief 좌우 비율을 유지하며 max_speed 이내로 축소
   * @param max_speed 최대 바퀴 속도 (m/s)
   */
  static DifferentialDriveWheelSpeeds desaturateWheelSpeeds(
    const DifferentialDriveWheelSpeeds& wheel_speeds, double max_speed);

private:
  double trackwidth_;
};

}  // namespace drivetrain_config

#endif  // DRIVETRAIN_CONFIG__DIFFERENTIAL_DRIVE_KINEMATICS_HPP_
