#ifndef DRIVETRAIN_CONFIG__CHASSIS_SPEEDS_HPP_
#define DRIVETRAIN_CONFIG__CHASSIS_SPEEDS_HPP_

#include <Eigen/Dense>
#include <geometry_msgs/msg/twist.hpp>

namespace drivetrain_config
{

/**
 * @brief 로봇 좌표계 기준 차체 속도 (+x 전방, +y 좌측)
 *
 *   vx    : 전진 속도 (m/s)
 *   vy    : 횡방향 속도 (m/s), Differential에서는 항상 0
 *   omega : 각속도 (rad/s), CCW 양수
 */
struct ChassisSpeeds
{
  double vx{0.0};
  double vy{0.0};
  double omega{0.0};

  Eigen::Vector3d toVector() const { return Eigen::Vector3d(vx, vy, omega); }

  static ChassisSpeeds fromVector(const Eigen::Vector3d& v)
  {
    return ChassisSpeeds{v(0), v(1), v(2)};
  }

  /**
   * @brief Field 좌표계 속도 → Robot 좌표계 속도
   * @param field_speeds field 기준 (vx, vy, omega)
   * @param robot_heading 로봇 heading (rad)
   */
  static ChassisSpeeds fromFieldRelativeSpeeds(
    const ChassisSpeeds& field_speeds, double robot_heading);
};

/** @brief ChassisSpeeds → Twist (linear.x, linear.y, angular.z) */
geometry_msgs::msg::Twist toTwist(const ChassisSpeeds& speeds);

/** @brief Twist → ChassisSpeeds (나머지 성분은 무시) */
ChassisSpeeds fromTwist(const geometry_msgs::msg::Twist& twist);

}  // namespace drivetrain_config

#endif  // DRIVETRAIN_CONFIG__CHASSIS_SPEEDS_HPP_
