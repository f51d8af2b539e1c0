#include "drivetrain_config/chassis_speeds.hpp"
#include <cmath>

namespace drivetrain_config
{

ChassisSpeeds ChassisSpeeds::fromFieldRelativeSpeeds(
  const ChassisSpeeds& field_speeds, double robot_heading)
{
  // World → Body frame: heading의 역회전
  double cos_h = std::cos(robot_heading);
  double sin_h = std::sin(robot_heading);
  return ChassisSpeeds{
    field_speeds.vx * cos_h + field_speeds.vy * sin_h,
    -field_speeds.vx * sin_h + field_speeds.vy * cos_h,
    field_speeds.omega};
}

geometry_msgs::msg::Twist toTwist(const ChassisSpeeds& speeds)
{
  geometry_msgs::msg::Twist twist;
  twist.linear.x = speeds.vx;
  twist.linear.y = speeds.vy;
  twist.angular.z = speeds.omega;
  return twist;
}

ChassisSpeeds fromTwist(const geometry_msgs::msg::Twist& twist)
{
  return ChassisSpeeds{twist.linear.x, twist.linear.y, twist.angular.z};
}

}  // namespace drivetrain_config
