#include "drivetrain_config/differential_drive_kinematics.hpp"
#include "drivetrain_config/utils.hpp"

namespace drivetrain_config
{

DifferentialDriveKinematics::DifferentialDriveKinematics(double trackwidth)
: trackwidth_(trackwidth)
{
  requirePositive(trackwidth_, "trackwidth");
}

DifferentialDriveWheelSpeeds DifferentialDriveKinematics::toWheelSpeeds(
  const ChassisSpeeds& speeds) const
{
  double half_track_omega = speeds.omega * trackwidth_ / 2.0;
  return DifferentialDriveWheelSpeeds{
    speeds.vx - half_track_omega,
    speeds.vx + half_track_omega};
}

ChassisSpeeds DifferentialDriveKinematics::toChassisSpeeds(
  const DifferentialDriveWheelSpeeds& wheel_speeds) const
{
  return ChassisSpeeds{
    (wheel_speeds.left_mps + wheel_speeds.right_mps) / 2.0,
    0.0,
    (wheel_speeds.right_mps - wheel_speeds.left_mps) / trackwidth_};
}

DifferentialDriveWheelSpeeds DifferentialDriveKinematics::desaturateWheelSpeeds(
  const DifferentialDriveWheelSpeeds& wheel_speeds, double max_speed)
{
  return wheel_speeds.desaturate(max_speed);
}

}  // namespace drivetrain_config
