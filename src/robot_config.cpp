#include "drivetrain_config/robot_config.hpp"
#include "drivetrain_config/errors.hpp"
#include "drivetrain_config/utils.hpp"
#include <rclcpp/rclcpp.hpp>

namespace drivetrain_config
{

namespace
{

std::vector<Eigen::Vector2d> rectangleModuleLocations(double trackwidth, double wheelbase)
{
  requirePositive(trackwidth, "trackwidth");
  requirePositive(wheelbase, "wheelbase");
  // FL, FR, BL, BR
  return {
    Eigen::Vector2d(wheelbase / 2.0, trackwidth / 2.0),
    Eigen::Vector2d(wheelbase / 2.0, -trackwidth / 2.0),
    Eigen::Vector2d(-wheelbase / 2.0, trackwidth / 2.0),
    Eigen::Vector2d(-wheelbase / 2.0, -trackwidth / 2.0),
  };
}

std::vector<Eigen::Vector2d> differentialModuleLocations(double trackwidth)
{
  requirePositive(trackwidth, "trackwidth");
  // left, right
  return {
    Eigen::Vector2d(0.0, trackwidth / 2.0),
    Eigen::Vector2d(0.0, -trackwidth / 2.0),
  };
}

}  // namespace

RobotConfig::RobotConfig(
  double mass_kg, double moi, const ModuleConfig& module_config,
  double trackwidth_meters, double wheelbase_meters)
: RobotConfig(
    mass_kg, moi, module_config,
    rectangleModuleLocations(trackwidth_meters, wheelbase_meters))
{
}

RobotConfig::RobotConfig(
  double mass_kg, double moi, const ModuleConfig& module_config,
  double trackwidth_meters)
: RobotConfig(
    mass_kg, moi, module_config,
    differentialModuleLocations(trackwidth_meters),
    DifferentialDrive{DifferentialDriveKinematics(trackwidth_meters)})
{
}

RobotConfig::RobotConfig(
  double mass_kg, double moi, const ModuleConfig& module_config,
  const std::vector<Eigen::Vector2d>& module_locations)
: RobotConfig(
    mass_kg, moi, module_config, module_locations,
    HolonomicDrive{SwerveDriveKinematics(module_locations)})
{
}

RobotConfig::RobotConfig(
  double mass_kg, double moi, const ModuleConfig& module_config,
  std::vector<Eigen::Vector2d> module_locations, DriveTopology topology)
: mass_kg_(mass_kg),
  moi_(moi),
  module_config_(module_config),
  module_locations_(std::move(module_locations)),
  topology_(std::move(topology))
{
  requirePositive(mass_kg_, "mass");
  requirePositive(moi_, "MOI");
  // ModuleConfig는 0을 허용하지만 마찰 한계가 0인 로봇은 생성 불가
  requirePositive(module_config_.wheelCOF(), "wheel_cof");

  module_pivot_distance_.reserve(module_locations_.size());
  for (const auto& location : module_locations_) {
    module_pivot_distance_.push_back(location.norm());
  }

  // 모든 모듈에 무게가 균등 분배된다고 가정
  wheel_friction_force_ =
    module_config_.wheelCOF() * ((mass_kg_ / static_cast<double>(numModules())) * kGravity);
  max_torque_friction_ = wheel_friction_force_ * module_config_.wheelRadiusMeters();

  RCLCPP_DEBUG(
    rclcpp::get_logger("drivetrain_config"),
    "RobotConfig: %s, %zu modules, mass=%.2f kg, MOI=%.3f, friction force=%.2f N, "
    "max friction torque=%.3f Nm",
    isHolonomic() ? "holonomic" : "differential", numModules(), mass_kg_, moi_,
    wheel_friction_force_, max_torque_friction_);
}

ModuleStates RobotConfig::toWheelStates(const ChassisSpeeds& speeds) const
{
  if (const auto* holonomic = std::get_if<HolonomicDrive>(&topology_)) {
    return holonomic->kinematics.toModuleStates(speeds);
  }

  const auto& differential = std::get<DifferentialDrive>(topology_);
  DifferentialDriveWheelSpeeds wheel_speeds = differential.kinematics.toWheelSpeeds(speeds);
  return {
    SwerveModuleState{wheel_speeds.left_mps, 0.0},
    SwerveModuleState{wheel_speeds.right_mps, 0.0},
  };
}

ModuleStates RobotConfig::toWheelStates(const geometry_msgs::msg::Twist& twist) const
{
  return toWheelStates(fromTwist(twist));
}

ChassisSpeeds RobotConfig::toChassisSpeeds(const ModuleStates& states) const
{
  checkShape(states);

  if (const auto* holonomic = std::get_if<HolonomicDrive>(&topology_)) {
    return holonomic->kinematics.toChassisSpeeds(states);
  }

  const auto& differential = std::get<DifferentialDrive>(topology_);
  return differential.kinematics.toChassisSpeeds(
    DifferentialDriveWheelSpeeds{states[0].speed_mps, states[1].speed_mps});
}

geometry_msgs::msg::Twist RobotConfig::toTwist(const ModuleStates& states) const
{
  return drivetrain_config::toTwist(toChassisSpeeds(states));
}

ModuleStates RobotConfig::desaturateWheelSpeeds(const ModuleStates& states) const
{
  checkShape(states);
  return SwerveDriveKinematics::desaturateWheelSpeeds(
    states, module_config_.maxDriveVelocityMps());
}

void RobotConfig::checkShape(const ModuleStates& states) const
{
  if (states.size() != numModules()) {
    throw ShapeMismatchError(numModules(), states.size());
  }
}

}  // namespace drivetrain_config
