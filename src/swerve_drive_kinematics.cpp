#include "drivetrain_config/swerve_drive_kinematics.hpp"
#include "drivetrain_config/errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace drivetrain_config
{

SwerveDriveKinematics::SwerveDriveKinematics(std::vector<Eigen::Vector2d> module_locations)
: module_locations_(std::move(module_locations))
{
  if (module_locations_.size() < 2) {
    throw ConfigurationError(
      "Swerve kinematics requires at least 2 modules, got " +
      std::to_string(module_locations_.size()));
  }
  for (const auto& location : module_locations_) {
    if (!location.allFinite()) {
      throw ConfigurationError("Swerve module location must be finite");
    }
  }

  inverse_kinematics_ = inverseKinematics(Eigen::Vector2d::Zero());
  forward_kinematics_.compute(inverse_kinematics_);
}

Eigen::MatrixXd SwerveDriveKinematics::inverseKinematics(
  const Eigen::Vector2d& center_of_rotation) const
{
  int n = static_cast<int>(module_locations_.size());
  Eigen::MatrixXd A(2 * n, 3);
  for (int i = 0; i < n; ++i) {
    Eigen::Vector2d r = module_locations_[i] - center_of_rotation;
    A.row(2 * i) << 1.0, 0.0, -r.y();
    A.row(2 * i + 1) << 0.0, 1.0, r.x();
  }
  return A;
}

ModuleStates SwerveDriveKinematics::toModuleStates(
  const ChassisSpeeds& speeds,
  const Eigen::Vector2d& center_of_rotation) const
{
  // 회전 중심이 원점이면 캐시된 행렬 사용
  Eigen::VectorXd module_velocities =
    center_of_rotation.isZero() ?
    Eigen::VectorXd(inverse_kinematics_ * speeds.toVector()) :
    Eigen::VectorXd(inverseKinematics(center_of_rotation) * speeds.toVector());

  ModuleStates states(module_locations_.size());
  for (size_t i = 0; i < states.size(); ++i) {
    double vx = module_velocities(2 * i);
    double vy = module_velocities(2 * i + 1);
    double speed = std::hypot(vx, vy);
    states[i].speed_mps = speed;
    // 정지 모듈은 방향이 정의되지 않으므로 0
    states[i].angle_rad = speed > 1e-9 ? std::atan2(vy, vx) : 0.0;
  }
  return states;
}

ChassisSpeeds SwerveDriveKinematics::toChassisSpeeds(const ModuleStates& states) const
{
  if (states.size() != module_locations_.size()) {
    throw ShapeMismatchError(module_locations_.size(), states.size());
  }

  Eigen::VectorXd module_velocities(2 * states.size());
  for (size_t i = 0; i < states.size(); ++i) {
    module_velocities(2 * i) = states[i].speed_mps * std::cos(states[i].angle_rad);
    module_velocities(2 * i + 1) = states[i].speed_mps * std::sin(states[i].angle_rad);
  }

  // 최소 노름 least-squares: x = A^+ b
  Eigen::Vector3d chassis = forward_kinematics_.solve(module_velocities);
  return ChassisSpeeds::fromVector(chassis);
}

ModuleStates SwerveDriveKinematics::desaturateWheelSpeeds(
  const ModuleStates& states, double max_speed)
{
  double real_max = 0.0;
  for (const auto& state : states) {
    real_max = std::max(real_max, std::abs(state.speed_mps));
  }
  if (real_max <= max_speed) {
    return states;
  }

  double scale = max_speed / real_max;
  ModuleStates desaturated = states;
  for (auto& state : desaturated) {
    state.speed_mps *= scale;
  }
  return desaturated;
}

}  // namespace drivetrain_config
