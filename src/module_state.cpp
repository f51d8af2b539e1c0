#include "drivetrain_config/module_state.hpp"
#include "drivetrain_config/utils.hpp"
#include <algorithm>
#include <cmath>

namespace drivetrain_config
{

SwerveModuleState SwerveModuleState::optimize(double current_angle) const
{
  double delta = normalizeAngle(angle_rad - current_angle);
  if (std::abs(delta) > M_PI / 2.0) {
    // 반대 방향으로 돌리고 바퀴를 역회전
    return SwerveModuleState{-speed_mps, normalizeAngle(angle_rad + M_PI)};
  }
  return *this;
}

DifferentialDriveWheelSpeeds DifferentialDriveWheelSpeeds::desaturate(double max_speed) const
{
  double real_max = std::max(std::abs(left_mps), std::abs(right_mps));
  if (real_max <= max_speed) {
    return *this;
  }
  double scale = max_speed / real_max;
  return DifferentialDriveWheelSpeeds{left_mps * scale, right_mps * scale};
}

}  // namespace drivetrain_config
