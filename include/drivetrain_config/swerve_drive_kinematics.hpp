#ifndef DRIVETRAIN_CONFIG__SWERVE_DRIVE_KINEMATICS_HPP_
#define DRIVETRAIN_CONFIG__SWERVE_DRIVE_KINEMATICS_HPP_

#include <Eigen/Dense>
#include <vector>

#include "drivetrain_config/chassis_speeds.hpp"
#include "drivetrain_config/module_state.hpp"

namespace drivetrain_config
{

/**
 * @brief Holonomic (Swerve) 기구학
 *
 * 모듈 i의 위치 (x_i, y_i)에 대해 inverse kinematics 행렬 A (2N x 3):
 *
 *   [ v_xi ]   [ 1  0  -y_i ] [ vx    ]
 *   [ v_yi ] = [ 0  1   x_i ] [ vy    ]
 *                             [ omega ]
 *
 * forward kinematics는 A의 CompleteOrthogonalDecomposition으로
 * 최소 노름 least-squares 해를 구합니다 (N > 2면 over-determined).
 */
class SwerveDriveKinematics
{
public:
  /**
   * @param module_locations 로봇 좌표계 모듈 위치 (N >= 2)
   * @throws ConfigurationError N < 2 또는 non-finite 좌표
   */
  explicit SwerveDriveKinematics(std::vector<Eigen::Vector2d> module_locations);

  size_t numModules() const { return module_locations_.size(); }

  const std::vector<Eigen::Vector2d>& moduleLocations() const { return module_locations_; }

  /**
   * @brief ChassisSpeeds → 모듈 상태 (module_locations 순서)
   * @param speeds 로봇 좌표계 차체 속도
   * @param center_of_rotation 회전 중심 (기본값: 로봇 중심)
   *
   * 속도가 0인 모듈의 조향각은 0을 반환합니다.
   */
  ModuleStates toModuleStates(
    const ChassisSpeeds& speeds,
    const Eigen::Vector2d& center_of_rotation = Eigen::Vector2d::Zero()) const;

  /**
   * @brief 모듈 상태 → ChassisSpeeds (least-squares)
   * @throws ShapeMismatchError states.size() != numModules()
   */
  ChassisSpeeds toChassisSpeeds(const ModuleStates& states) const;

  /**
   * @brief 가장 빠른 모듈이 max_speed가 되도록 모든 모듈 속도를 동일 비율로 축소
   */
  static ModuleStates desaturateWheelSpeeds(const ModuleStates& states, double max_speed);

private:
  Eigen::MatrixXd inverseKinematics(const Eigen::Vector2d& center_of_rotation) const;

  std::vector<Eigen::Vector2d> module_locations_;
  Eigen::MatrixXd inverse_kinematics_;  // (2N x 3), 회전 중심 = 원점
  Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXd> forward_kinematics_;
};

}  // namespace drivetrain_config

#endif  // DRIVETRAIN_CONFIG__SWERVE_DRIVE_KINEMATICS_HPP_
