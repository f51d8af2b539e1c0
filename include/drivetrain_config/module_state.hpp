#ifndef DRIVETRAIN_CONFIG__MODULE_STATE_HPP_
#define DRIVETRAIN_CONFIG__MODULE_STATE_HPP_

#include <vector>

namespace drivetrain_config
{

/**
 * @brief 단일 모듈 상태: 바퀴 선속도 + 조향각
 *
 * Differential 모듈은 조향이 없으므로 angle_rad는 항상 0.
 */
struct SwerveModuleState
{
  double speed_mps{0.0};
  double angle_rad{0.0};

  /**
   * @brief 조향 변화량이 90도 이하가 되도록 최적화
   * @param current_angle 현재 모듈 조향각 (rad)
   * @return 동일한 바퀴 속도 벡터를 만드는 상태 (필요 시 속도 부호 반전 + π 회전)
   */
  SwerveModuleState optimize(double current_angle) const;
};

/** @brief Differential 좌/우 바퀴 선속도 (m/s) */
struct DifferentialDriveWheelSpeeds
{
  double left_mps{0.0};
  double right_mps{0.0};

  /**
   * @brief 좌우 비율을 유지한 채 최대값이 max_speed를 넘지 않도록 스케일
   */
  DifferentialDriveWheelSpeeds desaturate(double max_speed) const;
};

using ModuleStates = std::vector<SwerveModuleState>;

}  // namespace drivetrain_config

#endif  // DRIVETRAIN_CONFIG__MODULE_STATE_HPP_
