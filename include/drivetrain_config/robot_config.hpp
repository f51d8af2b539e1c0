#ifndef DRIVETRAIN_CONFIG__ROBOT_CONFIG_HPP_
#define DRIVETRAIN_CONFIG__ROBOT_CONFIG_HPP_

#include <Eigen/Dense>
#include <geometry_msgs/msg/twist.hpp>
#include <variant>
#include <vector>

#include "drivetrain_config/chassis_speeds.hpp"
#include "drivetrain_config/differential_drive_kinematics.hpp"
#include "drivetrain_config/module_config.hpp"
#include "drivetrain_config/module_state.hpp"
#include "drivetrain_config/swerve_drive_kinematics.hpp"

namespace drivetrain_config
{

/** @brief Holonomic 토폴로지: N개 모듈 swerve 기구학 */
struct HolonomicDrive
{
  SwerveDriveKinematics kinematics;
};

/** @brief Differential 토폴로지: trackwidth 기반 2바퀴 기구학 */
struct DifferentialDrive
{
  DifferentialDriveKinematics kinematics;
};

/**
 * @brief 구동 토폴로지 (closed variant)
 *
 * 두 기구학 중 정확히 하나만 존재하므로 잘못된 기구학에 접근하는
 * 경로가 타입 수준에서 막힙니다.
 */
using DriveTopology = std::variant<HolonomicDrive, DifferentialDrive>;

/**
 * @brief 로봇 물리/기구학 구성 (불변 값 객체)
 *
 * 생성 시 모든 파생 상수를 한 번 계산하며 이후 변경되지 않습니다.
 * 변경 가능한 내부 상태가 없으므로 여러 스레드에서 lock 없이 공유할 수 있습니다.
 *
 * 모듈 순서 (Holonomic, +x 전방 / +y 좌측):
 *   0: front-left  ( wheelbase/2,  trackwidth/2)
 *   1: front-right ( wheelbase/2, -trackwidth/2)
 *   2: back-left   (-wheelbase/2,  trackwidth/2)
 *   3: back-right  (-wheelbase/2, -trackwidth/2)
 *
 * 모듈 순서 (Differential):
 *   0: left  (0,  trackwidth/2)
 *   1: right (0, -trackwidth/2)
 */
class RobotConfig
{
public:
  /// 중력 가속도 (m/s^2)
  static constexpr double kGravity = 9.8;

  /**
   * @brief HOLONOMIC 로봇 (사각 배치 4모듈)
   * @param mass_kg 배터리/범퍼 포함 질량 (kg)
   * @param moi 관성 모멘트 (kg·m^2)
   * @param module_config 구동 모듈 구성
   * @param trackwidth_meters 좌우 모듈 간 거리 (m)
   * @param wheelbase_meters 전후 모듈 간 거리 (m)
   * @throws ConfigurationError 비양수/non-finite 입력
   */
  RobotConfig(
    double mass_kg, double moi, const ModuleConfig& module_config,
    double trackwidth_meters, double wheelbase_meters);

  /**
   * @brief DIFFERENTIAL 로봇
   * @throws ConfigurationError 비양수/non-finite 입력
   */
  RobotConfig(
    double mass_kg, double moi, const ModuleConfig& module_config,
    double trackwidth_meters);

  /**
   * @brief HOLONOMIC 로봇 (임의 배치 N >= 2 모듈)
   * @throws ConfigurationError 비양수 입력 또는 모듈 수 < 2
   */
  RobotConfig(
    double mass_kg, double moi, const ModuleConfig& module_config,
    const std::vector<Eigen::Vector2d>& module_locations);

  double massKg() const { return mass_kg_; }
  double moi() const { return moi_; }
  const ModuleConfig& moduleConfig() const { return module_config_; }
  const std::vector<Eigen::Vector2d>& moduleLocations() const { return module_locations_; }
  const DriveTopology& topology() const { return topology_; }
  bool isHolonomic() const { return std::holds_alternative<HolonomicDrive>(topology_); }

  size_t numModules() const { return module_locations_.size(); }

  /** @brief 로봇 중심 ~ 각 모듈 거리 (moduleLocations 순서) */
  const std::vector<double>& modulePivotDistance() const { return module_pivot_distance_; }

  /** @brief 모듈당 정지 마찰력 (N) = wheelCOF × (mass / numModules) × g */
  double wheelFrictionForce() const { return wheel_friction_force_; }

  /** @brief 미끄러짐 없이 낼 수 있는 최대 바퀴 토크 (N·m) */
  double maxTorqueFriction() const { return max_torque_friction_; }

  /**
   * @brief ChassisSpeeds → 모듈 상태 (moduleLocations 순서)
   *
   * Differential: 각 바퀴 조향각은 0, vy는 무시됩니다.
   */
  ModuleStates toWheelStates(const ChassisSpeeds& speeds) const;

  /** @brief Twist 입력 버전 */
  ModuleStates toWheelStates(const geometry_msgs::msg::Twist& twist) const;

  /**
   * @brief 모듈 상태 → ChassisSpeeds
   * @throws ShapeMismatchError states.size() != numModules()
   */
  ChassisSpeeds toChassisSpeeds(const ModuleStates& states) const;

  /** @brief Twist 출력 버전 */
  geometry_msgs::msg::Twist toTwist(const ModuleStates& states) const;

  /**
   * @brief moduleConfig의 최대 선속도를 넘지 않도록 모듈 속도를 동일 비율로 축소
   * @throws ShapeMismatchError states.size() != numModules()
   */
  ModuleStates desaturateWheelSpeeds(const ModuleStates& states) const;

private:
  RobotConfig(
    double mass_kg, double moi, const ModuleConfig& module_config,
    std::vector<Eigen::Vector2d> module_locations, DriveTopology topology);

  void checkShape(const ModuleStates& states) const;

  double mass_kg_;
  double moi_;
  ModuleConfig module_config_;
  std::vector<Eigen::Vector2d> module_locations_;
  DriveTopology topology_;

  // 생성 시 계산되는 파생 상수
  std::vector<double> module_pivot_distance_;
  double wheel_friction_force_;
  double max_torque_friction_;
};

}  // namespace drivetrain_config

#endif  // DRIVETRAIN_CONFIG__ROBOT_CONFIG_HPP_
