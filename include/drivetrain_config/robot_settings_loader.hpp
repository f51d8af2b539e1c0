#ifndef DRIVETRAIN_CONFIG__ROBOT_SETTINGS_LOADER_HPP_
#define DRIVETRAIN_CONFIG__ROBOT_SETTINGS_LOADER_HPP_

#include <yaml-cpp/yaml.h>
#include <rclcpp/rclcpp.hpp>
#include <string>

#include "drivetrain_config/robot_config.hpp"
#include "drivetrain_config/robot_settings.hpp"

namespace drivetrain_config
{

/// deploy 디렉토리 기준 settings 파일 상대 경로
constexpr const char* kDefaultSettingsRelativePath = "pathplanner/settings.json";

/**
 * @brief 파싱된 settings 노드 → RobotSettings
 *
 * JSON은 YAML의 부분집합이므로 yaml-cpp로 그대로 파싱합니다.
 *
 * @throws ConfigurationError 키 누락 또는 타입 불일치 (키 이름 포함)
 */
RobotSettings parseRobotSettings(const YAML::Node& root);

/**
 * @brief settings 파일 읽기
 * @param path settings.json 경로
 * @throws ConfigurationError 파일을 읽을 수 없거나 파싱 실패
 */
RobotSettings loadRobotSettings(const std::string& path);

/**
 * @brief RobotSettings → RobotConfig
 *
 * 모터 식별자를 카탈로그에서 찾아 감속비를 적용한 뒤 ModuleConfig를 만들고,
 * holonomic_mode에 따라 Holonomic/Differential 생성자를 호출합니다.
 *
 * @throws UnsupportedMotorError 지원하지 않는 drive_motor_type
 * @throws ConfigurationError 물리 파라미터 위반
 */
RobotConfig buildRobotConfig(const RobotSettings& settings);

/**
 * @brief settings 파일 → RobotConfig (loadRobotSettings + buildRobotConfig)
 */
RobotConfig loadRobotConfig(const std::string& path);

/**
 * @brief deploy 디렉토리 아래 기본 경로(pathplanner/settings.json)에서 로드
 */
RobotConfig loadRobotConfigFromDeployDirectory(const std::string& deploy_directory);

/**
 * @brief ROS2 파라미터 선언 (prefix + "robotMass" 등, 기본값은 RobotSettings 기본값)
 */
void declareRobotSettings(
  rclcpp::Node& node, const std::string& prefix,
  const RobotSettings& defaults = RobotSettings());

/**
 * @brief 선언된 ROS2 파라미터 → RobotSettings
 */
RobotSettings loadRobotSettings(rclcpp::Node& node, const std::string& prefix);

}  // namespace drivetrain_config

#endif  // DRIVETRAIN_CONFIG__ROBOT_SETTINGS_LOADER_HPP_
