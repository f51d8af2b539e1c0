#include "drivetrain_config/robot_settings_loader.hpp"
#include "drivetrain_config/errors.hpp"
#include "drivetrain_config/motor_catalog.hpp"
#include <memory>
#include <type_traits>

namespace drivetrain_config
{

namespace
{

rclcpp::Logger logger()
{
  return rclcpp::get_logger("drivetrain_config");
}

template<typename T>
T readKey(const YAML::Node& root, const std::string& key)
{
  const YAML::Node node = root[key];
  if (!node) {
    throw ConfigurationError("Robot settings missing key '" + key + "'");
  }
  if (!node.IsScalar()) {
    throw ConfigurationError("Robot settings key '" + key + "' must be a scalar value");
  }

  // yaml-cpp 태그: 따옴표 scalar = "!", plain scalar = "?"
  bool quoted = node.Tag() == "!";
  if constexpr (std::is_same<T, std::string>::value) {
    if (!quoted) {
      throw ConfigurationError("Robot settings key '" + key + "' must be a JSON string");
    }
  } else {
    if (quoted) {
      throw ConfigurationError(
        "Robot settings key '" + key + "' must not be a JSON string, got \"" +
        node.Scalar() + "\"");
    }
  }
  if constexpr (std::is_same<T, bool>::value) {
    // YAML의 yes/no/on/off는 JSON boolean이 아님
    if (node.Scalar() != "true" && node.Scalar() != "false") {
      throw ConfigurationError(
        "Robot settings key '" + key + "' must be true or false, got " + node.Scalar());
    }
  }

  try {
    return node.as<T>();
  } catch (const YAML::Exception& e) {
    throw ConfigurationError(
      "Robot settings key '" + key + "' has the wrong type: " + e.what());
  }
}

}  // namespace

RobotSettings parseRobotSettings(const YAML::Node& root)
{
  if (!root.IsMap()) {
    throw ConfigurationError("Robot settings must be a JSON object");
  }

  RobotSettings settings;
  settings.holonomic_mode = readKey<bool>(root, "holonomicMode");
  settings.mass_kg = readKey<double>(root, "robotMass");
  settings.moi = readKey<double>(root, "robotMOI");
  settings.wheelbase = readKey<double>(root, "robotWheelbase");
  settings.trackwidth = readKey<double>(root, "robotTrackwidth");
  settings.wheel_radius = readKey<double>(root, "driveWheelRadius");
  settings.gearing = readKey<double>(root, "driveGearing");
  settings.max_drive_speed = readKey<double>(root, "maxDriveSpeed");
  settings.wheel_cof = readKey<double>(root, "wheelCOF");
  settings.drive_motor_type = readKey<std::string>(root, "driveMotorType");
  settings.drive_current_limit = readKey<double>(root, "driveCurrentLimit");
  return settings;
}

RobotSettings loadRobotSettings(const std::string& path)
{
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    RCLCPP_ERROR(logger(), "Robot settings load error (%s): %s", path.c_str(), e.what());
    throw ConfigurationError("Failed to read robot settings '" + path + "': " + e.what());
  }

  RobotSettings settings = parseRobotSettings(root);
  RCLCPP_INFO(
    logger(), "Loaded robot settings: %s (%s, motor=%s)", path.c_str(),
    settings.holonomic_mode ? "holonomic" : "differential",
    settings.drive_motor_type.c_str());
  return settings;
}

RobotConfig buildRobotConfig(const RobotSettings& settings)
{
  // Holonomic: 모듈당 모터 1개, Differential: 한쪽당 모터 2개
  int num_motors = settings.holonomic_mode ? 1 : 2;
  MotorType motor_type = motorTypeFromString(settings.drive_motor_type);
  auto gearbox = std::make_shared<DCMotor>(
    makeDCMotor(motor_type, num_motors).withReduction(settings.gearing));

  ModuleConfig module_config(
    settings.wheel_radius, settings.max_drive_speed, settings.wheel_cof,
    gearbox, settings.drive_current_limit);

  if (settings.holonomic_mode) {
    return RobotConfig(
      settings.mass_kg, settings.moi, module_config, settings.trackwidth, settings.wheelbase);
  }
  return RobotConfig(settings.mass_kg, settings.moi, module_config, settings.trackwidth);
}

RobotConfig loadRobotConfig(const std::string& path)
{
  return buildRobotConfig(loadRobotSettings(path));
}

RobotConfig loadRobotConfigFromDeployDirectory(const std::string& deploy_directory)
{
  std::string path = deploy_directory;
  if (!path.empty() && path.back() != '/') {
    path += '/';
  }
  return loadRobotConfig(path + kDefaultSettingsRelativePath);
}

void declareRobotSettings(
  rclcpp::Node& node, const std::string& prefix, const RobotSettings& defaults)
{
  try {
    node.declare_parameter(prefix + "holonomicMode", defaults.holonomic_mode);
    node.declare_parameter(prefix + "robotMass", defaults.mass_kg);
    node.declare_parameter(prefix + "robotMOI", defaults.moi);
    node.declare_parameter(prefix + "robotWheelbase", defaults.wheelbase);
    node.declare_parameter(prefix + "robotTrackwidth", defaults.trackwidth);
    node.declare_parameter(prefix + "driveWheelRadius", defaults.wheel_radius);
    node.declare_parameter(prefix + "driveGearing", defaults.gearing);
    node.declare_parameter(prefix + "maxDriveSpeed", defaults.max_drive_speed);
    node.declare_parameter(prefix + "wheelCOF", defaults.wheel_cof);
    node.declare_parameter(prefix + "driveMotorType", defaults.drive_motor_type);
    node.declare_parameter(prefix + "driveCurrentLimit", defaults.drive_current_limit);
  } catch (const rclcpp::exceptions::InvalidParameterTypeException& e) {
    // 예: YAML 파라미터 파일의 robotMass: 50 (정수) → double 파라미터와 불일치
    RCLCPP_ERROR(node.get_logger(), "Robot settings parameter type error: %s", e.what());
    throw ConfigurationError(
      std::string("Robot settings parameter has the wrong type (use 50.0, not 50): ") +
      e.what());
  }

  RCLCPP_DEBUG(node.get_logger(), "Robot settings parameters declared (prefix='%s')",
    prefix.c_str());
}

RobotSettings loadRobotSettings(rclcpp::Node& node, const std::string& prefix)
{
  RobotSettings settings;
  try {
    settings.holonomic_mode = node.get_parameter(prefix + "holonomicMode").as_bool();
    settings.mass_kg = node.get_parameter(prefix + "robotMass").as_double();
    settings.moi = node.get_parameter(prefix + "robotMOI").as_double();
    settings.wheelbase = node.get_parameter(prefix + "robotWheelbase").as_double();
    settings.trackwidth = node.get_parameter(prefix + "robotTrackwidth").as_double();
    settings.wheel_radius = node.get_parameter(prefix + "driveWheelRadius").as_double();
    settings.gearing = node.get_parameter(prefix + "driveGearing").as_double();
    settings.max_drive_speed = node.get_parameter(prefix + "maxDriveSpeed").as_double();
    settings.wheel_cof = node.get_parameter(prefix + "wheelCOF").as_double();
    settings.drive_motor_type = node.get_parameter(prefix + "driveMotorType").as_string();
    settings.drive_current_limit = node.get_parameter(prefix + "driveCurrentLimit").as_double();
  } catch (const rclcpp::exceptions::ParameterNotDeclaredException& e) {
    throw ConfigurationError(
      std::string("Robot settings parameter not declared: ") + e.what());
  } catch (const rclcpp::ParameterTypeException& e) {
    throw ConfigurationError(
      std::string("Robot settings parameter has the wrong type: ") + e.what());
  }

  RCLCPP_INFO(
    node.get_logger(), "Robot settings loaded from parameters (%s, motor=%s)",
    settings.holonomic_mode ? "holonomic" : "differential",
    settings.drive_motor_type.c_str());
  return settings;
}

}  // namespace drivetrain_config
