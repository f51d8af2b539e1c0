#ifndef DRIVETRAIN_CONFIG__ROBOT_SETTINGS_HPP_
#define DRIVETRAIN_CONFIG__ROBOT_SETTINGS_HPP_

#include <string>

namespace drivetrain_config
{

/**
 * @brief settings 파일(JSON)에서 읽은 로봇 파라미터 레코드
 *
 * 기본값은 settings 생성기(GUI)의 기본값과 동일합니다.
 * JSON 키는 각 필드 옆 주석 참고.
 */
struct RobotSettings
{
  bool holonomic_mode{true};          // holonomicMode
  double mass_kg{74.088};             // robotMass (kg)
  double moi{6.883};                  // robotMOI (kg·m^2)
  double wheelbase{0.546};            // robotWheelbase (m)
  double trackwidth{0.546};           // robotTrackwidth (m)
  double wheel_radius{0.048};         // driveWheelRadius (m)
  double gearing{5.143};              // driveGearing (모터:바퀴 감속비)
  double max_drive_speed{5.45};       // maxDriveSpeed (m/s)
  double wheel_cof{1.2};              // wheelCOF
  std::string drive_motor_type{"krakenX60"};  // driveMotorType
  double drive_current_limit{60.0};   // driveCurrentLimit (A)
};

}  // namespace drivetrain_config

#endif  // DRIVETRAIN_CONFIG__ROBOT_SETTINGS_HPP_
