#ifndef DRIVETRAIN_CONFIG__MOTOR_CATALOG_HPP_
#define DRIVETRAIN_CONFIG__MOTOR_CATALOG_HPP_

#include <string>
#include <vector>

#include "drivetrain_config/dc_motor.hpp"

namespace drivetrain_config
{

/**
 * @brief settings 파일에서 지원하는 구동 모터 종류
 *
 * 지원 식별자:
 *   "krakenX60", "krakenX60FOC", "falcon500", "falcon500FOC",
 *   "vortex", "NEO", "CIM", "miniCIM"
 */
enum class MotorType
{
  kKrakenX60,
  kKrakenX60FOC,
  kFalcon500,
  kFalcon500FOC,
  kVortex,
  kNEO,
  kCIM,
  kMiniCIM
};

/**
 * @brief 식별자 문자열 → MotorType
 * @throws UnsupportedMotorError 지원하지 않는 식별자
 */
MotorType motorTypeFromString(const std::string& id);

/** @brief MotorType → settings 식별자 문자열 */
std::string toString(MotorType type);

/** @brief 지원 식별자 목록 */
const std::vector<std::string>& supportedMotorIds();

/**
 * @brief 감속 전 DC 모터 모델 생성
 * @param type 모터 종류
 * @param num_motors gearbox 내 모터 수
 */
DCMotor makeDCMotor(MotorType type, int num_motors = 1);

}  // namespace drivetrain_config

#endif  // DRIVETRAIN_CONFIG__MOTOR_CATALOG_HPP_
