#ifndef DRIVETRAIN_CONFIG__UTILS_HPP_
#define DRIVETRAIN_CONFIG__UTILS_HPP_

#include <cmath>
#include <string>

namespace drivetrain_config
{

/**
 * @brief 각도를 [-π, π] 범위로 정규화
 * @param angle 입력 각도 (라디안)
 * @return 정규화된 각도
 */
inline double normalizeAngle(double angle)
{
  // atan2를 사용하여 [-π, π] 범위로 정규화
  return std::atan2(std::sin(angle), std::cos(angle));
}

/** @brief RPM → rad/s */
inline double rpmToRadPerSec(double rpm)
{
  return rpm * 2.0 * M_PI / 60.0;
}

/**
 * @brief value가 유한한 양수인지 검사
 * @param value 검사할 값
 * @param name 에러 메시지에 들어갈 파라미터 이름
 * @throws ConfigurationError value <= 0 또는 NaN/Inf
 */
void requirePositive(double value, const std::string& name);

/**
 * @brief value가 유한한 0 이상 값인지 검사
 * @throws ConfigurationError value < 0 또는 NaN/Inf
 */
void requireNonNegative(double value, const std::string& name);

}  // namespace drivetrain_config

#endif  // DRIVETRAIN_CONFIG__UTILS_HPP_
