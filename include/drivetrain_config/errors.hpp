#ifndef DRIVETRAIN_CONFIG__ERRORS_HPP_
#define DRIVETRAIN_CONFIG__ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace drivetrain_config
{

/**
 * @brief 잘못된 물리/기하 파라미터로 객체를 생성하려 할 때
 *
 * 질량, MOI, 바퀴 반지름 등이 양수가 아니거나 모듈 배치가 잘못된 경우.
 * 생성자에서 즉시 던지므로 잘못된 상태의 객체는 존재하지 않습니다.
 */
class ConfigurationError : public std::invalid_argument
{
public:
  explicit ConfigurationError(const std::string& what)
  : std::invalid_argument(what) {}
};

/**
 * @brief 모터 카탈로그에 없는 모터 식별자 (settings loader 경계에서만 발생)
 */
class UnsupportedMotorError : public std::invalid_argument
{
public:
  explicit UnsupportedMotorError(const std::string& what)
  : std::invalid_argument(what) {}
};

/**
 * @brief 모듈 상태 개수가 numModules와 다를 때
 */
class ShapeMismatchError : public std::invalid_argument
{
public:
  ShapeMismatchError(size_t expected, size_t actual)
  : std::invalid_argument(
      "Expected " + std::to_string(expected) + " module states, got " +
      std::to_string(actual)) {}
};

}  // namespace drivetrain_config

#endif  // DRIVETRAIN_CONFIG__ERRORS_HPP_
