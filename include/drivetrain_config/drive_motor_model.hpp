#ifndef DRIVETRAIN_CONFIG__DRIVE_MOTOR_MODEL_HPP_
#define DRIVETRAIN_CONFIG__DRIVE_MOTOR_MODEL_HPP_

#include <string>

namespace drivetrain_config
{

/**
 * @brief 구동 모터(+감속기) 추상 인터페이스
 *
 * RobotConfig / ModuleConfig는 이 인터페이스만 의존하며, 구체적인
 * 모터 카탈로그(Kraken, Falcon, NEO 등)는 settings loader 쪽에 있습니다.
 * 새 모터 모델을 추가해도 core는 변경되지 않습니다.
 *
 * 단위: 속도 rad/s (출력축 기준), 토크 N·m, 전류 A, 전압 V
 */
class DriveMotorModel
{
public:
  virtual ~DriveMotorModel() = default;

  /** @brief 모델 이름 (로그용) */
  virtual std::string name() const = 0;

  /**
   * @brief 주어진 속도/전압에서의 전류
   * @param speed_rad_per_sec 출력축 각속도
   * @param voltage 인가 전압
   */
  virtual double current(double speed_rad_per_sec, double voltage) const = 0;

  /** @brief 전류 → 토크 */
  virtual double torque(double current_amps) const = 0;

  /** @brief 토크/속도를 내기 위해 필요한 전압 */
  virtual double voltage(double torque_nm, double speed_rad_per_sec) const = 0;

  /** @brief 토크/전압에서의 출력축 속도 */
  virtual double speed(double torque_nm, double voltage) const = 0;

  /** @brief 무부하 최고속 (rad/s) */
  virtual double freeSpeedRadPerSec() const = 0;

  /** @brief 정지 토크 (N·m) */
  virtual double stallTorqueNm() const = 0;
};

}  // namespace drivetrain_config

#endif  // DRIVETRAIN_CONFIG__DRIVE_MOTOR_MODEL_HPP_
