#ifndef DRIVETRAIN_CONFIG__DC_MOTOR_HPP_
#define DRIVETRAIN_CONFIG__DC_MOTOR_HPP_

#include "drivetrain_config/drive_motor_model.hpp"

namespace drivetrain_config
{

/**
 * @brief DC 모터 모델 (선형 토크-속도 곡선)
 *
 *   R  = V_nominal / I_stall
 *   Kv = w_free / (V_nominal - R * I_free)
 *   Kt = T_stall / I_stall
 *
 *   I(w, V) = V / R - w / (Kv * R)
 *   T(I)    = Kt * I
 *
 * num_motors > 1이면 동일 모터를 병렬로 묶은 gearbox로 취급합니다
 * (stall torque / stall current / free current 곱셈).
 */
class DCMotor : public DriveMotorModel
{
public:
  /**
   * @throws ConfigurationError 상수가 양수가 아니거나 num_motors < 1
   */
  DCMotor(
    const std::string& name,
    double nominal_voltage, double stall_torque_nm, double stall_current_amps,
    double free_current_amps, double free_speed_rad_per_sec, int num_motors = 1);

  std::string name() const override { return name_; }

  double current(double speed_rad_per_sec, double voltage) const override;
  double torque(double current_amps) const override;
  double voltage(double torque_nm, double speed_rad_per_sec) const override;
  double speed(double torque_nm, double voltage) const override;

  double freeSpeedRadPerSec() const override { return free_speed_rad_per_sec_; }
  double stallTorqueNm() const override { return stall_torque_nm_; }

  double nominalVoltage() const { return nominal_voltage_; }
  double stallCurrentAmps() const { return stall_current_amps_; }
  double freeCurrentAmps() const { return free_current_amps_; }
  double resistanceOhms() const { return r_ohms_; }
  double kv() const { return kv_rad_per_sec_per_volt_; }
  double kt() const { return kt_nm_per_amp_; }

  /**
   * @brief 감속비 적용 (gearing > 1: 감속)
   * @return stall torque × gearing, free speed / gearing 인 새 모터
   */
  DCMotor withReduction(double gearing) const;

private:
  std::string name_;
  double nominal_voltage_;
  double stall_torque_nm_;
  double stall_current_amps_;
  double free_current_amps_;
  double free_speed_rad_per_sec_;

  double r_ohms_;
  double kv_rad_per_sec_per_volt_;
  double kt_nm_per_amp_;
};

}  // namespace drivetrain_config

#endif  // DRIVETRAIN_CONFIG__DC_MOTOR_HPP_
