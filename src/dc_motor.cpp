#include "drivetrain_config/dc_motor.hpp"
#include "drivetrain_config/errors.hpp"
#include "drivetrain_config/utils.hpp"

namespace drivetrain_config
{

DCMotor::DCMotor(
  const std::string& name,
  double nominal_voltage, double stall_torque_nm, double stall_current_amps,
  double free_current_amps, double free_speed_rad_per_sec, int num_motors)
: name_(name),
  nominal_voltage_(nominal_voltage),
  stall_torque_nm_(stall_torque_nm * num_motors),
  stall_current_amps_(stall_current_amps * num_motors),
  free_current_amps_(free_current_amps * num_motors),
  free_speed_rad_per_sec_(free_speed_rad_per_sec)
{
  if (num_motors < 1) {
    throw ConfigurationError(
      "DCMotor '" + name_ + "' requires at least one motor, got " + std::to_string(num_motors));
  }
  requirePositive(nominal_voltage_, "nominal_voltage");
  requirePositive(stall_torque_nm_, "stall_torque");
  requirePositive(stall_current_amps_, "stall_current");
  requireNonNegative(free_current_amps_, "free_current");
  requirePositive(free_speed_rad_per_sec_, "free_speed");
  // free current >= stall current이면 Kv 분모 V - R * I_free <= 0
  if (free_current_amps_ >= stall_current_amps_) {
    throw ConfigurationError(
      "DCMotor '" + name_ + "' free current (" + std::to_string(free_current_amps_) +
      " A) must be below stall current (" + std::to_string(stall_current_amps_) + " A)");
  }

  r_ohms_ = nominal_voltage_ / stall_current_amps_;
  kv_rad_per_sec_per_volt_ = free_speed_rad_per_sec_ / (nominal_voltage_ - r_ohms_ * free_current_amps_);
  kt_nm_per_amp_ = stall_torque_nm_ / stall_current_amps_;
}

double DCMotor::current(double speed_rad_per_sec, double voltage) const
{
  return -1.0 / kv_rad_per_sec_per_volt_ / r_ohms_ * speed_rad_per_sec + 1.0 / r_ohms_ * voltage;
}

double DCMotor::torque(double current_amps) const
{
  return current_amps * kt_nm_per_amp_;
}

double DCMotor::voltage(double torque_nm, double speed_rad_per_sec) const
{
  return 1.0 / kv_rad_per_sec_per_volt_ * speed_rad_per_sec +
         1.0 / kt_nm_per_amp_ * r_ohms_ * torque_nm;
}

double DCMotor::speed(double torque_nm, double voltage) const
{
  return voltage * kv_rad_per_sec_per_volt_ -
         1.0 / kt_nm_per_amp_ * torque_nm * r_ohms_ * kv_rad_per_sec_per_volt_;
}

DCMotor DCMotor::withReduction(double gearing) const
{
  requirePositive(gearing, "gearing");
  // 이미 num_motors가 곱해진 값이므로 1개로 취급
  return DCMotor(
    name_, nominal_voltage_, stall_torque_nm_ * gearing, stall_current_amps_,
    free_current_amps_, free_speed_rad_per_sec_ / gearing, 1);
}

}  // namespace drivetrain_config
