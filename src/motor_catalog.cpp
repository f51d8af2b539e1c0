#include "drivetrain_config/motor_catalog.hpp"
#include "drivetrain_config/errors.hpp"
#include "drivetrain_config/utils.hpp"

namespace drivetrain_config
{

namespace
{

struct MotorEntry
{
  MotorType type;
  const char* id;
  double stall_torque_nm;
  double stall_current_amps;
  double free_current_amps;
  double free_speed_rpm;
};

// 12V 기준 제조사 모터 곡선
constexpr double kMotorNominalVoltage = 12.0;
const MotorEntry kMotorCatalog[] = {
  {MotorType::kKrakenX60, "krakenX60", 7.09, 366.0, 2.0, 6000.0},
  {MotorType::kKrakenX60FOC, "krakenX60FOC", 9.37, 483.0, 2.0, 5800.0},
  {MotorType::kFalcon500, "falcon500", 4.69, 257.0, 1.5, 6380.0},
  {MotorType::kFalcon500FOC, "falcon500FOC", 5.84, 304.0, 1.5, 6080.0},
  {MotorType::kVortex, "vortex", 3.60, 211.0, 3.6, 6784.0},
  {MotorType::kNEO, "NEO", 2.6, 105.0, 1.8, 5676.0},
  {MotorType::kCIM, "CIM", 2.42, 133.0, 2.7, 5310.0},
  {MotorType::kMiniCIM, "miniCIM", 1.41, 89.0, 3.0, 5840.0},
};

const MotorEntry& findEntry(MotorType type)
{
  for (const auto& entry : kMotorCatalog) {
    if (entry.type == type) {
      return entry;
    }
  }
  throw UnsupportedMotorError("Unknown motor type enum value");
}

}  // namespace

const std::vector<std::string>& supportedMotorIds()
{
  static const std::vector<std::string> ids = [] {
      std::vector<std::string> result;
      for (const auto& entry : kMotorCatalog) {
        result.emplace_back(entry.id);
      }
      return result;
    }();
  return ids;
}

MotorType motorTypeFromString(const std::string& id)
{
  for (const auto& entry : kMotorCatalog) {
    if (id == entry.id) {
      return entry.type;
    }
  }

  std::string supported;
  for (const auto& known : supportedMotorIds()) {
    supported += (supported.empty() ? "'" : ", '") + known + "'";
  }
  throw UnsupportedMotorError(
    "Unsupported motor type: '" + id + "'. Supported: " + supported);
}

std::string toString(MotorType type)
{
  return findEntry(type).id;
}

DCMotor makeDCMotor(MotorType type, int num_motors)
{
  const MotorEntry& entry = findEntry(type);
  return DCMotor(
    entry.id, kMotorNominalVoltage, entry.stall_torque_nm, entry.stall_current_amps,
    entry.free_current_amps, rpmToRadPerSec(entry.free_speed_rpm), num_motors);
}

}  // namespace drivetrain_config
