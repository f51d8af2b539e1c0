#include "drivetrain_config/utils.hpp"
#include "drivetrain_config/errors.hpp"

namespace drivetrain_config
{

void requirePositive(double value, const std::string& name)
{
  if (!std::isfinite(value) || value <= 0.0) {
    throw ConfigurationError(
      name + " must be a finite positive value, got " + std::to_string(value));
  }
}

void requireNonNegative(double value, const std::string& name)
{
  if (!std::isfinite(value) || value < 0.0) {
    throw ConfigurationError(
      name + " must be a finite non-negative value, got " + std::to_string(value));
  }
}

}  // namespace drivetrain_config
