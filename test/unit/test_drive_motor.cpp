/**
 * @brief DCMotor / 모터 카탈로그 / ModuleConfig 단위 테스트
 */
#include <gtest/gtest.h>
#include <cmath>
#include <memory>
#include "drivetrain_config/dc_motor.hpp"
#include "drivetrain_config/motor_catalog.hpp"
#include "drivetrain_config/module_config.hpp"
#include "drivetrain_config/errors.hpp"
#include "drivetrain_config/utils.hpp"

using namespace drivetrain_config;

// ============================================================================
// DCMotor Tests
// ============================================================================

class DCMotorTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    // NEO: 12V, 2.6 N·m, 105 A, 1.8 A, 5676 RPM
    motor_ = std::make_unique<DCMotor>("NEO", 12.0, 2.6, 105.0, 1.8, rpmToRadPerSec(5676.0));
  }
  std::unique_ptr<DCMotor> motor_;
};

TEST_F(DCMotorTest, DerivedConstants)
{
  EXPECT_NEAR(motor_->resistanceOhms(), 12.0 / 105.0, 1e-12);
  EXPECT_NEAR(motor_->kt(), 2.6 / 105.0, 1e-12);
  EXPECT_NEAR(
    motor_->kv(), rpmToRadPerSec(5676.0) / (12.0 - 12.0 / 105.0 * 1.8), 1e-9);
}

TEST_F(DCMotorTest, StallAndFreeCurrent)
{
  // 정지 시 stall current, 무부하 최고속에서 free current
  EXPECT_NEAR(motor_->current(0.0, 12.0), 105.0, 1e-9);
  EXPECT_NEAR(motor_->current(motor_->freeSpeedRadPerSec(), 12.0), 1.8, 1e-9);
  EXPECT_NEAR(motor_->torque(105.0), 2.6, 1e-9);
}

TEST_F(DCMotorTest, VoltageCurrentConsistency)
{
  double speed = 200.0;
  double current = 40.0;
  double voltage = motor_->voltage(motor_->torque(current), speed);
  EXPECT_NEAR(motor_->current(speed, voltage), current, 1e-9);
  EXPECT_NEAR(motor_->speed(motor_->torque(current), voltage), speed, 1e-9);
}

TEST_F(DCMotorTest, WithReduction)
{
  auto reduced = motor_->withReduction(6.75);
  EXPECT_NEAR(reduced.stallTorqueNm(), 2.6 * 6.75, 1e-9);
  EXPECT_NEAR(reduced.freeSpeedRadPerSec(), rpmToRadPerSec(5676.0) / 6.75, 1e-9);
  EXPECT_NEAR(reduced.stallCurrentAmps(), 105.0, 1e-9);
  EXPECT_NEAR(reduced.freeCurrentAmps(), 1.8, 1e-9);
  EXPECT_EQ(reduced.name(), "NEO");
}

TEST_F(DCMotorTest, InvalidReduction)
{
  EXPECT_THROW(motor_->withReduction(0.0), ConfigurationError);
}

TEST(DCMotorConstructionTest, MultipleMotorsScaleTorqueAndCurrent)
{
  DCMotor single("CIM", 12.0, 2.42, 133.0, 2.7, rpmToRadPerSec(5310.0), 1);
  DCMotor dual("CIM", 12.0, 2.42, 133.0, 2.7, rpmToRadPerSec(5310.0), 2);
  EXPECT_NEAR(dual.stallTorqueNm(), 2.0 * single.stallTorqueNm(), 1e-12);
  EXPECT_NEAR(dual.stallCurrentAmps(), 2.0 * single.stallCurrentAmps(), 1e-12);
  EXPECT_NEAR(dual.freeCurrentAmps(), 2.0 * single.freeCurrentAmps(), 1e-12);
  EXPECT_NEAR(dual.freeSpeedRadPerSec(), single.freeSpeedRadPerSec(), 1e-12);
}

TEST(DCMotorConstructionTest, InvalidConstants)
{
  EXPECT_THROW(DCMotor("bad", 12.0, 0.0, 100.0, 1.0, 500.0), ConfigurationError);
  EXPECT_THROW(DCMotor("bad", 12.0, 1.0, -100.0, 1.0, 500.0), ConfigurationError);
  EXPECT_THROW(DCMotor("bad", 12.0, 1.0, 100.0, 1.0, 500.0, 0), ConfigurationError);
}

TEST(DCMotorConstructionTest, FreeCurrentAtLeastStallCurrentRejected)
{
  EXPECT_THROW(DCMotor("bad", 12.0, 1.0, 10.0, 10.0, 500.0), ConfigurationError);
  EXPECT_THROW(DCMotor("bad", 12.0, 1.0, 10.0, 20.0, 500.0), ConfigurationError);
  EXPECT_THROW(DCMotor("bad", 12.0, 1.0, 10.0, 10.0, 500.0, 2), ConfigurationError);
  EXPECT_NO_THROW(DCMotor("ok", 12.0, 1.0, 10.0, 9.9, 500.0));
}

// ============================================================================
// Motor Catalog Tests
// ============================================================================

TEST(MotorCatalogTest, AllSupportedIdsResolve)
{
  const auto& ids = supportedMotorIds();
  EXPECT_EQ(ids.size(), 8u);
  for (const auto& id : ids) {
    MotorType type = motorTypeFromString(id);
    EXPECT_EQ(toString(type), id);
    auto motor = makeDCMotor(type);
    EXPECT_GT(motor.stallTorqueNm(), 0.0);
    EXPECT_GT(motor.freeSpeedRadPerSec(), 0.0);
  }
}

TEST(MotorCatalogTest, KrakenX60Constants)
{
  auto motor = makeDCMotor(MotorType::kKrakenX60, 1);
  EXPECT_NEAR(motor.stallTorqueNm(), 7.09, 1e-12);
  EXPECT_NEAR(motor.stallCurrentAmps(), 366.0, 1e-12);
  EXPECT_NEAR(motor.freeSpeedRadPerSec(), rpmToRadPerSec(6000.0), 1e-9);
  EXPECT_NEAR(motor.nominalVoltage(), 12.0, 1e-12);
}

TEST(MotorCatalogTest, UnsupportedMotor)
{
  EXPECT_THROW(motorTypeFromString("turboEncabulator"), UnsupportedMotorError);
  // 대소문자 구분
  EXPECT_THROW(motorTypeFromString("neo"), UnsupportedMotorError);
  EXPECT_THROW(motorTypeFromString(""), UnsupportedMotorError);
}

TEST(MotorCatalogTest, UnsupportedMotorMessageListsSupported)
{
  try {
    motorTypeFromString("falcon9000");
    FAIL() << "expected UnsupportedMotorError";
  } catch (const UnsupportedMotorError& e) {
    std::string message = e.what();
    EXPECT_NE(message.find("falcon9000"), std::string::npos);
    EXPECT_NE(message.find("krakenX60"), std::string::npos);
    EXPECT_NE(message.find("miniCIM"), std::string::npos);
  }
}

// ============================================================================
// ModuleConfig Tests
// ============================================================================

class ModuleConfigTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    motor_ = std::make_shared<DCMotor>(makeDCMotor(MotorType::kKrakenX60).withReduction(6.75));
  }
  std::shared_ptr<const DCMotor> motor_;
};

TEST_F(ModuleConfigTest, Accessors)
{
  ModuleConfig config(0.05, 4.5, 1.1, motor_, 60.0);
  EXPECT_DOUBLE_EQ(config.wheelRadiusMeters(), 0.05);
  EXPECT_DOUBLE_EQ(config.maxDriveVelocityMps(), 4.5);
  EXPECT_DOUBLE_EQ(config.wheelCOF(), 1.1);
  EXPECT_DOUBLE_EQ(config.driveCurrentLimitAmps(), 60.0);
  EXPECT_EQ(config.driveMotor().name(), "krakenX60");
}

TEST_F(ModuleConfigTest, MaxDriveVelocityRadPerSec)
{
  ModuleConfig config(0.05, 4.5, 1.0, motor_, 60.0);
  EXPECT_NEAR(config.maxDriveVelocityRadPerSec(), 90.0, 1e-9);
}

TEST_F(ModuleConfigTest, TorqueLossFromCurrentDraw)
{
  ModuleConfig config(0.05, 4.5, 1.0, motor_, 60.0);
  double current = motor_->current(90.0, 12.0);
  ASSERT_GT(current, 0.0);
  ASSERT_LT(current, 60.0);
  EXPECT_NEAR(config.torqueLoss(), motor_->torque(current), 1e-9);
}

TEST_F(ModuleConfigTest, TorqueLossLimitedByCurrentLimit)
{
  // 전류 제한이 최고속 전류보다 낮으면 제한값 기준
  ModuleConfig config(0.05, 4.5, 1.0, motor_, 5.0);
  EXPECT_NEAR(config.torqueLoss(), motor_->torque(5.0), 1e-9);
}

TEST_F(ModuleConfigTest, TorqueLossNeverNegative)
{
  // 무부하 최고속보다 빠른 설정 → 음의 전류 → 0으로 클램프
  ModuleConfig config(0.05, 10.0, 1.0, motor_, 60.0);
  EXPECT_GT(config.maxDriveVelocityRadPerSec(), motor_->freeSpeedRadPerSec());
  EXPECT_DOUBLE_EQ(config.torqueLoss(), 0.0);
}

TEST_F(ModuleConfigTest, InvalidParameters)
{
  EXPECT_THROW(ModuleConfig(0.0, 4.5, 1.0, motor_, 60.0), ConfigurationError);
  EXPECT_THROW(ModuleConfig(0.05, -1.0, 1.0, motor_, 60.0), ConfigurationError);
  EXPECT_THROW(ModuleConfig(0.05, 4.5, -0.1, motor_, 60.0), ConfigurationError);
  EXPECT_THROW(ModuleConfig(0.05, 4.5, 1.0, motor_, 0.0), ConfigurationError);
  EXPECT_THROW(ModuleConfig(0.05, 4.5, 1.0, nullptr, 60.0), ConfigurationError);
  EXPECT_THROW(ModuleConfig(NAN, 4.5, 1.0, motor_, 60.0), ConfigurationError);
}

TEST_F(ModuleConfigTest, ZeroFrictionAllowed)
{
  EXPECT_NO_THROW(ModuleConfig(0.05, 4.5, 0.0, motor_, 60.0));
}

int main(int argc, char** argv)
{
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
