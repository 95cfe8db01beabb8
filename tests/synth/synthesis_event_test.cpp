// Tests for synth/synthesis_event.h -- breakpoint automation semantics.

#include "synth/synthesis_event.h"

#include <gtest/gtest.h>

namespace shapesound {
namespace {

TEST(AutomationProgramTest, ConstantHoldsEverywhere) {
  AutomationProgram program = AutomationProgram::constant(0.3f);
  EXPECT_FLOAT_EQ(program.valueAt(0.0), 0.3f);
  EXPECT_FLOAT_EQ(program.valueAt(100.0), 0.3f);
  EXPECT_DOUBLE_EQ(program.lastOffset(), 0.0);
}

TEST(AutomationProgramTest, LinearRampInterpolates) {
  AutomationProgram program;
  program.initial = 0.0f;
  program.linearTo(1.0, 1.0f).linearTo(3.0, 0.0f);
  EXPECT_FLOAT_EQ(program.valueAt(0.0), 0.0f);
  EXPECT_FLOAT_EQ(program.valueAt(0.25), 0.25f);
  EXPECT_FLOAT_EQ(program.valueAt(1.0), 1.0f);
  EXPECT_FLOAT_EQ(program.valueAt(2.0), 0.5f);
  EXPECT_FLOAT_EQ(program.valueAt(5.0), 0.0f);
  EXPECT_DOUBLE_EQ(program.lastOffset(), 3.0);
}

TEST(AutomationProgramTest, ExponentialRampIsGeometric) {
  AutomationProgram program;
  program.initial = 1.0f;
  program.exponentialTo(2.0, 0.01f);
  EXPECT_NEAR(program.valueAt(1.0), 0.1f, 1e-5f);
  EXPECT_NEAR(program.valueAt(2.0), 0.01f, 1e-6f);
}

TEST(AutomationProgramTest, ExponentialRampFromZeroHolds) {
  AutomationProgram program;
  program.initial = 0.0f;
  program.exponentialTo(1.0, 0.5f);
  EXPECT_FLOAT_EQ(program.valueAt(0.5), 0.0f);
  EXPECT_FLOAT_EQ(program.valueAt(1.0), 0.5f);
}

TEST(AutomationProgramTest, SetHoldsUntilBreakpoint) {
  AutomationProgram program;
  program.initial = 2.0f;
  program.setAt(1.0, 5.0f);
  EXPECT_FLOAT_EQ(program.valueAt(0.99), 2.0f);
  EXPECT_FLOAT_EQ(program.valueAt(1.0), 5.0f);
}

TEST(AutomationProgramTest, SetAtZeroReplacesInitial) {
  AutomationProgram program;
  program.setAt(0.0, 0.7f);
  EXPECT_TRUE(program.points.empty());
  EXPECT_FLOAT_EQ(program.valueAt(0.0), 0.7f);
}

TEST(AutomationProgramTest, ZeroLengthRampJumps) {
  AutomationProgram program;
  program.initial = 0.0f;
  program.linearTo(0.0, 1.0f);
  EXPECT_FLOAT_EQ(program.valueAt(0.0), 1.0f);
  EXPECT_FLOAT_EQ(program.valueAt(0.5), 1.0f);
}

}  // namespace
}  // namespace shapesound
