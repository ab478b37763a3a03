#include <gtest/gtest.h>

#include "../src/utils/verbose/verbose.hpp"

using rollkit::utils::verbose::Flags;

class FlagsTest : public ::testing::Test {
protected:
  void SetUp() override { Flags::getInstance().Reset(); }
  void TearDown() override { Flags::getInstance().Reset(); }
};

TEST_F(FlagsTest, InitiallyCleared) {
  auto &flags = Flags::getInstance();

  EXPECT_FALSE(flags.NeedToPrintVerbose());
  EXPECT_FALSE(flags.NeedToPrintExplanation());
}

TEST_F(FlagsTest, SetFlags) {
  auto &flags = Flags::getInstance();

  flags.SetNeedToPrintVerbose();
  EXPECT_TRUE(flags.NeedToPrintVerbose());
  EXPECT_FALSE(flags.NeedToPrintExplanation());

  flags.SetNeedToPrintExplanation();
  EXPECT_TRUE(flags.NeedToPrintExplanation());
}

TEST_F(FlagsTest, ResetClearsEveryFlag) {
  auto &flags = Flags::getInstance();
  flags.SetNeedToPrintVerbose();
  flags.SetNeedToPrintExplanation();

  flags.Reset();
  EXPECT_FALSE(flags.NeedToPrintVerbose());
  EXPECT_FALSE(flags.NeedToPrintExplanation());
}
