#include <gtest/gtest.h>

#include "../src/errors/errors.hpp"
#include "../src/parser/parser.hpp"
#include "../src/run/eval.hpp"
#include "../src/run/random_source.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using rollkit::errors::EvalError;
using rollkit::errors::EvalErrorKind;
using rollkit::models::ListKind;
using rollkit::models::Value;
using rollkit::run::EvalLimits;
using rollkit::run::Evaluator;
using rollkit::run::SeededSource;

// Hands out a fixed sequence of draws and records every requested range.
class ScriptedSource : public rollkit::run::RandomSource {
public:
  explicit ScriptedSource(std::vector<std::int64_t> draws)
      : draws_(std::move(draws)), next_(0) {}

  std::int64_t NextInRange(std::int64_t lo, std::int64_t hi) override {
    ranges_.emplace_back(lo, hi);
    if (next_ >= draws_.size()) {
      throw std::out_of_range("scripted source is exhausted");
    }
    return draws_[next_++];
  }

  std::size_t GetDrawCount() const { return next_; }
  const std::vector<std::pair<std::int64_t, std::int64_t>> &GetRanges() const {
    return ranges_;
  }

private:
  std::vector<std::int64_t> draws_;
  std::size_t next_;
  std::vector<std::pair<std::int64_t, std::int64_t>> ranges_;
};

class EvalTest : public ::testing::Test {
protected:
  Value Run(const std::string &text, std::vector<std::int64_t> draws = {},
            EvalLimits limits = EvalLimits()) {
    source_ = std::make_unique<ScriptedSource>(std::move(draws));
    auto tree = rollkit::parser::Parse(text);
    Evaluator evaluator(*source_, rollkit::functions::Registry::getInstance(),
                        limits);
    return evaluator.Eval(*tree);
  }

  EvalErrorKind ExpectEvalError(const std::string &text,
                                std::vector<std::int64_t> draws = {},
                                EvalLimits limits = EvalLimits()) {
    try {
      Run(text, std::move(draws), limits);
    } catch (const EvalError &error) {
      return error.GetKind();
    }
    ADD_FAILURE() << "'" << text << "' evaluated without error";
    return EvalErrorKind::kFunctionError;
  }

  std::unique_ptr<ScriptedSource> source_;
};

TEST_F(EvalTest, IntegerArithmetic) {
  EXPECT_EQ(Run("2 + 3 * 4"), Value::Integer(14));
  EXPECT_EQ(Run("10 - 2 - 3"), Value::Integer(5));
  EXPECT_EQ(Run("(1 + 2) * 3"), Value::Integer(9));
  EXPECT_EQ(Run("3 - -2"), Value::Integer(5));
  EXPECT_EQ(Run("-4 * 3"), Value::Integer(-12));
}

TEST_F(EvalTest, ArithmeticMatchesIntegerOperations) {
  const std::vector<std::int64_t> samples = {-7, -1, 0, 1, 3, 12};
  for (auto a : samples) {
    for (auto b : samples) {
      auto lhs = std::to_string(a);
      auto rhs = std::to_string(b);
      EXPECT_EQ(Run(lhs + " + " + rhs), Value::Integer(a + b));
      EXPECT_EQ(Run(lhs + " - " + rhs), Value::Integer(a - b));
      EXPECT_EQ(Run(lhs + " * " + rhs), Value::Integer(a * b));
      EXPECT_EQ(Run(lhs + " < " + rhs), Value::Integer(a < b ? 1 : 0));
      EXPECT_EQ(Run(lhs + " >= " + rhs), Value::Integer(a >= b ? 1 : 0));
      EXPECT_EQ(Run(lhs + " != " + rhs), Value::Integer(a != b ? 1 : 0));
    }
  }
}

TEST_F(EvalTest, ChainedComparisonsHaveNoSpecialMeaning) {
  EXPECT_EQ(Run("1 < 2 < 3"), Value::Integer(1));
  EXPECT_EQ(Run("3 > 2 > 1"), Value::Integer(0));
}

TEST_F(EvalTest, OverflowWraps) {
  EXPECT_EQ(Run("9223372036854775807 + 1"),
            Value::Integer(std::numeric_limits<std::int64_t>::min()));
}

TEST_F(EvalTest, ExplicitListIsNormal) {
  EXPECT_EQ(Run("{1, 2, 3}"), Value::List(ListKind::kNormal, {1, 2, 3}));
  EXPECT_EQ(Run("{}"), Value::List(ListKind::kNormal, {}));
  EXPECT_EQ(Run("{5,}"), Value::List(ListKind::kNormal, {5}));
}

TEST_F(EvalTest, ExplicitListReducesNormalElements) {
  EXPECT_EQ(Run("{1, {2, 3}}"), Value::List(ListKind::kNormal, {1, 5}));
}

TEST_F(EvalTest, ExplicitListRejectsStrongElements) {
  EXPECT_EQ(ExpectEvalError("{1, {{2, 3}}}"),
            EvalErrorKind::kNonScalarListElement);
}

TEST_F(EvalTest, NormalListReducesInArithmetic) {
  EXPECT_EQ(Run("{1,2,3} + 5"), Value::Integer(11));
}

TEST_F(EvalTest, StrongListBroadcasts) {
  auto result = Run("{{1,2,3}} + 5");

  EXPECT_EQ(result, Value::List(ListKind::kStrong, {6, 7, 8}));
  EXPECT_EQ(result.Sum(), 21);
  EXPECT_EQ(Run("2 - {{1, 2}}"), Value::List(ListKind::kStrong, {1, 0}));
  EXPECT_EQ(Run("{{1,2,3}} + {1, 1}"),
            Value::List(ListKind::kStrong, {3, 4, 5}));
}

TEST_F(EvalTest, StrongListPairwiseMismatch) {
  EXPECT_EQ(ExpectEvalError("{{1,2}} + {{1,2,3}}"),
            EvalErrorKind::kLengthMismatch);
  EXPECT_EQ(Run("{{1,2}} * {{3,4}}"), Value::List(ListKind::kStrong, {3, 8}));
}

TEST_F(EvalTest, StrongWrapOfScalar) {
  EXPECT_EQ(ExpectEvalError("{5}"), EvalErrorKind::kStrongWrapOfScalar);
}

TEST_F(EvalTest, StrongWrapKeepsElements) {
  EXPECT_EQ(Run("{{{1, 2}}}"), Value::List(ListKind::kStrong, {1, 2}));
}

TEST_F(EvalTest, Ranges) {
  EXPECT_EQ(Run("[1,10,2]"), Value::List(ListKind::kNormal, {1, 3, 5, 7, 9}));
  EXPECT_EQ(Run("[1,10,-2]"), Value::List(ListKind::kNormal, {1, 3, 5, 7, 9}));
  EXPECT_EQ(Run("[10,5]"),
            Value::List(ListKind::kNormal, {10, 9, 8, 7, 6, 5}));
  EXPECT_EQ(Run("[10,1,3]"), Value::List(ListKind::kNormal, {10, 7, 4, 1}));
  EXPECT_EQ(Run("[5,5]"), Value::List(ListKind::kNormal, {5}));
}

TEST_F(EvalTest, ComputedZeroStep) {
  EXPECT_EQ(ExpectEvalError("[1, 10, 1 - 1]"), EvalErrorKind::kInvalidStep);
}

TEST_F(EvalTest, RangeBoundsMustBeIntegers) {
  EXPECT_EQ(ExpectEvalError("[{{1, 2}}, 10]"), EvalErrorKind::kExpectedInteger);
  EXPECT_EQ(Run("[{1, 2}, 5]"), Value::List(ListKind::kNormal, {3, 4, 5}));
}

TEST_F(EvalTest, DiceDrawsFromOneToSides) {
  auto result = Run("3d6", {4, 1, 6});

  EXPECT_EQ(result, Value::List(ListKind::kNormal, {4, 1, 6}));
  ASSERT_EQ(source_->GetRanges().size(), 3u);
  for (const auto &range : source_->GetRanges()) {
    EXPECT_EQ(range.first, 1);
    EXPECT_EQ(range.second, 6);
  }
}

TEST_F(EvalTest, DiceOverFaceListDrawsIndices) {
  auto result = Run("2d{10, 20, 30}", {2, 0});

  EXPECT_EQ(result, Value::List(ListKind::kNormal, {30, 10}));
  EXPECT_EQ(source_->GetRanges()[0].first, 0);
  EXPECT_EQ(source_->GetRanges()[0].second, 2);
}

TEST_F(EvalTest, DiceOverStrongFaceListYieldsNormal) {
  EXPECT_EQ(Run("1d{{7, 8}}", {1}), Value::List(ListKind::kNormal, {8}));
}

TEST_F(EvalTest, DrawsOutsideTheRequestedRangeFail) {
  EXPECT_EQ(ExpectEvalError("1d{1, 2}", {5}), EvalErrorKind::kInvalidDraw);
  EXPECT_EQ(ExpectEvalError("1d{1, 2}", {-1}), EvalErrorKind::kInvalidDraw);
  EXPECT_EQ(ExpectEvalError("1d6", {7}), EvalErrorKind::kInvalidDraw);
  EXPECT_EQ(ExpectEvalError("1d6", {0}), EvalErrorKind::kInvalidDraw);
}

TEST_F(EvalTest, ZeroDiceRollNothing) {
  EXPECT_EQ(Run("0d6"), Value::List(ListKind::kNormal, {}));
  EXPECT_EQ(source_->GetDrawCount(), 0u);
}

TEST_F(EvalTest, DiceCountFromNormalListSum) {
  EXPECT_EQ(Run("{1, 1}d4", {3, 2}), Value::List(ListKind::kNormal, {3, 2}));
}

TEST_F(EvalTest, DiceEvaluateRightOperandBeforeRolling) {
  // 2d(3d4): the three d4 rolls become the faces of the outer dice.
  auto result = Run("2d3d4", {1, 2, 3, 0, 2});

  EXPECT_EQ(result, Value::List(ListKind::kNormal, {1, 3}));
  EXPECT_EQ(source_->GetDrawCount(), 5u);
}

TEST_F(EvalTest, DiceErrors) {
  EXPECT_EQ(ExpectEvalError("-2d6"), EvalErrorKind::kNegativeDiceCount);
  EXPECT_EQ(ExpectEvalError("1d0"), EvalErrorKind::kInvalidSides);
  EXPECT_EQ(ExpectEvalError("1d-3"), EvalErrorKind::kInvalidSides);
  EXPECT_EQ(ExpectEvalError("1d{}"), EvalErrorKind::kEmptyFaceList);
  EXPECT_EQ(ExpectEvalError("{{1,2}}d6"), EvalErrorKind::kExpectedInteger);
}

TEST_F(EvalTest, KeepHighestPreservesOriginalOrder) {
  auto result = Run("4d6kh3", {3, 6, 1, 5});

  EXPECT_EQ(result, Value::List(ListKind::kNormal, {3, 6, 5}));
}

TEST_F(EvalTest, DropLowest) {
  EXPECT_EQ(Run("4d6dl1", {3, 6, 1, 5}),
            Value::List(ListKind::kNormal, {3, 6, 5}));
  EXPECT_EQ(Run("{5, 1, 4, 2} dl 2"), Value::List(ListKind::kNormal, {5, 4}));
}

TEST_F(EvalTest, DropHighest) {
  EXPECT_EQ(Run("{5, 1, 4, 2} dh 1"),
            Value::List(ListKind::kNormal, {1, 4, 2}));
}

TEST_F(EvalTest, KeepLowestPreservesStrongKind) {
  EXPECT_EQ(Run("{{4, 2, 4, 1}} kl 2"),
            Value::List(ListKind::kStrong, {2, 1}));
}

TEST_F(EvalTest, KeepTiesFavourEarlierElements) {
  EXPECT_EQ(Run("{4, 2, 4, 1} kh 1"), Value::List(ListKind::kNormal, {4}));
  EXPECT_EQ(Run("{4, 2, 4, 1} dh 1"),
            Value::List(ListKind::kNormal, {2, 4, 1}));
}

TEST_F(EvalTest, KeepCountBounds) {
  EXPECT_EQ(Run("{1, 2} kh 0"), Value::List(ListKind::kNormal, {}));
  EXPECT_EQ(Run("{1, 2} kh 2"), Value::List(ListKind::kNormal, {1, 2}));
  EXPECT_EQ(Run("{1, 2} dl 2"), Value::List(ListKind::kNormal, {}));
  EXPECT_EQ(ExpectEvalError("{1, 2} kh 3"), EvalErrorKind::kCountOutOfRange);
  EXPECT_EQ(ExpectEvalError("{1, 2} dl -1"), EvalErrorKind::kCountOutOfRange);
}

TEST_F(EvalTest, KeepNeedsAList) {
  EXPECT_EQ(ExpectEvalError("3 kh 1"), EvalErrorKind::kExpectedList);
}

TEST_F(EvalTest, KeepResultReducesInArithmetic) {
  EXPECT_EQ(Run("4d6kh3 + 2", {3, 6, 1, 5}), Value::Integer(16));
}

TEST_F(EvalTest, StrongDiceRollBroadcasts) {
  EXPECT_EQ(Run("{3d6} * 2", {1, 2, 3}),
            Value::List(ListKind::kStrong, {2, 4, 6}));
}

TEST_F(EvalTest, Calls) {
  EXPECT_EQ(Run("max(1, {5, 2}, 3)"), Value::Integer(5));
  EXPECT_EQ(Run("min(4, [2, 6])"), Value::Integer(2));
  EXPECT_EQ(Run("sum({{1, 2}})"), Value::Integer(3));
  EXPECT_EQ(Run("len(3d6)", {1, 1, 1}), Value::Integer(3));
}

TEST_F(EvalTest, DiceSidesFromACall) {
  EXPECT_EQ(Run("2dlen({4, 5})", {1, 2}),
            Value::List(ListKind::kNormal, {1, 2}));
  EXPECT_EQ(source_->GetRanges()[0].second, 2);
}

TEST_F(EvalTest, CallErrors) {
  EXPECT_EQ(ExpectEvalError("roll(1)"), EvalErrorKind::kUnknownFunction);
  EXPECT_EQ(ExpectEvalError("sum()"), EvalErrorKind::kInvalidArguments);
  EXPECT_EQ(ExpectEvalError("len(3)"), EvalErrorKind::kExpectedList);
}

TEST_F(EvalTest, CallArgumentsEvaluateLeftToRight) {
  EXPECT_EQ(Run("max(1d6, 1d20)", {2, 17}), Value::Integer(17));
  EXPECT_EQ(source_->GetRanges()[0].second, 6);
  EXPECT_EQ(source_->GetRanges()[1].second, 20);
}

TEST_F(EvalTest, ListLimit) {
  EvalLimits limits;
  limits.max_list_length = 10;

  EXPECT_EQ(Run("[1, 10]", {}, limits).GetElements().size(), 10u);
  EXPECT_EQ(ExpectEvalError("[1, 11]", {}, limits),
            EvalErrorKind::kListTooLarge);
  EXPECT_EQ(ExpectEvalError("11d6", {}, limits), EvalErrorKind::kListTooLarge);
  EXPECT_EQ(source_->GetDrawCount(), 0u);
}

TEST_F(EvalTest, HugeRangeIsRejected) {
  EXPECT_EQ(
      ExpectEvalError("[-9223372036854775808, 9223372036854775807]"),
      EvalErrorKind::kListTooLarge);
}

TEST_F(EvalTest, EvaluationDoesNotChangeTheTree) {
  ScriptedSource source({2, 5, 2, 5});
  auto tree = rollkit::parser::Parse("2d6 + 1");
  Evaluator evaluator(source);

  auto first = evaluator.Eval(*tree);
  auto second = evaluator.Eval(*tree);
  EXPECT_EQ(first, second);
  EXPECT_EQ(first, Value::Integer(8));
}

TEST_F(EvalTest, LongestAcceptedChainEvaluates) {
  std::string text = "1";
  for (int i = 0; i < 999; i++) {
    text += " + 1";
  }

  EXPECT_EQ(Run(text), Value::Integer(1000));
  EXPECT_EQ(Run(std::string(999, '(') + "2d6" + std::string(999, ')'), {3, 4}),
            Value::List(ListKind::kNormal, {3, 4}));
}

TEST(RangeLengthTest, CountsInclusiveSteps) {
  using rollkit::run::RangeLength;

  EXPECT_EQ(RangeLength(1, 10, 2), 5u);
  EXPECT_EQ(RangeLength(10, 1, -3), 4u);
  EXPECT_EQ(RangeLength(5, 5, 7), 1u);
  EXPECT_EQ(RangeLength(std::numeric_limits<std::int64_t>::min(),
                        std::numeric_limits<std::int64_t>::max(), 1),
            std::numeric_limits<std::uint64_t>::max());
}

TEST(SeededSourceTest, SameSeedSameRolls) {
  for (std::int64_t n = 0; n <= 5; n++) {
    for (std::int64_t s = 1; s <= 8; s++) {
      auto tree = rollkit::parser::Parse(
          std::to_string(n) + " d " + std::to_string(s));
      SeededSource first(1234);
      SeededSource second(1234);

      auto a = Evaluator(first).Eval(*tree);
      auto b = Evaluator(second).Eval(*tree);
      EXPECT_EQ(a, b);
      ASSERT_EQ(a.GetElements().size(), static_cast<std::size_t>(n));
      for (auto roll : a.GetElements()) {
        EXPECT_GE(roll, 1);
        EXPECT_LE(roll, s);
      }
    }
  }
}

TEST(SeededSourceTest, SharedSourceContinuesTheSequence) {
  auto tree = rollkit::parser::Parse("20d1000");
  SeededSource shared(99);
  SeededSource fresh(99);

  auto first = Evaluator(shared).Eval(*tree);
  auto second = Evaluator(shared).Eval(*tree);
  auto replay = Evaluator(fresh).Eval(*tree);

  EXPECT_EQ(first, replay);
  EXPECT_NE(first, second);
  EXPECT_EQ(shared.GetSeed(), 99u);
}

TEST(SeededSourceTest, KeepHighestMatchesTopOfSortedRolls) {
  auto rolls_tree = rollkit::parser::Parse("4d6");
  auto kept_tree = rollkit::parser::Parse("4d6kh3");

  for (std::uint64_t seed = 1; seed <= 50; seed++) {
    SeededSource rolls_source(seed);
    SeededSource kept_source(seed);
    auto rolls = Evaluator(rolls_source).Eval(*rolls_tree).GetElements();
    auto kept = Evaluator(kept_source).Eval(*kept_tree).GetElements();

    ASSERT_EQ(kept.size(), 3u);
    std::sort(rolls.begin(), rolls.end(), std::greater<std::int64_t>());
    std::sort(kept.begin(), kept.end(), std::greater<std::int64_t>());
    EXPECT_TRUE(std::equal(kept.begin(), kept.end(), rolls.begin()));
  }
}
