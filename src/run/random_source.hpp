#pragma once

#include <cstdint>
#include <random>

namespace rollkit::run {

/**
 * @brief Source of uniformly distributed integers consumed by dice rolls.
 *
 * One evaluation takes exclusive use of a source. Reusing the same instance
 * across evaluations continues its sequence, which is how seeded runs stay
 * reproducible.
 */
class RandomSource {
public:
  virtual ~RandomSource() = default;

  /**
   * @brief Draws one integer uniformly from the inclusive range [lo, hi].
   * @param lo The lower bound.
   * @param hi The upper bound, not below `lo`.
   * @return The drawn integer.
   */
  virtual std::int64_t NextInRange(std::int64_t lo, std::int64_t hi) = 0;
};

/**
 * @brief RandomSource backed by a 64-bit Mersenne Twister.
 */
class SeededSource : public RandomSource {
public:
  /**
   * @brief Constructs a source; equal seeds give equal sequences.
   * @param seed The seed.
   */
  explicit SeededSource(std::uint64_t seed);

  std::int64_t NextInRange(std::int64_t lo, std::int64_t hi) override;

  /**
   * @brief Returns the seed the source was constructed with.
   */
  std::uint64_t GetSeed() const { return seed_; }

private:
  std::uint64_t seed_;
  std::mt19937_64 engine_;
};

/**
 * @brief Creates a source seeded from the process seed.
 *
 * Each call advances the process seed, so consecutive sources draw
 * different sequences.
 */
SeededSource MakeProcessSource();

} // namespace rollkit::run
