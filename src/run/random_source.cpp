#include "random_source.hpp"

#include "../utils/seed/seed.hpp"

namespace rollkit::run {

SeededSource::SeededSource(std::uint64_t seed) : seed_(seed), engine_(seed) {}

std::int64_t SeededSource::NextInRange(std::int64_t lo, std::int64_t hi) {
  std::uniform_int_distribution<std::int64_t> distribution(lo, hi);
  return distribution(engine_);
}

SeededSource MakeProcessSource() {
  auto &seed = utils::seed::Seed::getInstance();
  return SeededSource(static_cast<std::uint64_t>(seed.Rand()));
}

} // namespace rollkit::run
