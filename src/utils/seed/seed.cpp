#include "seed.hpp"

#include <time.h>

namespace rollkit::utils::seed {

Seed::Seed() : need_to_print_seed_(false), seed_(0) { GenerateSeed(); }

long Seed::GetSeed() { return seed_; }

void Seed::SetSeed(long seed) { seed_ = seed; }

void Seed::GenerateSeed() { seed_ = (long)time((time_t *)0); }

bool Seed::NeedToPrintSeed() { return need_to_print_seed_; }

void Seed::SetNeedToPrintSeed(bool need_to_print_seed) {
  need_to_print_seed_ = need_to_print_seed;
}

long Seed::Rand() {
  auto &seed = Seed::getInstance();
  long next = seed.GetSeed() % 2147483647;
  if (next < 0) {
    next = -next;
  }
  if (next == 0) {
    next = 1;
  }

  next = 16807 * (next % 127773) - 2836 * (next / 127773);

  if (next <= 0) {
    next += 2147483647;
  }

  seed.SetSeed(next);
  return next;
}

} // namespace rollkit::utils::seed
