#pragma once

/**
 * @file
 * @brief Contains the declaration of the Seed class.
 */

namespace rollkit::utils::seed {

/**
 * @brief The Seed class holds the process seed for random number generation.
 *
 * The process seed starts from the clock, can be pinned with SetSeed, and
 * advances with a Park-Miller step on every Rand call. Evaluations that are
 * not handed a random source derive theirs from it.
 */
class Seed {
private:
  /**
   * @brief Default private constructor. Seeds from the clock.
   */
  Seed();

  Seed(const Seed &other) = delete;
  Seed &operator=(const Seed &other) = delete;

public:
  /**
   * @brief Get the current seed value.
   * @return The current seed value.
   */
  long GetSeed();

  /**
   * @brief Set a new seed value.
   * @param seed The new seed value to be set.
   */
  void SetSeed(long seed);

  /**
   * @brief Reseed from the current time.
   */
  void GenerateSeed();

  /**
   * @brief Check if the seed value needs to be printed.
   * @return True if the seed value needs to be printed, false otherwise.
   */
  bool NeedToPrintSeed();

  /**
   * @brief Set whether the seed value needs to be printed.
   * @param need_to_print_seed True if the seed value needs to be printed, false otherwise.
   */
  void SetNeedToPrintSeed(bool need_to_print_seed);

  /**
   * @brief Advance the process seed and return it.
   * @return The next value, in [1, 2147483646].
   */
  static long Rand();

  /**
   * @brief Get the singleton instance of the Seed class.
   * @return The reference to the singleton instance of the Seed class.
   */
  static Seed &getInstance() {
    static Seed instance;
    return instance;
  }

private:
  bool need_to_print_seed_; ///< Flag indicating whether the seed value needs to be printed.
  long seed_; ///< The current seed value.
};

} // namespace rollkit::utils::seed
