#pragma once

namespace rollkit::utils::verbose {
/**
 * @class Flags
 * @brief Controls verbosity flags for printing extra information.
 *
 * The Flags class allows controlling the verbosity flags of the driver. Use
 * the provided setter methods to enable specific flags and Reset() to clear
 * them.
 */
class Flags {
private:
  /**
   * @brief Default constructor. All flags start cleared.
   */
  Flags();

  Flags(const Flags &other) = delete;
  Flags &operator=(const Flags &other) = delete;

public:
  /**
   * @brief Check if the flag to print the parsed form of each expression is
   * active.
   * @return True if the flag is active, false otherwise.
   */
  bool NeedToPrintVerbose();

  /**
   * @brief Check if the flag to print the structure of each expression is
   * active.
   * @return True if the flag is active, false otherwise.
   */
  bool NeedToPrintExplanation();

  /**
   * @brief Clear every flag.
   */
  void Reset();

  /**
   * @brief Set the flag to print the parsed form of each expression.
   */
  void SetNeedToPrintVerbose();

  /**
   * @brief Set the flag to print the structure of each expression.
   */
  void SetNeedToPrintExplanation();

  static Flags &getInstance() {
    static Flags instance;
    return instance;
  }

private:
  bool need_to_print_verbose_;
  bool need_to_print_explanation_;
};

} // namespace rollkit::utils::verbose
