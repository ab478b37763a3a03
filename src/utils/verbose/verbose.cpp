#include "verbose.hpp"

namespace rollkit::utils::verbose {

Flags::Flags()
    : need_to_print_verbose_(false), need_to_print_explanation_(false) {}

bool Flags::NeedToPrintVerbose() { return need_to_print_verbose_; }

bool Flags::NeedToPrintExplanation() { return need_to_print_explanation_; }

void Flags::Reset() {
  need_to_print_verbose_ = false;
  need_to_print_explanation_ = false;
}

void Flags::SetNeedToPrintVerbose() { need_to_print_verbose_ = true; }

void Flags::SetNeedToPrintExplanation() { need_to_print_explanation_ = true; }

} // namespace rollkit::utils::verbose
