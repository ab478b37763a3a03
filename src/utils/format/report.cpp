#include "report.hpp"

#include <fmt/core.h>

namespace rollkit::format {

std::string FormatResult(const models::Value &value) {
  if (value.IsInteger()) {
    return fmt::format("{}", value.GetInteger());
  }
  return fmt::format("{} (from list with {} elements: {{{}}})", value.Sum(),
                     value.GetElements().size(),
                     models::JoinElements(value.GetElements()));
}

} // namespace rollkit::format
