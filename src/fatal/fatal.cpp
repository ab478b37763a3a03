#include "fatal.hpp"

#include "../errors/errors.hpp"
#include <cstdlib>
#include <fmt/core.h>
#include <iostream>

namespace rollkit::loger {
static constexpr std::string_view kLexError = "lex error: ";
static constexpr std::string_view kParseError = "parse error: ";
static constexpr std::string_view kEvalError = "evaluation error: ";

static int nr_errs = 0;

void non_fatal(const std::string_view &s1,
               const std::optional<std::string> &s2) {
  std::string extra = s2.has_value() ? fmt::format(" {}", s2.value()) : "";
  std::cout << fmt::format("rollkit: Error: {}{}", s1, extra);
  std::cout << std::endl;
  nr_errs++;
}

void fatal(const std::string_view &s1, const std::optional<std::string> &s2) {
  non_fatal(s1, s2);
  std::exit(2);
}

int GetErrorCount() { return nr_errs; }

void ResetErrorCount() { nr_errs = 0; }

std::string explainToString(const std::exception &error) {
  if (dynamic_cast<const errors::LexError *>(&error) != nullptr) {
    return fmt::format("{}{}", kLexError, error.what());
  }
  if (dynamic_cast<const errors::ParseError *>(&error) != nullptr) {
    return fmt::format("{}{}", kParseError, error.what());
  }
  if (dynamic_cast<const errors::EvalError *>(&error) != nullptr) {
    return fmt::format("{}{}", kEvalError, error.what());
  }
  return error.what();
}

} // namespace rollkit::loger
