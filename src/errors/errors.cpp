#include "errors.hpp"

#include <fmt/core.h>

namespace rollkit::errors {

namespace {
std::string DescribeCharacter(char character) {
  switch (character) {
  case '\t':
    return "'\\t'";
  case '\n':
    return "'\\n'";
  case '\r':
    return "'\\r'";
  default:
    break;
  }
  auto code = static_cast<unsigned char>(character);
  if (code < 0x20 || code >= 0x7f) {
    return fmt::format("byte 0x{:02x}", code);
  }
  return fmt::format("'{}'", character);
}
} // namespace

std::string KindToString(EvalErrorKind kind) {
  switch (kind) {
  case EvalErrorKind::kLengthMismatch:
    return "LengthMismatch";
  case EvalErrorKind::kNonScalarListElement:
    return "NonScalarListElement";
  case EvalErrorKind::kInvalidStep:
    return "InvalidStep";
  case EvalErrorKind::kStrongWrapOfScalar:
    return "StrongWrapOfScalar";
  case EvalErrorKind::kNegativeDiceCount:
    return "NegativeDiceCount";
  case EvalErrorKind::kInvalidSides:
    return "InvalidSides";
  case EvalErrorKind::kEmptyFaceList:
    return "EmptyFaceList";
  case EvalErrorKind::kExpectedList:
    return "ExpectedList";
  case EvalErrorKind::kExpectedInteger:
    return "ExpectedInteger";
  case EvalErrorKind::kCountOutOfRange:
    return "CountOutOfRange";
  case EvalErrorKind::kListTooLarge:
    return "ListTooLarge";
  case EvalErrorKind::kUnknownFunction:
    return "UnknownFunction";
  case EvalErrorKind::kInvalidArguments:
    return "InvalidArguments";
  case EvalErrorKind::kFunctionError:
    return "FunctionError";
  case EvalErrorKind::kInvalidDraw:
    return "InvalidDraw";
  }
  return "Unknown";
}

Error::Error(const std::string &message) : std::runtime_error(message) {}

LexError::LexError(char character, std::size_t position)
    : Error(fmt::format("column {}: unexpected character {}", position + 1,
                        DescribeCharacter(character))),
      character_(character), position_(position) {}

ParseError::ParseError(std::size_t position, const std::string &expected,
                       const std::string &found)
    : Error(fmt::format("column {}: expected {}, found {}", position + 1,
                        expected, found)),
      position_(position), expected_(expected), found_(found) {}

EvalError::EvalError(EvalErrorKind kind, const std::string &message)
    : Error(fmt::format("{}: {}", KindToString(kind), message)), kind_(kind) {}

} // namespace rollkit::errors
