#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

/**
 * @file
 * @brief Exception types raised while lexing, parsing and evaluating dice
 * expressions.
 */

namespace rollkit::errors {

/**
 * @brief Closed set of evaluation failure kinds.
 */
enum class EvalErrorKind {
  kLengthMismatch,
  kNonScalarListElement,
  kInvalidStep,
  kStrongWrapOfScalar,
  kNegativeDiceCount,
  kInvalidSides,
  kEmptyFaceList,
  kExpectedList,
  kExpectedInteger,
  kCountOutOfRange,
  kListTooLarge,
  kUnknownFunction,
  kInvalidArguments,
  kFunctionError,
  kInvalidDraw
};

/**
 * @brief Converts an evaluation error kind to its name.
 * @param kind The kind to convert.
 * @return The name of the kind, e.g. "LengthMismatch".
 */
std::string KindToString(EvalErrorKind kind);

/**
 * @brief Base class of every error raised by the library.
 */
class Error : public std::runtime_error {
public:
  explicit Error(const std::string &message);
};

/**
 * @brief Raised by the lexer on a character it cannot start a token with.
 */
class LexError : public Error {
public:
  /**
   * @brief Constructs a LexError.
   * @param character The offending character.
   * @param position Byte offset of the character in the source.
   */
  LexError(char character, std::size_t position);

  char GetCharacter() const { return character_; }
  std::size_t GetPosition() const { return position_; }

private:
  char character_;
  std::size_t position_;
};

/**
 * @brief Raised by the parser on a malformed expression.
 */
class ParseError : public Error {
public:
  /**
   * @brief Constructs a ParseError.
   * @param position Byte offset of the offending token.
   * @param expected Description of the construct the parser wanted.
   * @param found Description of what it saw instead.
   */
  ParseError(std::size_t position, const std::string &expected,
             const std::string &found);

  std::size_t GetPosition() const { return position_; }
  const std::string &GetExpected() const { return expected_; }
  const std::string &GetFound() const { return found_; }

private:
  std::size_t position_;
  std::string expected_;
  std::string found_;
};

/**
 * @brief Raised by the evaluator and by registered functions.
 */
class EvalError : public Error {
public:
  /**
   * @brief Constructs an EvalError.
   * @param kind The failure kind.
   * @param message Human-readable detail.
   */
  EvalError(EvalErrorKind kind, const std::string &message);

  EvalErrorKind GetKind() const { return kind_; }

private:
  EvalErrorKind kind_;
};

} // namespace rollkit::errors
