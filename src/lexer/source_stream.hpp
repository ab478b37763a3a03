#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace rollkit::lexer {
/**
 * @brief Class representing a character stream over an expression's source.
 */
class SourceStream {
public:
  /**
   * @brief Constructs a SourceStream over a copy of the given text.
   * @param source The expression text.
   */
  explicit SourceStream(std::string_view source);

  /**
   * @brief Gets the next character from the stream.
   * @return The next character as an unsigned char value, or EOF at the end.
   */
  int GetChar();

  /**
   * @brief Gets the rest of a word whose first character was already read.
   * @param first The first character of the word.
   * @param Predicate Returns non-zero for characters that continue the word.
   * @return The whole word.
   */
  std::string GetWord(int first, int (*Predicate)(int));

  /**
   * @brief Pushes the last read character back into the stream.
   */
  void Ungetch();

  /**
   * @brief Returns the unread remainder of the source.
   */
  std::string_view Rest() const;

  /**
   * @brief Skips `count` characters.
   */
  void Skip(std::size_t count);

  /**
   * @brief Returns the byte offset of the next character.
   */
  std::size_t GetOffset() const { return offset_; }

private:
  std::string source_; /**< The expression text. */
  std::size_t offset_; /**< Offset of the next unread character. */
};

} // namespace rollkit::lexer
