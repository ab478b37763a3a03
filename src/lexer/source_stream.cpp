#include "source_stream.hpp"

#include <algorithm>
#include <cstdio>

namespace rollkit::lexer {
SourceStream::SourceStream(std::string_view source)
    : source_(source), offset_(0) {}

int SourceStream::GetChar() {
  if (offset_ >= source_.size()) {
    offset_ = source_.size() + 1;
    return EOF;
  }
  return static_cast<unsigned char>(source_[offset_++]);
}

std::string SourceStream::GetWord(int first, int (*Predicate)(int)) {
  int curr;
  std::string result;
  result.push_back(static_cast<char>(first));

  while ((curr = GetChar()) != EOF && Predicate(curr)) {
    result.push_back(static_cast<char>(curr));
  }
  Ungetch();
  return result;
}

void SourceStream::Ungetch() {
  if (offset_ > 0) {
    offset_--;
  }
}

std::string_view SourceStream::Rest() const {
  if (offset_ >= source_.size()) {
    return {};
  }
  return std::string_view(source_).substr(offset_);
}

void SourceStream::Skip(std::size_t count) {
  offset_ = std::min(offset_ + count, source_.size());
}

} // namespace rollkit::lexer
