#ifndef INCLUDE_STACHE_LEXER_HPP_
#define INCLUDE_STACHE_LEXER_HPP_

#include <cstddef>
#include <string_view>

#include "exceptions.hpp"

namespace stache {

/*!
 * \brief Scans template text for delimiters.
 *
 * The lexer knows nothing about tags; the parser asks it for the text up to
 * the next marker it is interested in.
 */
class Lexer {
  std::string_view input;
  size_t pos {0};
  size_t current_line {1};
  size_t line_start {0};

  void advance_to(size_t target) {
    for (; pos < target; ++pos) {
      if (input[pos] == '\n') {
        ++current_line;
        line_start = pos + 1;
      }
    }
  }

public:
  struct Chunk {
    std::string_view text;
    size_t pos;

    /// Where the marker starts, or the end of the input
    SourceLocation marker_location;
    bool end_of_input;
  };

  void start(std::string_view in) {
    input = in;
    pos = 0;
    current_line = 1;
    line_start = 0;
  }

  /*!
   * \brief Returns the text before the next occurrence of marker and moves past the marker.
   *
   * If the marker does not occur, the rest of the input is returned and
   * end_of_input is set.
   */
  Chunk read_until(std::string_view marker) {
    const size_t start = pos;
    const size_t found = input.find(marker, pos);
    const bool end_of_input = (found == std::string_view::npos);
    const size_t end = end_of_input ? input.size() : found;

    advance_to(end);
    Chunk chunk {input.substr(start, end - start), start, location(), end_of_input};
    if (!end_of_input) {
      advance_to(end + marker.size());
    }
    return chunk;
  }

  /// Consumes one "\n" or "\r\n" at the read position
  void skip_line_break() {
    if (pos < input.size() && input[pos] == '\n') {
      advance_to(pos + 1);
    } else if (pos + 1 < input.size() && input[pos] == '\r' && input[pos + 1] == '\n') {
      advance_to(pos + 2);
    }
  }

  char peek() const {
    return (pos < input.size()) ? input[pos] : '\0';
  }

  bool at_end() const {
    return pos >= input.size();
  }

  size_t position() const {
    return pos;
  }

  size_t line() const {
    return current_line;
  }

  SourceLocation location() const {
    return {current_line, pos - line_start + 1};
  }
};

} // namespace stache

#endif // INCLUDE_STACHE_LEXER_HPP_
