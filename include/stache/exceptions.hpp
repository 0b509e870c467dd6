#ifndef INCLUDE_STACHE_EXCEPTIONS_HPP_
#define INCLUDE_STACHE_EXCEPTIONS_HPP_

#include <cstddef>
#include <stdexcept>
#include <string>

namespace stache {

struct SourceLocation {
  size_t line;
  size_t column;
};

struct StacheError : public std::runtime_error {
  const std::string type;
  const std::string message;

  const SourceLocation location;

  explicit StacheError(const std::string& type, const std::string& message)
      : std::runtime_error("[stache.exception." + type + "] " + message), type(type), message(message), location({0, 0}) {}

  explicit StacheError(const std::string& type, const std::string& message, SourceLocation location, const std::string& what)
      : std::runtime_error(what), type(type), message(message), location(location) {}
};

/*!
 * \brief Raised for every template syntax error and for partials that cannot be resolved.
 *
 * what() reads "line <n>: <message>", which is also the text the convenience
 * render functions return in place of output.
 */
struct ParseError : public StacheError {
  explicit ParseError(const std::string& message, SourceLocation location)
      : StacheError("parse_error", message, location, "line " + std::to_string(location.line) + ": " + message) {}

  size_t line() const {
    return location.line;
  }
};

struct FileError : public StacheError {
  explicit FileError(const std::string& message): StacheError("file_error", message) {}
};

/*!
 * \brief A name lookup that failed during rendering.
 *
 * Lookup failures never abort a render; they are collected and handed to the
 * diagnostic callback instead.
 */
struct RenderErrorInfo {
  std::string message;
  std::string name;
  SourceLocation location;

  RenderErrorInfo(const std::string& message, const std::string& name, SourceLocation location)
      : message(message), name(name), location(location) {}
};

} // namespace stache

#endif // INCLUDE_STACHE_EXCEPTIONS_HPP_
