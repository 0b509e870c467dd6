#ifndef INCLUDE_STACHE_CONFIG_HPP_
#define INCLUDE_STACHE_CONFIG_HPP_

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "exceptions.hpp"

namespace stache {

/*!
 * \brief Events emitted by the renderer while it walks a template.
 */
enum class InstrumentationEvent {
  RenderStart,
  RenderEnd,
  SectionStart,
  SectionEnd,
  PartialStart,
  PartialEnd,
  LookupFailed,
};

struct InstrumentationData {
  InstrumentationEvent event;
  std::string name;
  std::string detail;
  size_t count {0};

  explicit InstrumentationData(InstrumentationEvent event): event(event) {}
  InstrumentationData(InstrumentationEvent event, const std::string& name): event(event), name(name) {}
  InstrumentationData(InstrumentationEvent event, const std::string& name, const std::string& detail): event(event), name(name), detail(detail) {}
  InstrumentationData(InstrumentationEvent event, const std::string& name, const std::string& detail, size_t count)
      : event(event), name(name), detail(detail), count(count) {}
};

using InstrumentationCallback = std::function<void(const InstrumentationData& data)>;

/*!
 * \brief Type for the diagnostics sink.
 *
 * Called once for every name lookup that failed during rendering (a record
 * method or callable that threw, for example). The render itself continues
 * and treats the name as undefined.
 */
using DiagnosticCallback = std::function<void(const RenderErrorInfo& error)>;

/*!
 * \brief Class for lexer configuration.
 */
struct LexerConfig {
  std::string open_delimiter {"{{"};
  std::string close_delimiter {"}}"};
};

/*!
 * \brief Class for parser configuration.
 */
struct ParserConfig {
  /// Suffixes tried after the bare partial name, in order
  std::vector<std::string> partial_extensions {".mustache", ".stache"};

  /// Whether partials are also looked up relative to the working directory
  bool search_working_directory {true};
};

/*!
 * \brief Class for render configuration.
 */
struct RenderConfig {
  DiagnosticCallback diagnostic_callback;
  InstrumentationCallback instrumentation_callback;
};

} // namespace stache

#endif // INCLUDE_STACHE_CONFIG_HPP_
