#ifndef INCLUDE_STACHE_ENVIRONMENT_HPP_
#define INCLUDE_STACHE_ENVIRONMENT_HPP_

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "config.hpp"
#include "exceptions.hpp"
#include "parser.hpp"
#include "renderer.hpp"
#include "template.hpp"
#include "throw.hpp"
#include "value.hpp"

namespace stache {

/*!
 * \brief The record a layout is rendered with, exposing the rendered content.
 */
class LayoutRecord : public Record {
  const std::string content;

public:
  explicit LayoutRecord(std::string content): content(std::move(content)) {}

  std::optional<Value> field(std::string_view name) const override {
    if (name == "content") {
      return Value(content);
    }
    return std::nullopt;
  }
};

/*!
 * \brief Class for changing the configuration, parsing and rendering.
 *
 * Thread-safety design:
 * - Setters lock a mutex; render works on a snapshot of the render config
 * - Templates are immutable after parsing and can be shared between threads
 * - Render errors are thread-local so each thread sees its own errors
 */
class Environment {
  // Mutex for coordinating configuration changes with renders
  mutable std::mutex write_mutex_;

  // Thread-local storage for render errors (each thread sees its own errors)
  static inline thread_local std::vector<RenderErrorInfo> tl_render_errors_;

protected:
  LexerConfig lexer_config;
  ParserConfig parser_config;
  RenderConfig render_config;

  std::filesystem::path input_path;

private:
  RenderConfig render_config_snapshot() const {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return render_config;
  }

  // Appends to the thread-local errors instead of replacing them
  void render_chain(std::ostream& os, const Template& tmpl, const ValueList& contexts, const RenderConfig& config) const {
    Renderer renderer(config);
    renderer.render_to(os, tmpl, contexts);

    const auto& errors = renderer.get_render_errors();
    tl_render_errors_.insert(tl_render_errors_.end(), errors.begin(), errors.end());
  }

public:
  Environment(): Environment("") {}

  explicit Environment(const std::filesystem::path& global_path): input_path(global_path) {}

  // Copy constructor - needed because std::mutex is not copyable
  Environment(const Environment& other) {
    std::lock_guard<std::mutex> lock(other.write_mutex_);
    lexer_config = other.lexer_config;
    parser_config = other.parser_config;
    render_config = other.render_config;
    input_path = other.input_path;
  }

  /// Get thread-local errors from the current thread's last render
  const std::vector<RenderErrorInfo>& get_last_render_errors() const {
    return tl_render_errors_;
  }

  /// Clear thread-local errors (done at the start of every render)
  void clear_render_errors() {
    tl_render_errors_.clear();
  }

  /// Sets the delimiters every template and partial starts with
  void set_delimiters(const std::string& open, const std::string& close) {
    validate_delimiters(open, close);
    std::lock_guard<std::mutex> lock(write_mutex_);
    lexer_config.open_delimiter = open;
    lexer_config.close_delimiter = close;
  }

  /// Sets the suffixes tried after the bare partial name
  void set_partial_extensions(const std::vector<std::string>& extensions) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    parser_config.partial_extensions = extensions;
  }

  /// Sets whether partials are also looked up relative to the working directory
  void set_search_working_directory(bool search) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    parser_config.search_working_directory = search;
  }

  /*!
   * \brief Sets the sink for lookup failures during rendering.
   *
   * Example:
   * @code
   * env.set_diagnostic_callback([](const stache::RenderErrorInfo& error) {
   *     std::cerr << error.location.line << ": " << error.message << '\n';
   * });
   * @endcode
   */
  void set_diagnostic_callback(const DiagnosticCallback& callback) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    render_config.diagnostic_callback = callback;
  }

  void clear_diagnostic_callback() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    render_config.diagnostic_callback = nullptr;
  }

  /*!
   * \brief Sets an instrumentation callback for receiving render events.
   *
   * The renderer emits events when a render starts and ends, for every
   * section it enters (with the kind of value and the number of iterations)
   * and for every partial it renders.
   */
  void set_instrumentation_callback(const InstrumentationCallback& callback) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    render_config.instrumentation_callback = callback;
  }

  void clear_instrumentation_callback() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    render_config.instrumentation_callback = nullptr;
  }

  /// Parses template text; partials are looked up relative to the environment path
  Template parse(std::string_view input) {
    LexerConfig lexer_snapshot;
    ParserConfig parser_snapshot;
    {
      std::lock_guard<std::mutex> lock(write_mutex_);
      lexer_snapshot = lexer_config;
      parser_snapshot = parser_config;
    }

    Parser parser(parser_snapshot, lexer_snapshot);
    return parser.parse(input, input_path);
  }

  /// Parses a template file; partials are looked up relative to the file's directory
  Template parse_file(const std::filesystem::path& filename) {
    LexerConfig lexer_snapshot;
    ParserConfig parser_snapshot;
    {
      std::lock_guard<std::mutex> lock(write_mutex_);
      lexer_snapshot = lexer_config;
      parser_snapshot = parser_config;
    }

    Parser parser(parser_snapshot, lexer_snapshot);
    return parser.parse_file(input_path / filename);
  }

  std::ostream& render_to(std::ostream& os, const Template& tmpl, const ValueList& contexts) {
    tl_render_errors_.clear();
    render_chain(os, tmpl, contexts, render_config_snapshot());
    return os;
  }

  template <typename... Contexts> std::string render(const Template& tmpl, const Contexts&... contexts) {
    std::ostringstream os;
    render_to(os, tmpl, ValueList {Value(contexts)...});
    return os.str();
  }

  template <typename... Contexts> std::string render(std::string_view input, const Contexts&... contexts) {
    return render(parse(input), contexts...);
  }

  template <typename... Contexts> std::string render_file(const std::filesystem::path& filename, const Contexts&... contexts) {
    return render(parse_file(filename), contexts...);
  }

  /*!
   * \brief Renders tmpl and then layout, with the result available as {{content}}.
   *
   * All contexts stay visible inside the layout, behind the content record.
   */
  template <typename... Contexts> std::string render_in_layout(const Template& tmpl, const Template& layout, const Contexts&... contexts) {
    const auto config = render_config_snapshot();
    tl_render_errors_.clear();

    ValueList chain {Value(contexts)...};
    std::ostringstream content;
    render_chain(content, tmpl, chain, config);

    chain.insert(chain.begin(), Value(std::make_shared<LayoutRecord>(content.str())));
    std::ostringstream os;
    render_chain(os, layout, chain, config);
    return os.str();
  }
};

/*!
@brief parse and render with default settings, returning the error text on failure
*/
template <typename... Contexts> inline std::string render(std::string_view input, const Contexts&... contexts) {
  Environment env;
  try {
    const Template tmpl = env.parse(input);
    return env.render(tmpl, contexts...);
  } catch (const StacheError& e) {
    return e.what();
  }
}

/*!
@brief render input inside layout with default settings, returning the error text on failure
*/
template <typename... Contexts> inline std::string render_in_layout(std::string_view input, std::string_view layout_input, const Contexts&... contexts) {
  Environment env;
  try {
    const Template layout = env.parse(layout_input);
    const Template tmpl = env.parse(input);
    return env.render_in_layout(tmpl, layout, contexts...);
  } catch (const StacheError& e) {
    return e.what();
  }
}

template <typename... Contexts> inline std::string render_file(const std::filesystem::path& filename, const Contexts&... contexts) {
  Environment env;
  try {
    const Template tmpl = env.parse_file(filename);
    return env.render(tmpl, contexts...);
  } catch (const StacheError& e) {
    return e.what();
  }
}

template <typename... Contexts> inline std::string render_file_in_layout(const std::filesystem::path& filename, const std::filesystem::path& layout_filename, const Contexts&... contexts) {
  Environment env;
  try {
    const Template layout = env.parse_file(layout_filename);
    const Template tmpl = env.parse_file(filename);
    return env.render_in_layout(tmpl, layout, contexts...);
  } catch (const StacheError& e) {
    return e.what();
  }
}

} // namespace stache

#endif // INCLUDE_STACHE_ENVIRONMENT_HPP_
