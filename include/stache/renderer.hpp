#ifndef INCLUDE_STACHE_RENDERER_HPP_
#define INCLUDE_STACHE_RENDERER_HPP_

#include <cstddef>
#include <exception>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "exceptions.hpp"
#include "node.hpp"
#include "resolver.hpp"
#include "template.hpp"
#include "value.hpp"

namespace stache {

/*!
@brief Escapes HTML
*/
inline std::string htmlescape(const std::string& data) {
  std::string buffer;
  buffer.reserve(static_cast<size_t>(1.1 * data.size()));
  for (size_t pos = 0; pos != data.size(); ++pos) {
    switch (data[pos]) {
      case '&':  buffer.append("&amp;");       break;
      case '\"': buffer.append("&quot;");      break;
      case '\'': buffer.append("&apos;");      break;
      case '<':  buffer.append("&lt;");        break;
      case '>':  buffer.append("&gt;");        break;
      default:   buffer.append(&data[pos], 1); break;
    }
  }
  return buffer;
}

/*!
 * \brief Converts a value to json; records and callables become null.
 */
inline json to_json(const Value& value) {
  switch (value.kind()) {
  case Value::Kind::Data:
    return value.as_data();
  case Value::Kind::List: {
    json result = json::array();
    for (const auto& item : value.as_list()) {
      result.push_back(to_json(item));
    }
    return result;
  }
  case Value::Kind::Map: {
    json result = json::object();
    for (const auto& [key, item] : value.as_map()) {
      result[key] = to_json(item);
    }
    return result;
  }
  case Value::Kind::Record:
  case Value::Kind::Callable:
    return nullptr;
  }
  return nullptr;
}

/*!
 * \brief Text a value prints as in a variable tag.
 */
inline std::string to_string(const Value& value) {
  switch (value.kind()) {
  case Value::Kind::Data: {
    const json& data = value.as_data();
    if (data.is_string()) {
      return data.get_ref<const json::string_t&>();
    } else if (data.is_null()) {
      return {};
    }
    return data.dump(-1, ' ', false, json::error_handler_t::replace);
  }
  case Value::Kind::List:
  case Value::Kind::Map:
    return to_json(value).dump(-1, ' ', false, json::error_handler_t::replace);
  case Value::Kind::Record: {
    const Record* record = value.as_record();
    return (record != nullptr) ? record->to_string() : std::string {};
  }
  case Value::Kind::Callable:
    return {};
  }
  return {};
}

/*!
 * \brief Class for rendering a Template with a context chain.
 */
class Renderer : public NodeVisitor {
  const RenderConfig config;

  const Template* current_template;
  std::ostream* output_stream;

  ContextChain chain;
  Resolver resolver;
  SourceLocation current_location {0, 0};

  std::vector<RenderErrorInfo> render_errors;

  /// Undefined, null, false and zero-length collections skip a section
  static bool is_empty(const std::optional<Value>& value) {
    if (!value) {
      return true;
    }
    switch (value->kind()) {
    case Value::Kind::Data: {
      const json& data = value->as_data();
      if (data.is_null()) {
        return true;
      } else if (data.is_boolean()) {
        return !data.get<bool>();
      } else if (data.is_array()) {
        return data.empty();
      }
      return false;
    }
    case Value::Kind::List:
      return value->as_list().empty();
    case Value::Kind::Record:
      return value->as_record() == nullptr;
    case Value::Kind::Map:
    case Value::Kind::Callable:
      return false;
    }
    return false;
  }

  void emit_event(InstrumentationEvent event) {
    if (config.instrumentation_callback) {
      config.instrumentation_callback(InstrumentationData(event));
    }
  }

  void emit_event(InstrumentationEvent event, const std::string& name, const std::string& detail = "", size_t count = 0) {
    if (config.instrumentation_callback) {
      config.instrumentation_callback(InstrumentationData(event, name, detail, count));
    }
  }

  void report_lookup_failure(std::string_view name, const std::string& message) {
    RenderErrorInfo error("lookup of '" + static_cast<std::string>(name) + "' failed: " + message, static_cast<std::string>(name), current_location);
    emit_event(InstrumentationEvent::LookupFailed, error.name, message);
    if (config.diagnostic_callback) {
      config.diagnostic_callback(error);
    }
    render_errors.push_back(std::move(error));
  }

  std::optional<Value> resolve(const std::string& name, SourceLocation location) {
    current_location = location;
    return resolver.resolve(chain, name);
  }

  void render_in_scope(const Value& frame, const BlockNode& block) {
    chain.push_back(&frame);
    block.accept(*this);
    chain.pop_back();
  }

  void visit(const BlockNode& node) override {
    for (const auto& n : node.nodes) {
      n->accept(*this);
    }
  }

  void visit(const TextNode& node) override {
    output_stream->write(current_template->content.c_str() + node.pos, static_cast<std::streamsize>(node.length));
  }

  void visit(const VariableNode& node) override {
    const auto value = resolve(node.name, node.location);
    if (!value) {
      return;
    }

    // Record::to_string is user code; a failure prints nothing for this tag
    std::string text;
    try {
      text = to_string(*value);
    } catch (const std::exception& e) {
      report_lookup_failure(node.name, e.what());
      return;
    } catch (...) {
      report_lookup_failure(node.name, "unknown exception");
      return;
    }

    if (node.escape) {
      *output_stream << htmlescape(text);
    } else {
      *output_stream << text;
    }
  }

  void visit(const SectionNode& node) override {
    const auto value = resolve(node.name, node.location);
    if (is_empty(value) != node.inverted) {
      return;
    }

    if (node.inverted) {
      emit_event(InstrumentationEvent::SectionStart, node.name, "inverted", 1);
      node.block.accept(*this);
      emit_event(InstrumentationEvent::SectionEnd, node.name, "inverted", 1);
      return;
    }

    switch (value->kind()) {
    case Value::Kind::Data: {
      const json& data = value->as_data();
      if (data.is_array()) {
        emit_event(InstrumentationEvent::SectionStart, node.name, "list", data.size());
        for (const auto& item : data) {
          const Value frame(item);
          render_in_scope(frame, node.block);
        }
        emit_event(InstrumentationEvent::SectionEnd, node.name, "list", data.size());
      } else if (data.is_object()) {
        emit_event(InstrumentationEvent::SectionStart, node.name, "map", 1);
        render_in_scope(*value, node.block);
        emit_event(InstrumentationEvent::SectionEnd, node.name, "map", 1);
      } else {
        emit_event(InstrumentationEvent::SectionStart, node.name, "scalar", 1);
        node.block.accept(*this);
        emit_event(InstrumentationEvent::SectionEnd, node.name, "scalar", 1);
      }
    } break;
    case Value::Kind::List: {
      const auto& list = value->as_list();
      emit_event(InstrumentationEvent::SectionStart, node.name, "list", list.size());
      for (const auto& item : list) {
        render_in_scope(item, node.block);
      }
      emit_event(InstrumentationEvent::SectionEnd, node.name, "list", list.size());
    } break;
    case Value::Kind::Map:
    case Value::Kind::Record: {
      const std::string kind = value->is_map() ? "map" : "record";
      emit_event(InstrumentationEvent::SectionStart, node.name, kind, 1);
      render_in_scope(*value, node.block);
      emit_event(InstrumentationEvent::SectionEnd, node.name, kind, 1);
    } break;
    case Value::Kind::Callable: {
      emit_event(InstrumentationEvent::SectionStart, node.name, "scalar", 1);
      node.block.accept(*this);
      emit_event(InstrumentationEvent::SectionEnd, node.name, "scalar", 1);
    } break;
    }
  }

  void visit(const PartialNode& node) override {
    emit_event(InstrumentationEvent::PartialStart, node.name, node.path.string());

    const Template* parent_template = current_template;
    current_template = node.partial.get();
    current_template->root.accept(*this);
    current_template = parent_template;

    emit_event(InstrumentationEvent::PartialEnd, node.name, node.path.string());
  }

public:
  explicit Renderer(const RenderConfig& config)
      : config(config), current_template(nullptr), output_stream(nullptr),
        resolver([this](std::string_view name, const std::string& message) { report_lookup_failure(name, message); }) {}

  Renderer(const Renderer&) = delete;
  Renderer& operator=(const Renderer&) = delete;

  /*!
   * \brief Renders tmpl to os.
   *
   * contexts are ordered innermost first: names are looked up in contexts[0]
   * before contexts[1], and so on.
   */
  void render_to(std::ostream& os, const Template& tmpl, const ValueList& contexts) {
    output_stream = &os;
    current_template = &tmpl;

    chain.clear();
    for (auto it = contexts.rbegin(); it != contexts.rend(); ++it) {
      chain.push_back(&(*it));
    }

    emit_event(InstrumentationEvent::RenderStart);
    current_template->root.accept(*this);
    emit_event(InstrumentationEvent::RenderEnd);
  }

  const std::vector<RenderErrorInfo>& get_render_errors() const {
    return render_errors;
  }

  void clear_render_errors() {
    render_errors.clear();
  }
};

} // namespace stache

#endif // INCLUDE_STACHE_RENDERER_HPP_
