#ifndef INCLUDE_STACHE_RESOLVER_HPP_
#define INCLUDE_STACHE_RESOLVER_HPP_

#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "value.hpp"

namespace stache {

/*!
 * \brief The stack of scopes a name is resolved against.
 *
 * The innermost scope is at the back. Frames point into the caller's contexts
 * or into values owned by the section currently being rendered.
 */
using ContextChain = std::vector<const Value*>;

/*!
 * \brief Resolves (possibly dotted) names against a context chain.
 */
class Resolver {
public:
  using FailureHandler = std::function<void(std::string_view name, const std::string& message)>;

private:
  FailureHandler on_failure;

  static std::optional<Value> lookup(const Value& value, std::string_view name) {
    switch (value.kind()) {
    case Value::Kind::Record: {
      const Record* record = value.as_record();
      if (record == nullptr) {
        return std::nullopt;
      }
      if (auto result = record->invoke(name)) {
        return result;
      }
      return record->field(name);
    }
    case Value::Kind::Map: {
      const auto& map = value.as_map();
      const auto it = map.find(name);
      if (it != map.end()) {
        return it->second;
      }
      return std::nullopt;
    }
    case Value::Kind::Data: {
      const json& data = value.as_data();
      if (data.is_object()) {
        const auto it = data.find(static_cast<std::string>(name));
        if (it != data.end()) {
          return Value(*it);
        }
      }
      return std::nullopt;
    }
    case Value::Kind::List:
    case Value::Kind::Callable:
      return std::nullopt;
    }
    return std::nullopt;
  }

  static Value call_if_callable(Value value) {
    if (value.is_callable()) {
      return value.as_callable()();
    }
    return value;
  }

  std::optional<Value> resolve_simple(const ContextChain& chain, std::string_view name) const {
    try {
      if (name == ".") {
        if (chain.empty()) {
          return std::nullopt;
        }
        return call_if_callable(*chain.back());
      }

      for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        if (auto result = lookup(**it, name)) {
          return call_if_callable(std::move(*result));
        }
      }
    } catch (const std::exception& e) {
      if (on_failure) {
        on_failure(name, e.what());
      }
    } catch (...) {
      if (on_failure) {
        on_failure(name, "unknown exception");
      }
    }
    return std::nullopt;
  }

public:
  explicit Resolver(FailureHandler on_failure = nullptr): on_failure(std::move(on_failure)) {}

  /*!
   * \brief Returns the value for name, or std::nullopt if the name is undefined.
   *
   * A dotted name resolves its first part against the whole chain and the
   * rest against that result only. Exceptions thrown while looking a name up
   * of any type are passed to the failure handler and leave the name undefined.
   */
  std::optional<Value> resolve(const ContextChain& chain, std::string_view name) const {
    const auto dot = name.find('.');
    if (name == "." || dot == std::string_view::npos) {
      return resolve_simple(chain, name);
    }

    const auto head = resolve_simple(chain, name.substr(0, dot));
    if (!head) {
      return std::nullopt;
    }
    const ContextChain scope {&*head};
    return resolve(scope, name.substr(dot + 1));
  }
};

} // namespace stache

#endif // INCLUDE_STACHE_RESOLVER_HPP_
