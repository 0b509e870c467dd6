#ifndef INCLUDE_STACHE_VALUE_HPP_
#define INCLUDE_STACHE_VALUE_HPP_

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "json.hpp"

namespace stache {

class Record;
class Value;

using ValueList = std::vector<Value>;
// std::map with an incomplete mapped type is not guaranteed by the standard
// (only vector, list and forward_list are); libstdc++, libc++ and MSVC accept it
using ValueMap = std::map<std::string, Value, std::less<>>;
using Callable = std::function<Value()>;
using RecordPointer = std::shared_ptr<const Record>;

namespace detail {

template <typename T> struct is_shared_ptr : std::false_type {};
template <typename T> struct is_shared_ptr<std::shared_ptr<T>> : std::true_type {};

template <typename T>
using is_value_alternative = std::disjunction<std::is_same<T, Value>, std::is_same<T, ValueList>, std::is_same<T, ValueMap>, std::is_same<T, Callable>, is_shared_ptr<T>>;

// Checked lazily so that json's converting constructors are never asked about our own types
template <typename T>
using is_json_compatible = std::conjunction<std::negation<is_value_alternative<T>>, std::negation<std::is_invocable<T&>>, std::is_constructible<json, T>>;

template <typename T>
using is_callable_compatible = std::conjunction<std::negation<is_value_alternative<T>>, std::is_invocable<T&>>;

} // namespace detail

/*!
 * \brief A value that can be placed on the context chain.
 *
 * Every value has exactly one kind. Plain data (objects, arrays, strings,
 * numbers, booleans and null) is kept as json; lists and maps of arbitrary
 * values, records and callables cover everything json cannot hold.
 */
class Value {
public:
  enum class Kind {
    Data,
    List,
    Map,
    Record,
    Callable,
  };

  Value(): data_(std::in_place_type<json>) {}

  template <typename T, typename std::enable_if_t<detail::is_json_compatible<std::decay_t<T>>::value, int> = 0>
  Value(T&& data): data_(std::in_place_type<json>, std::forward<T>(data)) {}

  Value(ValueList list): data_(std::in_place_type<ValueList>, std::move(list)) {}

  Value(ValueMap map): data_(std::in_place_type<ValueMap>, std::move(map)) {}

  template <typename R, typename std::enable_if_t<std::is_base_of_v<Record, R>, int> = 0>
  Value(std::shared_ptr<R> record): data_(std::in_place_type<RecordPointer>, std::move(record)) {}

  template <typename F, typename std::enable_if_t<detail::is_callable_compatible<std::decay_t<F>>::value, int> = 0>
  Value(F&& callable): data_(std::in_place_type<Callable>, std::forward<F>(callable)) {}

  Value(Callable callable): data_(std::in_place_type<Callable>, std::move(callable)) {}

  Kind kind() const {
    return static_cast<Kind>(data_.index());
  }

  bool is_data() const {
    return kind() == Kind::Data;
  }

  bool is_list() const {
    return kind() == Kind::List;
  }

  bool is_map() const {
    return kind() == Kind::Map;
  }

  bool is_record() const {
    return kind() == Kind::Record;
  }

  bool is_callable() const {
    return kind() == Kind::Callable;
  }

  const json& as_data() const {
    return std::get<json>(data_);
  }

  const ValueList& as_list() const {
    return std::get<ValueList>(data_);
  }

  const ValueMap& as_map() const {
    return std::get<ValueMap>(data_);
  }

  /// Null when the value holds an empty record pointer
  const Record* as_record() const {
    return std::get<RecordPointer>(data_).get();
  }

  const Callable& as_callable() const {
    return std::get<Callable>(data_);
  }

private:
  std::variant<json, ValueList, ValueMap, RecordPointer, Callable> data_;
};

/*!
 * \brief Base class for user types exposed to templates.
 *
 * A record answers names with its zero-argument methods first and its fields
 * second. Returning std::nullopt means "no such name"; the resolver then moves
 * on to the next frame of the context chain. Both functions may throw, a
 * failure is reported and treated as an undefined name.
 */
class Record {
public:
  virtual ~Record() = default;

  virtual std::optional<Value> field(std::string_view name) const = 0;

  virtual std::optional<Value> invoke(std::string_view /* name */) const {
    return std::nullopt;
  }

  /// Text printed when the record itself is used as a variable
  virtual std::string to_string() const {
    return {};
  }
};

} // namespace stache

#endif // INCLUDE_STACHE_VALUE_HPP_
