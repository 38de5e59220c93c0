#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "ctxopt/core/error.hpp"

namespace ctxopt::script {

/// Script objects keep insertion order, so their JSON form does too.
using json = nlohmann::ordered_json;

/// Deepest array or object nesting that conversions, joins and flattening
/// will descend into.
inline constexpr std::size_t kMaxNesting = 512;

class Interpreter;
class Scope;
struct Array;
struct Object;
struct Function;
struct FunctionNode;

struct Undefined {
    auto operator==(const Undefined&) const -> bool = default;
};

struct Null {
    auto operator==(const Null&) const -> bool = default;
};

/// A script value. Objects, arrays and functions live in the Heap and are
/// referenced by raw pointer; a Value never owns them.
class Value {
public:
    using Storage = std::variant<Undefined, Null, bool, double, std::string,
                                 Array*, Object*, Function*>;

    Value() = default;
    Value(Null) : data_(Null{}) {}
    Value(bool b) : data_(b) {}

    template <typename T>
        requires(std::is_arithmetic_v<T> && !std::is_same_v<T, bool>)
    Value(T n) : data_(static_cast<double>(n)) {}

    Value(std::string s) : data_(std::move(s)) {}
    Value(std::string_view s) : data_(std::string(s)) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(Array* a) : data_(a) {}
    Value(Object* o) : data_(o) {}
    Value(Function* f) : data_(f) {}

    [[nodiscard]] auto is_undefined() const -> bool { return std::holds_alternative<Undefined>(data_); }
    [[nodiscard]] auto is_null() const -> bool { return std::holds_alternative<Null>(data_); }
    [[nodiscard]] auto is_nullish() const -> bool { return is_undefined() || is_null(); }
    [[nodiscard]] auto is_bool() const -> bool { return std::holds_alternative<bool>(data_); }
    [[nodiscard]] auto is_number() const -> bool { return std::holds_alternative<double>(data_); }
    [[nodiscard]] auto is_string() const -> bool { return std::holds_alternative<std::string>(data_); }
    [[nodiscard]] auto is_array() const -> bool { return std::holds_alternative<Array*>(data_); }
    [[nodiscard]] auto is_object() const -> bool { return std::holds_alternative<Object*>(data_); }
    [[nodiscard]] auto is_function() const -> bool { return std::holds_alternative<Function*>(data_); }

    [[nodiscard]] auto as_bool() const -> bool { return std::get<bool>(data_); }
    [[nodiscard]] auto as_number() const -> double { return std::get<double>(data_); }
    [[nodiscard]] auto as_string() const -> const std::string& { return std::get<std::string>(data_); }
    [[nodiscard]] auto as_array() const -> Array* { return std::get<Array*>(data_); }
    [[nodiscard]] auto as_object() const -> Object* { return std::get<Object*>(data_); }
    [[nodiscard]] auto as_function() const -> Function* { return std::get<Function*>(data_); }

    [[nodiscard]] auto storage() const -> const Storage& { return data_; }

private:
    Storage data_;
};

/// String-keyed property storage that remembers insertion order.
class PropertyMap {
public:
    [[nodiscard]] auto find(const std::string& key) const -> const Value*;
    auto find(const std::string& key) -> Value*;

    /// Stores `value` under `key`; returns true when the key is new.
    auto set(const std::string& key, Value value) -> bool;
    auto erase(const std::string& key) -> bool;

    [[nodiscard]] auto keys() const -> const std::vector<std::string>& { return keys_; }
    [[nodiscard]] auto size() const -> std::size_t { return keys_.size(); }

private:
    std::vector<std::string> keys_;
    std::unordered_map<std::string, Value> values_;
};

struct Object {
    PropertyMap properties;
    bool frozen = false;
    /// Set for values built by the Error family; they print as their message.
    bool is_error = false;
};

struct Array {
    std::vector<Value> items;
    bool frozen = false;
};

using NativeFn = std::function<Value(Interpreter& interp, const Value& self,
                                     std::vector<Value>& args)>;

struct Function {
    std::string name;
    NativeFn native;
    const FunctionNode* node = nullptr;
    std::shared_ptr<Scope> closure;
    PropertyMap members;
    bool frozen = false;
};

// ---------------------------------------------------------------------------
// Heap
// ---------------------------------------------------------------------------

/// Owns every object, array and function created during one run and charges
/// allocations against a cumulative byte budget. Everything is released when
/// the heap is destroyed, so reference cycles between script values are
/// harmless.
class Heap {
public:
    explicit Heap(std::size_t limit_bytes);
    Heap(const Heap&) = delete;
    auto operator=(const Heap&) -> Heap& = delete;

    auto make_object() -> Object*;
    auto make_array(std::vector<Value> items = {}) -> Array*;
    auto make_native(std::string name, NativeFn fn) -> Function*;
    auto make_closure(const FunctionNode& node, std::shared_ptr<Scope> closure) -> Function*;

    /// Throws AbortError(MemoryLimit) once the budget is exhausted.
    void charge(std::size_t bytes);

    /// Like charge, but reports exhaustion instead of throwing.
    [[nodiscard]] auto try_charge(std::size_t bytes) noexcept -> bool;

    [[nodiscard]] auto used() const noexcept -> std::size_t { return used_; }
    [[nodiscard]] auto limit() const noexcept -> std::size_t { return limit_; }

private:
    std::size_t limit_;
    std::size_t used_ = 0;
    std::vector<std::unique_ptr<Object>> objects_;
    std::vector<std::unique_ptr<Array>> arrays_;
    std::vector<std::unique_ptr<Function>> functions_;
};

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------

/// A value thrown by script code or by a builtin; `catch` blocks bind it.
class ScriptException : public std::exception {
public:
    explicit ScriptException(Value value);

    [[nodiscard]] auto value() const -> const Value& { return value_; }
    [[nodiscard]] auto what() const noexcept -> const char* override { return message_.c_str(); }

private:
    Value value_;
    std::string message_;
};

/// Ends a run outright (timeout, memory). Script code cannot catch it.
class AbortError : public std::exception {
public:
    AbortError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto what() const noexcept -> const char* override { return message_.c_str(); }

private:
    ErrorCode code_;
    std::string message_;
};

/// Builds an Error-family object `{ name, message }`.
auto make_error_object(Heap& heap, std::string_view name, std::string message) -> Object*;

/// Throws a ScriptException carrying a fresh Error-family object.
[[noreturn]] void throw_error(Heap& heap, std::string_view name, std::string message);

// ---------------------------------------------------------------------------
// Conversions
// ---------------------------------------------------------------------------

/// Result of the `typeof` operator.
auto type_of(const Value& v) -> std::string_view;

auto is_truthy(const Value& v) -> bool;

auto to_number(const Value& v) -> double;

/// Integer conversion used by index arguments: NaN becomes 0, fractions are
/// truncated toward zero.
auto to_integer(const Value& v) -> double;

/// Shortest text that reads back as `d`, using exponent notation only
/// outside [1e-6, 1e21).
auto number_to_string(double d) -> std::string;

/// String conversion used by concatenation, template literals and String().
auto to_display_string(const Value& v) -> std::string;

/// Key conversion used by member access and `in`.
auto to_property_key(const Value& v) -> std::string;

auto strict_equals(const Value& a, const Value& b) -> bool;

auto loose_equals(const Value& a, const Value& b) -> bool;

/// Like strict_equals, but NaN equals NaN.
auto same_value_zero(const Value& a, const Value& b) -> bool;

/// Converts a script value into JSON the way JSON.stringify does: undefined
/// and function members are skipped, non-finite numbers become null. Throws a
/// TypeError ScriptException on circular structures.
auto to_json_value(const Value& v, Heap& heap) -> json;

/// Converts JSON into script values allocated in `heap`.
auto from_json_value(const json& j, Heap& heap) -> Value;
auto from_json_value(const nlohmann::json& j, Heap& heap) -> Value;

/// Appends the UTF-8 encoding of a code point.
void append_utf8(std::string& out, std::uint32_t cp);

/// Splits UTF-8 text into one string per code point; invalid bytes stand alone.
auto split_code_points(std::string_view s) -> std::vector<std::string>;

/// Parses a canonical array index ("0", "17"); anything else is nullopt.
auto parse_array_index(std::string_view key) -> std::optional<std::size_t>;

} // namespace ctxopt::script
