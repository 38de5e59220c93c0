#include "ctxopt/script/value.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>

namespace ctxopt::script {

namespace {

constexpr std::size_t kObjectCost = 64;
constexpr std::size_t kFunctionCost = 128;
constexpr double kMaxSafeInteger = 9007199254740991.0;

auto is_js_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

auto string_to_number(std::string_view s) -> double {
    while (!s.empty() && is_js_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_js_space(s.back())) s.remove_suffix(1);
    if (s.empty()) return 0.0;

    if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        std::uint64_t out = 0;
        auto [ptr, ec] = std::from_chars(s.data() + 2, s.data() + s.size(), out, 16);
        if (ec != std::errc{} || ptr != s.data() + s.size()) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        return static_cast<double>(out);
    }

    bool negative = false;
    if (s.front() == '+' || s.front() == '-') {
        negative = s.front() == '-';
        s.remove_prefix(1);
    }
    if (s == "Infinity") {
        return negative ? -std::numeric_limits<double>::infinity()
                        : std::numeric_limits<double>::infinity();
    }
    // from_chars would accept "inf" and "nan"; script numbers do not.
    for (char c : s) {
        if (!(std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == 'e' ||
              c == 'E' || c == '+' || c == '-')) {
            return std::numeric_limits<double>::quiet_NaN();
        }
    }
    double out = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return negative ? -out : out;
}

auto error_text(const Object& obj) -> std::string {
    std::string name = "Error";
    std::string message;
    if (const auto* n = obj.properties.find("name"); n && n->is_string()) name = n->as_string();
    if (const auto* m = obj.properties.find("message"); m && m->is_string()) message = m->as_string();
    if (message.empty()) return name;
    return name + ": " + message;
}

auto display(const Value& v, std::vector<const void*>& stack) -> std::string;

auto display_array(const Array& arr, std::vector<const void*>& stack) -> std::string {
    if (std::ranges::find(stack, static_cast<const void*>(&arr)) != stack.end() ||
        stack.size() >= kMaxNesting) {
        return "";
    }
    stack.push_back(&arr);
    std::string out;
    for (std::size_t i = 0; i < arr.items.size(); ++i) {
        if (i > 0) out += ',';
        if (!arr.items[i].is_nullish()) out += display(arr.items[i], stack);
    }
    stack.pop_back();
    return out;
}

auto display(const Value& v, std::vector<const void*>& stack) -> std::string {
    return std::visit([&](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, Undefined>) return "undefined";
        else if constexpr (std::is_same_v<T, Null>) return "null";
        else if constexpr (std::is_same_v<T, bool>) return x ? "true" : "false";
        else if constexpr (std::is_same_v<T, double>) return number_to_string(x);
        else if constexpr (std::is_same_v<T, std::string>) return x;
        else if constexpr (std::is_same_v<T, Array*>) return display_array(*x, stack);
        else if constexpr (std::is_same_v<T, Object*>) {
            return x->is_error ? error_text(*x) : "[object Object]";
        } else {
            return "function " + x->name + "() { [native code] }";
        }
    }, v.storage());
}

auto number_json(double d) -> json {
    if (!std::isfinite(d)) return nullptr;
    if (std::trunc(d) == d && std::fabs(d) <= kMaxSafeInteger) {
        return static_cast<std::int64_t>(d);
    }
    return d;
}

auto to_json_impl(const Value& v, Heap& heap, std::vector<const void*>& stack) -> json {
    const auto enter = [&](const void* p) {
        if (std::ranges::find(stack, p) != stack.end()) {
            throw_error(heap, "TypeError", "Converting circular structure to JSON");
        }
        if (stack.size() >= kMaxNesting) {
            throw_error(heap, "RangeError", "Value is nested too deeply to convert to JSON");
        }
        stack.push_back(p);
    };

    if (v.is_array()) {
        const auto* arr = v.as_array();
        enter(arr);
        json out = json::array();
        for (const auto& item : arr->items) {
            if (item.is_undefined() || item.is_function()) {
                out.push_back(nullptr);
            } else {
                out.push_back(to_json_impl(item, heap, stack));
            }
        }
        stack.pop_back();
        return out;
    }
    if (v.is_object()) {
        const auto* obj = v.as_object();
        enter(obj);
        json out = json::object();
        for (const auto& key : obj->properties.keys()) {
            const auto* member = obj->properties.find(key);
            if (member->is_undefined() || member->is_function()) continue;
            out[key] = to_json_impl(*member, heap, stack);
        }
        stack.pop_back();
        return out;
    }
    if (v.is_string()) return v.as_string();
    if (v.is_number()) return number_json(v.as_number());
    if (v.is_bool()) return v.as_bool();
    return nullptr;
}

template <typename Json>
auto from_json_impl(const Json& j, Heap& heap, std::size_t depth) -> Value {
    if (depth > kMaxNesting) {
        throw_error(heap, "RangeError", "JSON is nested too deeply");
    }
    switch (j.type()) {
        case Json::value_t::null:
        case Json::value_t::discarded:
            return Null{};
        case Json::value_t::boolean:
            return j.template get<bool>();
        case Json::value_t::number_integer:
            return static_cast<double>(j.template get<std::int64_t>());
        case Json::value_t::number_unsigned:
            return static_cast<double>(j.template get<std::uint64_t>());
        case Json::value_t::number_float:
            return j.template get<double>();
        case Json::value_t::string: {
            const auto& s = j.template get_ref<const std::string&>();
            heap.charge(s.size());
            return s;
        }
        case Json::value_t::array: {
            auto* arr = heap.make_array();
            heap.charge(j.size() * sizeof(Value));
            arr->items.reserve(j.size());
            for (const auto& item : j) {
                arr->items.push_back(from_json_impl(item, heap, depth + 1));
            }
            return arr;
        }
        case Json::value_t::object: {
            auto* obj = heap.make_object();
            for (auto it = j.begin(); it != j.end(); ++it) {
                heap.charge(it.key().size() + sizeof(Value));
                obj->properties.set(it.key(), from_json_impl(it.value(), heap, depth + 1));
            }
            return obj;
        }
        case Json::value_t::binary:
            break;
    }
    return Value{};
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// PropertyMap
// ---------------------------------------------------------------------------

auto PropertyMap::find(const std::string& key) const -> const Value* {
    auto it = values_.find(key);
    return it == values_.end() ? nullptr : &it->second;
}

auto PropertyMap::find(const std::string& key) -> Value* {
    auto it = values_.find(key);
    return it == values_.end() ? nullptr : &it->second;
}

auto PropertyMap::set(const std::string& key, Value value) -> bool {
    auto [it, inserted] = values_.insert_or_assign(key, std::move(value));
    if (inserted) keys_.push_back(key);
    return inserted;
}

auto PropertyMap::erase(const std::string& key) -> bool {
    if (values_.erase(key) == 0) return false;
    std::erase(keys_, key);
    return true;
}

// ---------------------------------------------------------------------------
// Heap
// ---------------------------------------------------------------------------

Heap::Heap(std::size_t limit_bytes) : limit_(limit_bytes) {}

auto Heap::make_object() -> Object* {
    charge(kObjectCost);
    objects_.push_back(std::make_unique<Object>());
    return objects_.back().get();
}

auto Heap::make_array(std::vector<Value> items) -> Array* {
    charge(kObjectCost + items.size() * sizeof(Value));
    auto arr = std::make_unique<Array>();
    arr->items = std::move(items);
    arrays_.push_back(std::move(arr));
    return arrays_.back().get();
}

auto Heap::make_native(std::string name, NativeFn fn) -> Function* {
    charge(kFunctionCost);
    auto f = std::make_unique<Function>();
    f->name = std::move(name);
    f->native = std::move(fn);
    functions_.push_back(std::move(f));
    return functions_.back().get();
}

auto Heap::make_closure(const FunctionNode& node, std::shared_ptr<Scope> closure) -> Function* {
    charge(kFunctionCost);
    auto f = std::make_unique<Function>();
    f->node = &node;
    f->closure = std::move(closure);
    functions_.push_back(std::move(f));
    return functions_.back().get();
}

void Heap::charge(std::size_t bytes) {
    if (bytes > limit_ || used_ > limit_ - bytes) {
        used_ = limit_;
        throw AbortError(ErrorCode::MemoryLimit, "Memory limit exceeded");
    }
    used_ += bytes;
}

auto Heap::try_charge(std::size_t bytes) noexcept -> bool {
    if (bytes > limit_ || used_ > limit_ - bytes) return false;
    used_ += bytes;
    return true;
}

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------

ScriptException::ScriptException(Value value) : value_(std::move(value)) {
    if (value_.is_object() && value_.as_object()->is_error) {
        const auto* m = value_.as_object()->properties.find("message");
        message_ = (m && m->is_string() && !m->as_string().empty())
            ? m->as_string()
            : error_text(*value_.as_object());
    } else {
        message_ = to_display_string(value_);
    }
}

auto make_error_object(Heap& heap, std::string_view name, std::string message) -> Object* {
    auto* obj = heap.make_object();
    heap.charge(message.size());
    obj->is_error = true;
    obj->properties.set("name", std::string(name));
    obj->properties.set("message", std::move(message));
    return obj;
}

void throw_error(Heap& heap, std::string_view name, std::string message) {
    throw ScriptException(make_error_object(heap, name, std::move(message)));
}

// ---------------------------------------------------------------------------
// Conversions
// ---------------------------------------------------------------------------

auto type_of(const Value& v) -> std::string_view {
    if (v.is_undefined()) return "undefined";
    if (v.is_bool()) return "boolean";
    if (v.is_number()) return "number";
    if (v.is_string()) return "string";
    if (v.is_function()) return "function";
    return "object";
}

auto is_truthy(const Value& v) -> bool {
    if (v.is_nullish()) return false;
    if (v.is_bool()) return v.as_bool();
    if (v.is_number()) {
        double d = v.as_number();
        return d != 0.0 && !std::isnan(d);
    }
    if (v.is_string()) return !v.as_string().empty();
    return true;
}

auto to_number(const Value& v) -> double {
    if (v.is_number()) return v.as_number();
    if (v.is_undefined()) return std::numeric_limits<double>::quiet_NaN();
    if (v.is_null()) return 0.0;
    if (v.is_bool()) return v.as_bool() ? 1.0 : 0.0;
    if (v.is_string()) return string_to_number(v.as_string());
    if (v.is_array()) {
        const auto& items = v.as_array()->items;
        if (items.empty()) return 0.0;
        if (items.size() == 1) return to_number(Value(to_display_string(items[0])));
    }
    return std::numeric_limits<double>::quiet_NaN();
}

auto to_integer(const Value& v) -> double {
    double d = to_number(v);
    if (std::isnan(d)) return 0.0;
    return std::trunc(d);
}

auto number_to_string(double d) -> std::string {
    if (std::isnan(d)) return "NaN";
    if (std::isinf(d)) return d > 0 ? "Infinity" : "-Infinity";
    if (d == 0.0) return "0";

    double magnitude = std::fabs(d);
    bool scientific = magnitude >= 1e21 || magnitude < 1e-6;
    char buf[128];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d,
        scientific ? std::chars_format::scientific : std::chars_format::fixed);
    if (ec != std::errc{}) return "NaN";
    std::string s(buf, ptr);
    if (!scientific) return s;

    // to_chars writes "1e-07"; script numbers print as "1e-7".
    auto e = s.find('e');
    if (e == std::string::npos || e + 2 > s.size()) return s;
    std::string mantissa = s.substr(0, e);
    char sign = s[e + 1];
    std::string exponent = s.substr(e + 2);
    exponent.erase(0, std::min(exponent.find_first_not_of('0'), exponent.size() - 1));
    return mantissa + "e" + sign + exponent;
}

auto to_display_string(const Value& v) -> std::string {
    std::vector<const void*> stack;
    return display(v, stack);
}

auto to_property_key(const Value& v) -> std::string {
    if (v.is_string()) return v.as_string();
    return to_display_string(v);
}

auto strict_equals(const Value& a, const Value& b) -> bool {
    if (a.storage().index() != b.storage().index()) return false;
    if (a.is_number()) return a.as_number() == b.as_number();
    return a.storage() == b.storage();
}

auto loose_equals(const Value& a, const Value& b) -> bool {
    if (a.storage().index() == b.storage().index()) return strict_equals(a, b);
    if (a.is_nullish() || b.is_nullish()) return a.is_nullish() && b.is_nullish();
    if (a.is_bool()) return loose_equals(Value(a.as_bool() ? 1.0 : 0.0), b);
    if (b.is_bool()) return loose_equals(a, Value(b.as_bool() ? 1.0 : 0.0));
    if (a.is_number() && b.is_string()) return a.as_number() == to_number(b);
    if (a.is_string() && b.is_number()) return to_number(a) == b.as_number();
    bool a_primitive = a.is_number() || a.is_string();
    bool b_primitive = b.is_number() || b.is_string();
    if (a_primitive && (b.is_array() || b.is_object())) return loose_equals(a, Value(to_display_string(b)));
    if (b_primitive && (a.is_array() || a.is_object())) return loose_equals(Value(to_display_string(a)), b);
    return false;
}

auto same_value_zero(const Value& a, const Value& b) -> bool {
    if (a.is_number() && b.is_number() && std::isnan(a.as_number()) && std::isnan(b.as_number())) {
        return true;
    }
    return strict_equals(a, b);
}

auto to_json_value(const Value& v, Heap& heap) -> json {
    std::vector<const void*> stack;
    return to_json_impl(v, heap, stack);
}

auto from_json_value(const json& j, Heap& heap) -> Value {
    return from_json_impl(j, heap, 0);
}

auto from_json_value(const nlohmann::json& j, Heap& heap) -> Value {
    return from_json_impl(j, heap, 0);
}

auto parse_array_index(std::string_view key) -> std::optional<std::size_t> {
    if (key.empty() || key.size() > 15) return std::nullopt;
    if (key.size() > 1 && key[0] == '0') return std::nullopt;
    std::size_t out = 0;
    auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), out);
    if (ec != std::errc{} || ptr != key.data() + key.size()) return std::nullopt;
    return out;
}

auto split_code_points(std::string_view s) -> std::vector<std::string> {
    std::vector<std::string> out;
    std::size_t i = 0;
    while (i < s.size()) {
        auto lead = static_cast<unsigned char>(s[i]);
        std::size_t len = 1;
        if (lead >= 0xF0 && lead < 0xF8) len = 4;
        else if (lead >= 0xE0) len = lead < 0xF0 ? 3 : 1;
        else if (lead >= 0xC0) len = 2;
        if (i + len > s.size()) len = 1;
        for (std::size_t k = 1; k < len; ++k) {
            if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) {
                len = 1;
                break;
            }
        }
        out.emplace_back(s.substr(i, len));
        i += len;
    }
    return out;
}

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

} // namespace ctxopt::script
