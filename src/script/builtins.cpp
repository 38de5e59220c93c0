#include "ctxopt/script/builtins.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <random>

#include "ctxopt/core/utils.hpp"

namespace ctxopt::script {

namespace {

constexpr double kMaxSafeInteger = 9007199254740991.0;

auto nan() -> double { return std::numeric_limits<double>::quiet_NaN(); }

auto require_object_coercible(Interpreter& interp, const Value& v) -> const Value& {
    if (v.is_nullish()) interp.throw_error("TypeError", "Cannot convert undefined or null to object");
    return v;
}

auto math_unary(double (*fn)(double)) -> NativeFn {
    return [fn](Interpreter&, const Value&, std::vector<Value>& args) -> Value {
        return fn(to_number(arg(args, 0)));
    };
}

auto make_error_constructor(const std::string& name) -> NativeFn {
    return [name](Interpreter& interp, const Value&, std::vector<Value>& args) -> Value {
        auto message = arg(args, 0);
        auto* error = make_error_object(interp.heap(), name,
                                        message.is_undefined() ? std::string() : to_display_string(message));
        auto options = arg(args, 1);
        if (options.is_object()) {
            if (const auto* cause = options.as_object()->properties.find("cause")) {
                error->properties.set("cause", *cause);
            }
        }
        return error;
    };
}

// ---------------------------------------------------------------------------
// Math
// ---------------------------------------------------------------------------

auto js_round(double x) -> double {
    if (!std::isfinite(x)) return x;
    return std::floor(x + 0.5);
}

auto js_sign(double x) -> double {
    if (std::isnan(x)) return x;
    if (x > 0) return 1.0;
    if (x < 0) return -1.0;
    return x;
}

void install_math(Interpreter& interp) {
    auto& heap = interp.heap();
    auto* math = heap.make_object();

    math->properties.set("PI", 3.141592653589793);
    math->properties.set("E", 2.718281828459045);
    math->properties.set("LN2", 0.6931471805599453);
    math->properties.set("LN10", 2.302585092994046);
    math->properties.set("LOG2E", 1.4426950408889634);
    math->properties.set("LOG10E", 0.4342944819032518);
    math->properties.set("SQRT2", 1.4142135623730951);

    add_function(interp, math, "abs", math_unary([](double x) { return std::fabs(x); }));
    add_function(interp, math, "floor", math_unary([](double x) { return std::floor(x); }));
    add_function(interp, math, "ceil", math_unary([](double x) { return std::ceil(x); }));
    add_function(interp, math, "round", math_unary(js_round));
    add_function(interp, math, "trunc", math_unary([](double x) { return std::trunc(x); }));
    add_function(interp, math, "sign", math_unary(js_sign));
    add_function(interp, math, "sqrt", math_unary([](double x) { return std::sqrt(x); }));
    add_function(interp, math, "cbrt", math_unary([](double x) { return std::cbrt(x); }));
    add_function(interp, math, "log", math_unary([](double x) { return std::log(x); }));
    add_function(interp, math, "log2", math_unary([](double x) { return std::log2(x); }));
    add_function(interp, math, "log10", math_unary([](double x) { return std::log10(x); }));
    add_function(interp, math, "exp", math_unary([](double x) { return std::exp(x); }));
    add_function(interp, math, "sin", math_unary([](double x) { return std::sin(x); }));
    add_function(interp, math, "cos", math_unary([](double x) { return std::cos(x); }));
    add_function(interp, math, "tan", math_unary([](double x) { return std::tan(x); }));
    add_function(interp, math, "atan", math_unary([](double x) { return std::atan(x); }));

    add_function(interp, math, "atan2", [](Interpreter&, const Value&, std::vector<Value>& args) -> Value {
        return std::atan2(to_number(arg(args, 0)), to_number(arg(args, 1)));
    });
    add_function(interp, math, "pow", [](Interpreter&, const Value&, std::vector<Value>& args) -> Value {
        double exponent = to_number(arg(args, 1));
        if (std::isnan(exponent)) return nan();
        return std::pow(to_number(arg(args, 0)), exponent);
    });
    add_function(interp, math, "hypot", [](Interpreter&, const Value&, std::vector<Value>& args) -> Value {
        double sum = 0;
        for (const auto& a : args) {
            double x = to_number(a);
            sum += x * x;
        }
        return std::sqrt(sum);
    });
    add_function(interp, math, "min", [](Interpreter&, const Value&, std::vector<Value>& args) -> Value {
        double out = std::numeric_limits<double>::infinity();
        for (const auto& a : args) {
            double x = to_number(a);
            if (std::isnan(x)) return nan();
            out = std::min(out, x);
        }
        return out;
    });
    add_function(interp, math, "max", [](Interpreter&, const Value&, std::vector<Value>& args) -> Value {
        double out = -std::numeric_limits<double>::infinity();
        for (const auto& a : args) {
            double x = to_number(a);
            if (std::isnan(x)) return nan();
            out = std::max(out, x);
        }
        return out;
    });
    add_function(interp, math, "random", [](Interpreter&, const Value&, std::vector<Value>&) -> Value {
        thread_local std::mt19937_64 engine{std::random_device{}()};
        return std::uniform_real_distribution<double>(0.0, 1.0)(engine);
    });

    math->frozen = true;
    interp.define_global("Math", math);
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

void install_json(Interpreter& interp) {
    auto* ns = interp.heap().make_object();

    add_function(interp, ns, "stringify", [](Interpreter& interp, const Value&, std::vector<Value>& args) -> Value {
        auto value = arg(args, 0);
        if (value.is_undefined() || value.is_function()) return Value{};

        auto j = to_json_value(value, interp.heap());
        auto space = arg(args, 2);
        std::string out;
        if (space.is_number()) {
            auto width = static_cast<int>(std::clamp(to_integer(space), 0.0, 10.0));
            out = width > 0 ? j.dump(width, ' ', false, json::error_handler_t::replace)
                            : j.dump(-1, ' ', false, json::error_handler_t::replace);
        } else if (space.is_string() && !space.as_string().empty()) {
            const auto& s = space.as_string();
            auto width = static_cast<int>(std::min<std::size_t>(s.size(), 10));
            out = j.dump(width, s.front(), false, json::error_handler_t::replace);
        } else {
            out = j.dump(-1, ' ', false, json::error_handler_t::replace);
        }
        return interp.make_string(std::move(out));
    });

    add_function(interp, ns, "parse", [](Interpreter& interp, const Value&, std::vector<Value>& args) -> Value {
        auto text = to_display_string(arg(args, 0));
        auto j = json::parse(text, nullptr, false);
        if (j.is_discarded()) {
            interp.throw_error("SyntaxError", "Unexpected token in JSON");
        }
        return from_json_value(j, interp.heap());
    });

    ns->frozen = true;
    interp.define_global("JSON", ns);
}

// ---------------------------------------------------------------------------
// Object, Array
// ---------------------------------------------------------------------------

void install_object(Interpreter& interp) {
    auto& heap = interp.heap();
    auto* object_fn = heap.make_native("Object", [](Interpreter& interp, const Value&, std::vector<Value>& args) -> Value {
        auto v = arg(args, 0);
        if (v.is_nullish()) return interp.heap().make_object();
        return v;
    });
    auto add = [&](const std::string& name, NativeFn fn) {
        object_fn->members.set(name, heap.make_native(name, std::move(fn)));
    };

    add("keys", [](Interpreter& interp, const Value&, std::vector<Value>& args) -> Value {
        auto target = require_object_coercible(interp, arg(args, 0));
        std::vector<Value> out;
        for (auto& key : interp.own_keys(target)) out.emplace_back(std::move(key));
        return interp.heap().make_array(std::move(out));
    });
    add("values", [](Interpreter& interp, const Value&, std::vector<Value>& args) -> Value {
        auto target = require_object_coercible(interp, arg(args, 0));
        std::vector<Value> out;
        for (const auto& key : interp.own_keys(target)) out.push_back(interp.get_property(target, key));
        return interp.heap().make_array(std::move(out));
    });
    add("entries", [](Interpreter& interp, const Value&, std::vector<Value>& args) -> Value {
        auto target = require_object_coercible(interp, arg(args, 0));
        std::vector<Value> out;
        for (const auto& key : interp.own_keys(target)) {
            auto* pair = interp.heap().make_array({Value(key), interp.get_property(target, key)});
            out.emplace_back(pair);
        }
        return interp.heap().make_array(std::move(out));
    });
    add("fromEntries", [](Interpreter& interp, const Value&, std::vector<Value>& args) -> Value {
        auto* out = interp.heap().make_object();
        for (const auto& entry : interp.iterate(arg(args, 0))) {
            if (!entry.is_array()) {
                interp.throw_error("TypeError", "Iterator value " + to_display_string(entry) +
                                                    " is not an entry object");
            }
            const auto& pair = entry.as_array()->items;
            auto key = to_property_key(pair.empty() ? Value{} : pair[0]);
            interp.set_property(out, key, pair.size() > 1 ? pair[1] : Value{});
        }
        return out;
    });
    add("assign", [](Interpreter& interp, const Value&, std::vector<Value>& args) -> Value {
        auto target = require_object_coercible(interp, arg(args, 0));
        for (std::size_t i = 1; i < args.size(); ++i) {
            if (args[i].is_nullish()) continue;
            for (const auto& key : interp.own_keys(args[i])) {
                interp.set_property(target, key, interp.get_property(args[i], key));
            }
        }
        return target;
    });
    add("freeze", [](Interpreter&, const Value&, std::vector<Value>& args) -> Value {
        auto v = arg(args, 0);
        if (v.is_object()) v.as_object()->frozen = true;
        else if (v.is_array()) v.as_array()->frozen = true;
        else if (v.is_function()) v.as_function()->frozen = true;
        return v;
    });
    add("isFrozen", [](Interpreter&, const Value&, std::vector<Value>& args) -> Value {
        auto v = arg(args, 0);
        if (v.is_object()) return v.as_object()->frozen;
        if (v.is_array()) return v.as_array()->frozen;
        if (v.is_function()) return v.as_function()->frozen;
        return true;
    });
    object_fn->frozen = true;
    interp.define_global("Object", object_fn);

    // Array
    auto* array_fn = heap.make_native("Array", [](Interpreter& interp, const Value&, std::vector<Value>& args) -> Value {
        if (args.size() == 1 && args[0].is_number()) {
            double n = args[0].as_number();
            if (!(n >= 0) || n != std::trunc(n) || n > 4294967295.0) {
                interp.throw_error("RangeError", "Invalid array length");
            }
            return interp.heap().make_array(std::vector<Value>(static_cast<std::size_t>(n)));
        }
        return interp.heap().make_array(args);
    });
    auto add_array = [&](const std::string& name, NativeFn fn) {
        array_fn->members.set(name, heap.make_native(name, std::move(fn)));
    };
    add_array("isArray", [](Interpreter&, const Value&, std::vector<Value>& args) -> Value {
        return arg(args, 0).is_array();
    });
    add_array("of", [](Interpreter& interp, const Value&, std::vector<Value>& args) -> Value {
        return interp.heap().make_array(args);
    });
    add_array("from", [](Interpreter& interp, const Value&, std::vector<Value>& args) -> Value {
        auto source = arg(args, 0);
        std::vector<Value> items;
        if (source.is_object()) {
            // Array-like: { length: n }
            double n = to_integer(interp.get_property(source, "length"));
            auto count = static_cast<std::size_t>(std::clamp(n, 0.0, kMaxSafeInteger));
            interp.heap().charge(count * sizeof(Value));
            for (std::size_t i = 0; i < count; ++i) {
                interp.check_cancelled();
                items.push_back(interp.get_property(source, std::to_string(i)));
            }
        } else {
            items = interp.iterate(require_object_coercible(interp, source));
        }
        auto map_fn = arg(args, 1);
        if (map_fn.is_function()) {
            for (std::size_t i = 0; i < items.size(); ++i) {
                items[i] = interp.call(map_fn, Value{}, {items[i], static_cast<double>(i)});
            }
        }
        return interp.heap().make_array(std::move(items));
    });
    array_fn->frozen = true;
    interp.define_global("Array", array_fn);
}

// ---------------------------------------------------------------------------
// String, Number, Boolean and the numeric globals
// ---------------------------------------------------------------------------

void install_primitives(Interpreter& interp) {
    auto& heap = interp.heap();

    auto* string_fn = heap.make_native("String", [](Interpreter& interp, const Value&, std::vector<Value>& args) -> Value {
        if (args.empty()) return "";
        return interp.make_string(to_display_string(args[0]));
    });
    string_fn->members.set("fromCharCode", heap.make_native("fromCharCode",
        [](Interpreter& interp, const Value&, std::vector<Value>& args) -> Value {
            std::string out;
            for (const auto& a : args) {
                append_utf8(out, static_cast<std::uint32_t>(to_integer(a)) & 0xFFFFU);
            }
            return interp.make_string(std::move(out));
        }));
    string_fn->members.set("fromCodePoint", heap.make_native("fromCodePoint",
        [](Interpreter& interp, const Value&, std::vector<Value>& args) -> Value {
            std::string out;
            for (const auto& a : args) {
                double cp = to_number(a);
                if (!(cp >= 0) || cp > 0x10FFFF || cp != std::trunc(cp)) {
                    interp.throw_error("RangeError", "Invalid code point " + to_display_string(a));
                }
                append_utf8(out, static_cast<std::uint32_t>(cp));
            }
            return interp.make_string(std::move(out));
        }));
    string_fn->frozen = true;
    interp.define_global("String", string_fn);

    auto* parse_int_fn = heap.make_native("parseInt", [](Interpreter&, const Value&, std::vector<Value>& args) -> Value {
        return parse_int(to_display_string(arg(args, 0)), static_cast<int>(to_integer(arg(args, 1))));
    });
    auto* parse_float_fn = heap.make_native("parseFloat", [](Interpreter&, const Value&, std::vector<Value>& args) -> Value {
        return parse_float(to_display_string(arg(args, 0)));
    });
    interp.define_global("parseInt", parse_int_fn);
    interp.define_global("parseFloat", parse_float_fn);

    auto* number_fn = heap.make_native("Number", [](Interpreter&, const Value&, std::vector<Value>& args) -> Value {
        return args.empty() ? 0.0 : to_number(args[0]);
    });
    auto add_number = [&](const std::string& name, NativeFn fn) {
        number_fn->members.set(name, heap.make_native(name, std::move(fn)));
    };
    add_number("isInteger", [](Interpreter&, const Value&, std::vector<Value>& args) -> Value {
        auto v = arg(args, 0);
        return v.is_number() && std::isfinite(v.as_number()) && v.as_number() == std::trunc(v.as_number());
    });
    add_number("isSafeInteger", [](Interpreter&, const Value&, std::vector<Value>& args) -> Value {
        auto v = arg(args, 0);
        return v.is_number() && std::isfinite(v.as_number()) &&
               v.as_number() == std::trunc(v.as_number()) && std::fabs(v.as_number()) <= kMaxSafeInteger;
    });
    add_number("isFinite", [](Interpreter&, const Value&, std::vector<Value>& args) -> Value {
        auto v = arg(args, 0);
        return v.is_number() && std::isfinite(v.as_number());
    });
    add_number("isNaN", [](Interpreter&, const Value&, std::vector<Value>& args) -> Value {
        auto v = arg(args, 0);
        return v.is_number() && std::isnan(v.as_number());
    });
    number_fn->members.set("parseInt", parse_int_fn);
    number_fn->members.set("parseFloat", parse_float_fn);
    number_fn->members.set("MAX_SAFE_INTEGER", kMaxSafeInteger);
    number_fn->members.set("MIN_SAFE_INTEGER", -kMaxSafeInteger);
    number_fn->members.set("EPSILON", std::numeric_limits<double>::epsilon());
    number_fn->members.set("MAX_VALUE", std::numeric_limits<double>::max());
    number_fn->members.set("MIN_VALUE", std::numeric_limits<double>::denorm_min());
    number_fn->members.set("POSITIVE_INFINITY", std::numeric_limits<double>::infinity());
    number_fn->members.set("NEGATIVE_INFINITY", -std::numeric_limits<double>::infinity());
    number_fn->members.set("NaN", nan());
    number_fn->frozen = true;
    interp.define_global("Number", number_fn);

    interp.define_global("Boolean", heap.make_native("Boolean",
        [](Interpreter&, const Value&, std::vector<Value>& args) -> Value {
            return is_truthy(arg(args, 0));
        }));
    interp.define_global("isNaN", heap.make_native("isNaN",
        [](Interpreter&, const Value&, std::vector<Value>& args) -> Value {
            return std::isnan(to_number(arg(args, 0)));
        }));
    interp.define_global("isFinite", heap.make_native("isFinite",
        [](Interpreter&, const Value&, std::vector<Value>& args) -> Value {
            return std::isfinite(to_number(arg(args, 0)));
        }));
}

// ---------------------------------------------------------------------------
// Errors, Promise, console, Date
// ---------------------------------------------------------------------------

void install_runtime(Interpreter& interp) {
    auto& heap = interp.heap();

    for (const char* name : {"Error", "TypeError", "RangeError", "SyntaxError", "ReferenceError"}) {
        auto* ctor = heap.make_native(name, make_error_constructor(name));
        ctor->frozen = true;
        interp.define_global(name, ctor);
    }

    // Host calls complete synchronously, so a promise is just its value.
    auto* promise = heap.make_object();
    add_function(interp, promise, "resolve", [](Interpreter&, const Value&, std::vector<Value>& args) -> Value {
        return arg(args, 0);
    });
    add_function(interp, promise, "reject", [](Interpreter&, const Value&, std::vector<Value>& args) -> Value {
        throw ScriptException(arg(args, 0));
    });
    add_function(interp, promise, "all", [](Interpreter& interp, const Value&, std::vector<Value>& args) -> Value {
        return interp.heap().make_array(interp.iterate(arg(args, 0)));
    });
    add_function(interp, promise, "allSettled", [](Interpreter& interp, const Value&, std::vector<Value>& args) -> Value {
        std::vector<Value> out;
        for (auto& item : interp.iterate(arg(args, 0))) {
            auto* entry = interp.heap().make_object();
            entry->properties.set("status", "fulfilled");
            entry->properties.set("value", std::move(item));
            out.emplace_back(entry);
        }
        return interp.heap().make_array(std::move(out));
    });
    add_function(interp, promise, "race", [](Interpreter& interp, const Value&, std::vector<Value>& args) -> Value {
        auto items = interp.iterate(arg(args, 0));
        return items.empty() ? Value{} : items.front();
    });
    promise->frozen = true;
    interp.define_global("Promise", promise);

    // Script output is the return value; console output is discarded.
    auto* console = heap.make_object();
    for (const char* name : {"log", "info", "warn", "error", "debug"}) {
        add_function(interp, console, name, [](Interpreter&, const Value&, std::vector<Value>&) -> Value {
            return Value{};
        });
    }
    console->frozen = true;
    interp.define_global("console", console);

    auto* date = heap.make_object();
    add_function(interp, date, "now", [](Interpreter&, const Value&, std::vector<Value>&) -> Value {
        return utils::timestamp_ms();
    });
    date->frozen = true;
    interp.define_global("Date", date);
}

void install_object_methods(Interpreter& interp) {
    interp.define_method(Receiver::Object, "hasOwnProperty",
        [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
            if (!self.is_object()) interp.throw_error("TypeError", "hasOwnProperty called on non-object");
            return self.as_object()->properties.find(to_property_key(arg(args, 0))) != nullptr;
        });
    interp.define_method(Receiver::Object, "toString",
        [](Interpreter& interp, const Value& self, std::vector<Value>&) -> Value {
            return interp.make_string(to_display_string(self));
        });
}

} // anonymous namespace

void add_function(Interpreter& interp, Object* target, const std::string& name, NativeFn fn) {
    target->properties.set(name, interp.heap().make_native(name, std::move(fn)));
}

auto parse_int(std::string_view text, int radix) -> double {
    std::size_t i = 0;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;

    double sign = 1;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
        if (text[i] == '-') sign = -1;
        ++i;
    }

    bool hex_prefix = i + 1 < text.size() && text[i] == '0' && (text[i + 1] == 'x' || text[i + 1] == 'X');
    if (radix == 0) {
        radix = hex_prefix ? 16 : 10;
    } else if (radix < 2 || radix > 36) {
        return nan();
    }
    if (radix == 16 && hex_prefix) i += 2;

    double out = 0;
    bool any = false;
    for (; i < text.size(); ++i) {
        int digit = -1;
        char c = text[i];
        if (c >= '0' && c <= '9') digit = c - '0';
        else if (c >= 'a' && c <= 'z') digit = c - 'a' + 10;
        else if (c >= 'A' && c <= 'Z') digit = c - 'A' + 10;
        if (digit < 0 || digit >= radix) break;
        out = out * radix + digit;
        any = true;
    }
    return any ? sign * out : nan();
}

auto parse_float(std::string_view text) -> double {
    std::size_t i = 0;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
    std::size_t start = i;

    if (i < text.size() && (text[i] == '+' || text[i] == '-')) ++i;
    if (text.substr(i).starts_with("Infinity")) {
        return text[start] == '-' ? -std::numeric_limits<double>::infinity()
                                  : std::numeric_limits<double>::infinity();
    }

    auto digits = [&] {
        std::size_t n = 0;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
            ++i;
            ++n;
        }
        return n;
    };

    std::size_t mantissa = digits();
    if (i < text.size() && text[i] == '.') {
        ++i;
        mantissa += digits();
    }
    if (mantissa == 0) return nan();

    if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
        std::size_t mark = i;
        ++i;
        if (i < text.size() && (text[i] == '+' || text[i] == '-')) ++i;
        if (digits() == 0) i = mark;
    }

    std::string literal(text.substr(start, i - start));
    return std::strtod(literal.c_str(), nullptr);
}

void install_builtins(Interpreter& interp) {
    install_math(interp);
    install_json(interp);
    install_object(interp);
    install_primitives(interp);
    install_runtime(interp);
    install_object_methods(interp);
    install_string_methods(interp);
    install_array_methods(interp);
    install_number_methods(interp);
}

} // namespace ctxopt::script
