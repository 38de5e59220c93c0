#include "ctxopt/script/builtins.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>
#include <limits>

#include "ctxopt/core/utils.hpp"

namespace ctxopt::script {

namespace {

auto self_string(Interpreter& interp, const Value& self) -> const std::string& {
    if (!self.is_string()) interp.throw_error("TypeError", "String method called on incompatible receiver");
    return self.as_string();
}

auto self_array(Interpreter& interp, const Value& self) -> Array* {
    if (!self.is_array()) interp.throw_error("TypeError", "Array method called on incompatible receiver");
    return self.as_array();
}

auto mutable_array(Interpreter& interp, const Value& self) -> Array* {
    auto* array = self_array(interp, self);
    if (array->frozen) {
        interp.throw_error("TypeError", "Cannot add property 0, object is not extensible");
    }
    return array;
}

auto self_number(Interpreter& interp, const Value& self) -> double {
    if (!self.is_number()) interp.throw_error("TypeError", "Number method called on incompatible receiver");
    return self.as_number();
}

/// Resolves a relative index argument (negative counts from the end) into
/// [0, size].
auto relative_index(const Value& v, std::size_t size, std::size_t fallback) -> std::size_t {
    if (v.is_undefined()) return fallback;
    double n = to_integer(v);
    auto len = static_cast<double>(size);
    if (n < 0) n = std::max(0.0, len + n);
    return static_cast<std::size_t>(std::min(n, len));
}

auto clamp_index(const Value& v, std::size_t size, std::size_t fallback) -> std::size_t {
    if (v.is_undefined()) return fallback;
    double n = std::clamp(to_integer(v), 0.0, static_cast<double>(size));
    return static_cast<std::size_t>(n);
}

auto callback_arg(Interpreter& interp, const std::vector<Value>& args) -> Value {
    auto fn = arg(args, 0);
    if (!fn.is_function()) {
        interp.throw_error("TypeError", std::format("{} is not a function", to_display_string(fn)));
    }
    return fn;
}

auto is_space(char c) -> bool {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

auto repeat_string(Interpreter& interp, const std::string& s, double count) -> std::string {
    if (count < 0 || !std::isfinite(count)) {
        interp.throw_error("RangeError", "Invalid count value: " + number_to_string(count));
    }
    auto n = static_cast<std::size_t>(count);
    if (s.empty() || n == 0) return {};
    if (n > interp.heap().limit() / s.size()) {
        interp.throw_error("RangeError", "Invalid string length");
    }
    interp.heap().charge(s.size() * n);
    std::string out;
    out.reserve(s.size() * n);
    for (std::size_t i = 0; i < n; ++i) out += s;
    return out;
}

auto pad_string(Interpreter& interp, const std::string& s, std::vector<Value>& args, bool at_start) -> Value {
    auto target = static_cast<std::size_t>(std::max(0.0, to_integer(arg(args, 0))));
    auto filler = arg(args, 1);
    std::string fill = filler.is_undefined() ? std::string(" ") : to_display_string(filler);
    if (target <= s.size() || fill.empty()) return s;
    std::size_t missing = target - s.size();
    auto pad = repeat_string(interp, fill, static_cast<double>(missing / fill.size() + 1));
    pad.resize(missing);
    return interp.make_string(at_start ? pad + s : s + pad);
}

/// Applies `$$` and `$&` in a replacement string.
auto expand_replacement(std::string_view replacement, std::string_view match) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < replacement.size(); ++i) {
        if (replacement[i] == '$' && i + 1 < replacement.size()) {
            if (replacement[i + 1] == '$') {
                out += '$';
                ++i;
                continue;
            }
            if (replacement[i + 1] == '&') {
                out += match;
                ++i;
                continue;
            }
        }
        out += replacement[i];
    }
    return out;
}

auto replace_string(Interpreter& interp, const Value& self, std::vector<Value>& args, bool all) -> Value {
    const auto& s = self_string(interp, self);
    auto needle = to_display_string(arg(args, 0));
    auto replacement = arg(args, 1);

    std::string out;
    std::size_t pos = 0;
    while (true) {
        auto found = s.find(needle, pos);
        if (found == std::string::npos) break;
        out.append(s, pos, found - pos);
        if (replacement.is_function()) {
            auto result = interp.call(replacement, Value{},
                                      {Value(needle), static_cast<double>(found), Value(s)});
            out += to_display_string(result);
        } else {
            out += expand_replacement(to_display_string(replacement), needle);
        }
        pos = found + needle.size();
        if (!all) break;
        if (needle.empty()) {
            if (pos >= s.size()) break;
            out += s[pos];
            ++pos;
        }
    }
    if (pos <= s.size()) out.append(s, pos);
    return interp.make_string(std::move(out));
}

auto decode_code_point(const std::string& s, std::size_t i) -> double {
    auto lead = static_cast<unsigned char>(s[i]);
    if (lead < 0x80) return lead;
    auto chars = split_code_points(std::string_view(s).substr(i, 4));
    const auto& ch = chars.front();
    if (ch.size() == 1) return lead;
    std::uint32_t cp = lead & (ch.size() == 2 ? 0x1F : ch.size() == 3 ? 0x0F : 0x07);
    for (std::size_t k = 1; k < ch.size(); ++k) {
        cp = (cp << 6) | (static_cast<unsigned char>(ch[k]) & 0x3F);
    }
    return cp;
}

// ---------------------------------------------------------------------------
// Array helpers
// ---------------------------------------------------------------------------

/// Walks the array invoking `fn(item, index, array)`; `visit` returns false
/// to stop. Elements appended during the walk are not visited.
template <typename Visit>
void for_each_element(Interpreter& interp, const Value& self, const Value& fn, Visit visit) {
    auto* array = self_array(interp, self);
    std::size_t length = array->items.size();
    for (std::size_t i = 0; i < length && i < array->items.size(); ++i) {
        Value item = array->items[i];
        auto result = interp.call(fn, Value{}, {item, static_cast<double>(i), self});
        if (!visit(item, i, result)) break;
    }
}

auto default_compare(const Value& a, const Value& b) -> bool {
    // undefined sorts last; everything else compares as strings.
    if (a.is_undefined()) return false;
    if (b.is_undefined()) return true;
    return to_display_string(a) < to_display_string(b);
}

/// Stable merge sort that tolerates inconsistent comparators.
template <typename Less>
void merge_sort(std::vector<Value>& items, Less less) {
    std::vector<Value> buffer(items.size());
    for (std::size_t width = 1; width < items.size(); width *= 2) {
        for (std::size_t lo = 0; lo < items.size(); lo += 2 * width) {
            std::size_t mid = std::min(lo + width, items.size());
            std::size_t hi = std::min(lo + 2 * width, items.size());
            std::size_t i = lo;
            std::size_t j = mid;
            std::size_t k = lo;
            while (i < mid && j < hi) {
                if (less(items[j], items[i])) buffer[k++] = items[j++];
                else buffer[k++] = items[i++];
            }
            while (i < mid) buffer[k++] = items[i++];
            while (j < hi) buffer[k++] = items[j++];
        }
        items.swap(buffer);
    }
}

void flatten_into(Interpreter& interp, const std::vector<Value>& items, double depth,
                  std::size_t level, std::vector<Value>& out) {
    if (level >= kMaxNesting) interp.throw_error("RangeError", "Array is nested too deeply to flatten");
    for (const auto& item : items) {
        interp.check_cancelled();
        if (item.is_array() && depth >= 1) {
            flatten_into(interp, item.as_array()->items, depth - 1, level + 1, out);
        } else {
            interp.heap().charge(sizeof(Value));
            out.push_back(item);
        }
    }
}

auto join_array(Interpreter& interp, Array* array, const std::string& sep,
                std::vector<const Array*>& stack) -> std::string {
    if (std::find(stack.begin(), stack.end(), array) != stack.end() ||
        stack.size() >= kMaxNesting) {
        return {};
    }
    stack.push_back(array);
    std::string out;
    for (std::size_t i = 0; i < array->items.size(); ++i) {
        if (i > 0) out += sep;
        const auto& item = array->items[i];
        if (item.is_nullish()) continue;
        if (item.is_array()) out += join_array(interp, item.as_array(), ",", stack);
        else out += to_display_string(item);
    }
    stack.pop_back();
    interp.heap().charge(out.size());
    return out;
}

// ---------------------------------------------------------------------------
// Number formatting
// ---------------------------------------------------------------------------

auto to_radix_string(double value, int radix) -> std::string {
    if (std::isnan(value)) return "NaN";
    if (std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";

    constexpr const char* kDigits = "0123456789abcdefghijklmnopqrstuvwxyz";
    bool negative = value < 0;
    double magnitude = std::fabs(value);
    double int_part = std::floor(magnitude);
    double frac = magnitude - int_part;

    std::string digits;
    do {
        auto d = static_cast<int>(std::fmod(int_part, radix));
        digits.insert(digits.begin(), kDigits[d]);
        int_part = std::floor(int_part / radix);
    } while (int_part > 0);

    if (frac > 0) {
        digits += '.';
        for (int i = 0; i < 20 && frac > 0; ++i) {
            frac *= radix;
            auto d = static_cast<int>(std::floor(frac));
            digits += kDigits[d];
            frac -= d;
        }
    }
    return negative ? "-" + digits : digits;
}

auto group_thousands(std::string digits) -> std::string {
    for (auto pos = static_cast<std::ptrdiff_t>(digits.size()) - 3; pos > 0; pos -= 3) {
        digits.insert(static_cast<std::size_t>(pos), 1, ',');
    }
    return digits;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// String methods
// ---------------------------------------------------------------------------

void install_string_methods(Interpreter& interp) {
    auto def = [&](const std::string& name, NativeFn fn) {
        interp.define_method(Receiver::String, name, std::move(fn));
    };

    def("charAt", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        const auto& s = self_string(interp, self);
        double i = to_integer(arg(args, 0));
        if (i < 0 || i >= static_cast<double>(s.size())) return "";
        return std::string(1, s[static_cast<std::size_t>(i)]);
    });
    def("charCodeAt", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        const auto& s = self_string(interp, self);
        double i = to_integer(arg(args, 0));
        if (i < 0 || i >= static_cast<double>(s.size())) return std::numeric_limits<double>::quiet_NaN();
        return static_cast<unsigned char>(s[static_cast<std::size_t>(i)]);
    });
    def("codePointAt", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        const auto& s = self_string(interp, self);
        double i = to_integer(arg(args, 0));
        if (i < 0 || i >= static_cast<double>(s.size())) return Value{};
        return decode_code_point(s, static_cast<std::size_t>(i));
    });
    def("at", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        const auto& s = self_string(interp, self);
        double i = to_integer(arg(args, 0));
        if (i < 0) i += static_cast<double>(s.size());
        if (i < 0 || i >= static_cast<double>(s.size())) return Value{};
        return std::string(1, s[static_cast<std::size_t>(i)]);
    });
    def("indexOf", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        const auto& s = self_string(interp, self);
        auto from = clamp_index(arg(args, 1), s.size(), 0);
        auto pos = s.find(to_display_string(arg(args, 0)), from);
        return pos == std::string::npos ? -1.0 : static_cast<double>(pos);
    });
    def("lastIndexOf", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        const auto& s = self_string(interp, self);
        auto from = clamp_index(arg(args, 1), s.size(), s.size());
        auto pos = s.rfind(to_display_string(arg(args, 0)), from);
        return pos == std::string::npos ? -1.0 : static_cast<double>(pos);
    });
    def("includes", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        const auto& s = self_string(interp, self);
        auto from = clamp_index(arg(args, 1), s.size(), 0);
        return s.find(to_display_string(arg(args, 0)), from) != std::string::npos;
    });
    def("startsWith", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        const auto& s = self_string(interp, self);
        auto from = clamp_index(arg(args, 1), s.size(), 0);
        return std::string_view(s).substr(from).starts_with(to_display_string(arg(args, 0)));
    });
    def("endsWith", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        const auto& s = self_string(interp, self);
        auto end = clamp_index(arg(args, 1), s.size(), s.size());
        return std::string_view(s).substr(0, end).ends_with(to_display_string(arg(args, 0)));
    });
    def("slice", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        const auto& s = self_string(interp, self);
        auto begin = relative_index(arg(args, 0), s.size(), 0);
        auto end = relative_index(arg(args, 1), s.size(), s.size());
        if (begin >= end) return "";
        return interp.make_string(s.substr(begin, end - begin));
    });
    def("substring", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        const auto& s = self_string(interp, self);
        auto begin = clamp_index(arg(args, 0), s.size(), 0);
        auto end = clamp_index(arg(args, 1), s.size(), s.size());
        if (begin > end) std::swap(begin, end);
        return interp.make_string(s.substr(begin, end - begin));
    });
    def("substr", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        const auto& s = self_string(interp, self);
        auto begin = relative_index(arg(args, 0), s.size(), 0);
        auto length = arg(args, 1);
        std::size_t count = s.size() - begin;
        if (!length.is_undefined()) {
            count = std::min(count, static_cast<std::size_t>(std::max(0.0, to_integer(length))));
        }
        return interp.make_string(s.substr(begin, count));
    });
    def("toUpperCase", [](Interpreter& interp, const Value& self, std::vector<Value>&) -> Value {
        return interp.make_string(utils::to_upper(self_string(interp, self)));
    });
    def("toLowerCase", [](Interpreter& interp, const Value& self, std::vector<Value>&) -> Value {
        return interp.make_string(utils::to_lower(self_string(interp, self)));
    });
    def("trim", [](Interpreter& interp, const Value& self, std::vector<Value>&) -> Value {
        return interp.make_string(utils::trim(self_string(interp, self)));
    });
    def("trimStart", [](Interpreter& interp, const Value& self, std::vector<Value>&) -> Value {
        const auto& s = self_string(interp, self);
        std::size_t i = 0;
        while (i < s.size() && is_space(s[i])) ++i;
        return interp.make_string(s.substr(i));
    });
    def("trimEnd", [](Interpreter& interp, const Value& self, std::vector<Value>&) -> Value {
        const auto& s = self_string(interp, self);
        std::size_t end = s.size();
        while (end > 0 && is_space(s[end - 1])) --end;
        return interp.make_string(s.substr(0, end));
    });
    def("padStart", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        return pad_string(interp, self_string(interp, self), args, true);
    });
    def("padEnd", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        return pad_string(interp, self_string(interp, self), args, false);
    });
    def("repeat", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        return repeat_string(interp, self_string(interp, self), to_integer(arg(args, 0)));
    });
    def("concat", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        std::string out = self_string(interp, self);
        for (const auto& a : args) out += to_display_string(a);
        return interp.make_string(std::move(out));
    });
    def("split", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        const auto& s = self_string(interp, self);
        auto separator = arg(args, 0);
        auto limit_arg = arg(args, 1);
        std::size_t limit = limit_arg.is_undefined()
                                ? std::numeric_limits<std::size_t>::max()
                                : static_cast<std::size_t>(std::max(0.0, to_integer(limit_arg)));

        std::vector<Value> parts;
        if (separator.is_undefined()) {
            parts.emplace_back(s);
        } else {
            auto sep = to_display_string(separator);
            if (sep.empty()) {
                for (auto& ch : split_code_points(s)) parts.emplace_back(std::move(ch));
            } else {
                std::size_t pos = 0;
                while (true) {
                    interp.check_cancelled();
                    auto found = s.find(sep, pos);
                    if (found == std::string::npos) {
                        parts.emplace_back(s.substr(pos));
                        break;
                    }
                    parts.emplace_back(s.substr(pos, found - pos));
                    pos = found + sep.size();
                }
            }
        }
        if (parts.size() > limit) parts.resize(limit);
        interp.heap().charge(s.size());
        return interp.heap().make_array(std::move(parts));
    });
    def("replace", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        return replace_string(interp, self, args, false);
    });
    def("replaceAll", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        return replace_string(interp, self, args, true);
    });
    def("localeCompare", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        int c = self_string(interp, self).compare(to_display_string(arg(args, 0)));
        return c < 0 ? -1.0 : c > 0 ? 1.0 : 0.0;
    });
    def("normalize", [](Interpreter& interp, const Value& self, std::vector<Value>&) -> Value {
        return self_string(interp, self);
    });
    def("toString", [](Interpreter& interp, const Value& self, std::vector<Value>&) -> Value {
        return self_string(interp, self);
    });
    def("valueOf", [](Interpreter& interp, const Value& self, std::vector<Value>&) -> Value {
        return self_string(interp, self);
    });
}

// ---------------------------------------------------------------------------
// Array methods
// ---------------------------------------------------------------------------

void install_array_methods(Interpreter& interp) {
    auto def = [&](const std::string& name, NativeFn fn) {
        interp.define_method(Receiver::Array, name, std::move(fn));
    };

    // Mutators
    def("push", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        auto* array = mutable_array(interp, self);
        interp.heap().charge(args.size() * sizeof(Value));
        for (auto& a : args) array->items.push_back(std::move(a));
        return array->items.size();
    });
    def("pop", [](Interpreter& interp, const Value& self, std::vector<Value>&) -> Value {
        auto* array = mutable_array(interp, self);
        if (array->items.empty()) return Value{};
        Value last = std::move(array->items.back());
        array->items.pop_back();
        return last;
    });
    def("shift", [](Interpreter& interp, const Value& self, std::vector<Value>&) -> Value {
        auto* array = mutable_array(interp, self);
        if (array->items.empty()) return Value{};
        Value first = std::move(array->items.front());
        array->items.erase(array->items.begin());
        return first;
    });
    def("unshift", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        auto* array = mutable_array(interp, self);
        interp.heap().charge(args.size() * sizeof(Value));
        array->items.insert(array->items.begin(), args.begin(), args.end());
        return array->items.size();
    });
    def("splice", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        auto* array = mutable_array(interp, self);
        auto& items = array->items;
        auto start = relative_index(arg(args, 0), items.size(), 0);
        std::size_t remove = items.size() - start;
        if (args.size() >= 2) {
            remove = std::min(remove, static_cast<std::size_t>(std::max(0.0, to_integer(args[1]))));
        } else if (args.empty()) {
            remove = 0;
        }
        auto first = items.begin() + static_cast<std::ptrdiff_t>(start);
        std::vector<Value> removed(first, first + static_cast<std::ptrdiff_t>(remove));
        items.erase(first, first + static_cast<std::ptrdiff_t>(remove));
        if (args.size() > 2) {
            interp.heap().charge((args.size() - 2) * sizeof(Value));
            items.insert(items.begin() + static_cast<std::ptrdiff_t>(start), args.begin() + 2, args.end());
        }
        return interp.heap().make_array(std::move(removed));
    });
    def("reverse", [](Interpreter& interp, const Value& self, std::vector<Value>&) -> Value {
        auto* array = mutable_array(interp, self);
        std::reverse(array->items.begin(), array->items.end());
        return self;
    });
    def("fill", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        auto* array = mutable_array(interp, self);
        auto begin = relative_index(arg(args, 1), array->items.size(), 0);
        auto end = relative_index(arg(args, 2), array->items.size(), array->items.size());
        for (auto i = begin; i < end; ++i) array->items[i] = arg(args, 0);
        return self;
    });
    def("sort", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        auto* array = mutable_array(interp, self);
        auto comparator = arg(args, 0);
        if (!comparator.is_undefined() && !comparator.is_function()) {
            interp.throw_error("TypeError", "The comparison function must be either a function or undefined");
        }
        std::vector<Value> items = array->items;
        if (comparator.is_function()) {
            merge_sort(items, [&](const Value& a, const Value& b) {
                if (a.is_undefined()) return false;
                if (b.is_undefined()) return true;
                double r = to_number(interp.call(comparator, Value{}, {b, a}));
                return r > 0;
            });
        } else {
            merge_sort(items, default_compare);
        }
        array->items = std::move(items);
        return self;
    });

    // Accessors
    def("slice", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        const auto& items = self_array(interp, self)->items;
        auto begin = relative_index(arg(args, 0), items.size(), 0);
        auto end = relative_index(arg(args, 1), items.size(), items.size());
        if (begin >= end) return interp.heap().make_array();
        return interp.heap().make_array(std::vector<Value>(items.begin() + static_cast<std::ptrdiff_t>(begin),
                                                           items.begin() + static_cast<std::ptrdiff_t>(end)));
    });
    def("concat", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        std::vector<Value> out = self_array(interp, self)->items;
        for (const auto& a : args) {
            if (a.is_array()) out.insert(out.end(), a.as_array()->items.begin(), a.as_array()->items.end());
            else out.push_back(a);
        }
        return interp.heap().make_array(std::move(out));
    });
    def("join", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        auto separator = arg(args, 0);
        std::vector<const Array*> stack;
        return join_array(interp, self_array(interp, self),
                          separator.is_undefined() ? std::string(",") : to_display_string(separator), stack);
    });
    def("toString", [](Interpreter& interp, const Value& self, std::vector<Value>&) -> Value {
        std::vector<const Array*> stack;
        return join_array(interp, self_array(interp, self), ",", stack);
    });
    def("indexOf", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        const auto& items = self_array(interp, self)->items;
        auto needle = arg(args, 0);
        for (auto i = relative_index(arg(args, 1), items.size(), 0); i < items.size(); ++i) {
            if (strict_equals(items[i], needle)) return static_cast<double>(i);
        }
        return -1.0;
    });
    def("lastIndexOf", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        const auto& items = self_array(interp, self)->items;
        auto needle = arg(args, 0);
        for (auto i = items.size(); i > 0; --i) {
            if (strict_equals(items[i - 1], needle)) return static_cast<double>(i - 1);
        }
        return -1.0;
    });
    def("includes", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        const auto& items = self_array(interp, self)->items;
        auto needle = arg(args, 0);
        return std::any_of(items.begin(), items.end(),
                           [&](const Value& v) { return same_value_zero(v, needle); });
    });
    def("at", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        const auto& items = self_array(interp, self)->items;
        double i = to_integer(arg(args, 0));
        if (i < 0) i += static_cast<double>(items.size());
        if (i < 0 || i >= static_cast<double>(items.size())) return Value{};
        return items[static_cast<std::size_t>(i)];
    });
    def("flat", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        auto depth_arg = arg(args, 0);
        double depth = depth_arg.is_undefined() ? 1.0 : to_integer(depth_arg);
        std::vector<Value> out;
        flatten_into(interp, self_array(interp, self)->items, depth, 0, out);
        return interp.heap().make_array(std::move(out));
    });
    def("keys", [](Interpreter& interp, const Value& self, std::vector<Value>&) -> Value {
        std::vector<Value> out;
        for (std::size_t i = 0; i < self_array(interp, self)->items.size(); ++i) out.emplace_back(i);
        return interp.heap().make_array(std::move(out));
    });
    def("values", [](Interpreter& interp, const Value& self, std::vector<Value>&) -> Value {
        return interp.heap().make_array(self_array(interp, self)->items);
    });
    def("entries", [](Interpreter& interp, const Value& self, std::vector<Value>&) -> Value {
        const auto items = self_array(interp, self)->items;
        std::vector<Value> out;
        for (std::size_t i = 0; i < items.size(); ++i) {
            out.emplace_back(interp.heap().make_array({static_cast<double>(i), items[i]}));
        }
        return interp.heap().make_array(std::move(out));
    });

    // Iteration
    def("forEach", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        auto fn = callback_arg(interp, args);
        for_each_element(interp, self, fn, [](const Value&, std::size_t, const Value&) { return true; });
        return Value{};
    });
    def("map", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        auto fn = callback_arg(interp, args);
        std::vector<Value> out;
        for_each_element(interp, self, fn, [&](const Value&, std::size_t, const Value& result) {
            out.push_back(result);
            return true;
        });
        return interp.heap().make_array(std::move(out));
    });
    def("filter", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        auto fn = callback_arg(interp, args);
        std::vector<Value> out;
        for_each_element(interp, self, fn, [&](const Value& item, std::size_t, const Value& result) {
            if (is_truthy(result)) out.push_back(item);
            return true;
        });
        return interp.heap().make_array(std::move(out));
    });
    def("flatMap", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        auto fn = callback_arg(interp, args);
        std::vector<Value> mapped;
        for_each_element(interp, self, fn, [&](const Value&, std::size_t, const Value& result) {
            mapped.push_back(result);
            return true;
        });
        std::vector<Value> out;
        flatten_into(interp, mapped, 1.0, 0, out);
        return interp.heap().make_array(std::move(out));
    });
    def("find", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        auto fn = callback_arg(interp, args);
        Value found;
        for_each_element(interp, self, fn, [&](const Value& item, std::size_t, const Value& result) {
            if (!is_truthy(result)) return true;
            found = item;
            return false;
        });
        return found;
    });
    def("findIndex", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        auto fn = callback_arg(interp, args);
        double found = -1;
        for_each_element(interp, self, fn, [&](const Value&, std::size_t i, const Value& result) {
            if (!is_truthy(result)) return true;
            found = static_cast<double>(i);
            return false;
        });
        return found;
    });
    def("findLast", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        auto fn = callback_arg(interp, args);
        const auto items = self_array(interp, self)->items;
        for (auto i = items.size(); i > 0; --i) {
            if (is_truthy(interp.call(fn, Value{}, {items[i - 1], static_cast<double>(i - 1), self}))) {
                return items[i - 1];
            }
        }
        return Value{};
    });
    def("findLastIndex", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        auto fn = callback_arg(interp, args);
        const auto items = self_array(interp, self)->items;
        for (auto i = items.size(); i > 0; --i) {
            if (is_truthy(interp.call(fn, Value{}, {items[i - 1], static_cast<double>(i - 1), self}))) {
                return static_cast<double>(i - 1);
            }
        }
        return -1.0;
    });
    def("some", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        auto fn = callback_arg(interp, args);
        bool any = false;
        for_each_element(interp, self, fn, [&](const Value&, std::size_t, const Value& result) {
            any = is_truthy(result);
            return !any;
        });
        return any;
    });
    def("every", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        auto fn = callback_arg(interp, args);
        bool all = true;
        for_each_element(interp, self, fn, [&](const Value&, std::size_t, const Value& result) {
            all = is_truthy(result);
            return all;
        });
        return all;
    });
    def("reduce", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        auto fn = callback_arg(interp, args);
        auto* array = self_array(interp, self);
        std::size_t length = array->items.size();
        std::size_t i = 0;
        Value acc;
        if (args.size() >= 2) {
            acc = args[1];
        } else {
            if (length == 0) interp.throw_error("TypeError", "Reduce of empty array with no initial value");
            acc = array->items[0];
            i = 1;
        }
        for (; i < length && i < array->items.size(); ++i) {
            Value item = array->items[i];
            acc = interp.call(fn, Value{}, {acc, item, static_cast<double>(i), self});
        }
        return acc;
    });
    def("reduceRight", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        auto fn = callback_arg(interp, args);
        const auto items = self_array(interp, self)->items;
        std::size_t i = items.size();
        Value acc;
        if (args.size() >= 2) {
            acc = args[1];
        } else {
            if (i == 0) interp.throw_error("TypeError", "Reduce of empty array with no initial value");
            acc = items[--i];
        }
        for (; i > 0; --i) {
            acc = interp.call(fn, Value{}, {acc, items[i - 1], static_cast<double>(i - 1), self});
        }
        return acc;
    });
}

// ---------------------------------------------------------------------------
// Number methods
// ---------------------------------------------------------------------------

void install_number_methods(Interpreter& interp) {
    auto def = [&](const std::string& name, NativeFn fn) {
        interp.define_method(Receiver::Number, name, std::move(fn));
    };

    def("toFixed", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        double x = self_number(interp, self);
        double digits = to_integer(arg(args, 0));
        if (digits < 0 || digits > 100) {
            interp.throw_error("RangeError", "toFixed() digits argument must be between 0 and 100");
        }
        if (!std::isfinite(x) || std::fabs(x) >= 1e21) return number_to_string(x);
        return std::format("{:.{}f}", x, static_cast<int>(digits));
    });
    def("toString", [](Interpreter& interp, const Value& self, std::vector<Value>& args) -> Value {
        double x = self_number(interp, self);
        auto radix_arg = arg(args, 0);
        int radix = radix_arg.is_undefined() ? 10 : static_cast<int>(to_integer(radix_arg));
        if (radix < 2 || radix > 36) {
            interp.throw_error("RangeError", "toString() radix must be between 2 and 36");
        }
        return radix == 10 ? number_to_string(x) : to_radix_string(x, radix);
    });
    def("toLocaleString", [](Interpreter& interp, const Value& self, std::vector<Value>&) -> Value {
        double x = self_number(interp, self);
        if (!std::isfinite(x)) return number_to_string(x);
        auto text = std::format("{:.3f}", std::fabs(x));
        auto dot = text.find('.');
        auto whole = group_thousands(text.substr(0, dot));
        auto fraction = text.substr(dot + 1);
        while (!fraction.empty() && fraction.back() == '0') fraction.pop_back();
        std::string out = x < 0 && (whole != "0" || !fraction.empty()) ? "-" : "";
        out += whole;
        if (!fraction.empty()) out += "." + fraction;
        return out;
    });
    def("valueOf", [](Interpreter& interp, const Value& self, std::vector<Value>&) -> Value {
        return self_number(interp, self);
    });
}

} // namespace ctxopt::script
