#include "flexcal/config/value.hpp"
#include "flexcal/config/parameter_set.hpp"
#include "flexcal/core/errors.hpp"
#include "flexcal/core/utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <limits>

namespace flexcal::config {

std::string value_kind_to_string(ValueKind kind) {
    switch (kind) {
        case ValueKind::Bool: return "bool";
        case ValueKind::Int: return "int";
        case ValueKind::Float: return "float";
        case ValueKind::String: return "str";
        case ValueKind::NumericList: return "list";
        case ValueKind::StringList: return "list[str]";
        case ValueKind::ParSet: return "ParSet";
        case ValueKind::ParSetList: return "list[ParSet]";
        case ValueKind::Callable: return "callable";
    }
    return "unknown";
}

ValueKind string_to_value_kind(const std::string& s) {
    if (s == "bool") return ValueKind::Bool;
    if (s == "int") return ValueKind::Int;
    if (s == "float") return ValueKind::Float;
    if (s == "str") return ValueKind::String;
    if (s == "list") return ValueKind::NumericList;
    if (s == "list[str]") return ValueKind::StringList;
    if (s == "ParSet") return ValueKind::ParSet;
    if (s == "list[ParSet]") return ValueKind::ParSetList;
    if (s == "callable") return ValueKind::Callable;
    throw ValidationError("Unknown value kind: " + s);
}

ValueKind Value::kind() const {
    return static_cast<ValueKind>(storage_.index());
}

namespace {

[[noreturn]] void wrong_kind(const Value& v, ValueKind wanted) {
    throw TypeError("Value of type " + value_kind_to_string(v.kind()) +
                    " requested as " + value_kind_to_string(wanted));
}

} // namespace

bool Value::as_bool() const {
    if (!is<bool>()) wrong_kind(*this, ValueKind::Bool);
    return std::get<bool>(storage_);
}

int Value::as_int() const {
    if (!is<int>()) wrong_kind(*this, ValueKind::Int);
    return std::get<int>(storage_);
}

double Value::as_double() const {
    if (is<int>()) return static_cast<double>(std::get<int>(storage_));
    if (!is<double>()) wrong_kind(*this, ValueKind::Float);
    return std::get<double>(storage_);
}

const std::string& Value::as_string() const {
    if (!is<std::string>()) wrong_kind(*this, ValueKind::String);
    return std::get<std::string>(storage_);
}

const std::vector<double>& Value::as_numeric_list() const {
    if (!is<std::vector<double>>()) wrong_kind(*this, ValueKind::NumericList);
    return std::get<std::vector<double>>(storage_);
}

const std::vector<std::string>& Value::as_string_list() const {
    if (!is<std::vector<std::string>>()) wrong_kind(*this, ValueKind::StringList);
    return std::get<std::vector<std::string>>(storage_);
}

const ParSetPtr& Value::as_parset() const {
    if (!is<ParSetPtr>()) wrong_kind(*this, ValueKind::ParSet);
    return std::get<ParSetPtr>(storage_);
}

const std::vector<ParSetPtr>& Value::as_parset_list() const {
    if (!is<std::vector<ParSetPtr>>()) wrong_kind(*this, ValueKind::ParSetList);
    return std::get<std::vector<ParSetPtr>>(storage_);
}

const CallableRef& Value::as_callable() const {
    if (!is<CallableRef>()) wrong_kind(*this, ValueKind::Callable);
    return std::get<CallableRef>(storage_);
}

Value Value::clone() const {
    if (is<ParSetPtr>()) {
        const auto& p = std::get<ParSetPtr>(storage_);
        return Value(p ? p->clone() : ParSetPtr());
    }
    if (is<std::vector<ParSetPtr>>()) {
        std::vector<ParSetPtr> out;
        for (const auto& p : std::get<std::vector<ParSetPtr>>(storage_)) {
            out.push_back(p ? p->clone() : ParSetPtr());
        }
        return Value(std::move(out));
    }
    return *this;
}

namespace {

bool parses_as_number(const std::string& s) {
    if (s.empty()) return false;
    const char* begin = s.c_str();
    char* end = nullptr;
    std::strtod(begin, &end);
    return end == begin + s.size();
}

bool needs_quotes(const std::string& s) {
    if (s.empty()) return true;
    if (s != core::trim(s)) return true;
    if (s.find_first_of(",#\"'\\") != std::string::npos) return true;
    if (s == "None" || s == "True" || s == "False" || s == "[]") return true;
    return parses_as_number(s);
}

// Double-quoted with '"' and '\\' escaped by a backslash
std::string quote_if_needed(const std::string& s) {
    if (!needs_quotes(s)) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

template <typename T, typename F>
std::string list_to_string(const std::vector<T>& items, F&& fmt) {
    if (items.empty()) return "[]";
    std::vector<std::string> parts;
    parts.reserve(items.size());
    for (const auto& item : items) parts.push_back(fmt(item));
    std::string out = core::join(parts, ", ");
    // Single-element lists keep a trailing comma so they read back as lists
    if (items.size() == 1) out += ",";
    return out;
}

} // namespace

std::string Value::to_config_string() const {
    switch (kind()) {
        case ValueKind::Bool:
            return as_bool() ? "True" : "False";
        case ValueKind::Int:
            return std::to_string(as_int());
        case ValueKind::Float:
            return core::format_double(std::get<double>(storage_));
        case ValueKind::String:
            return quote_if_needed(as_string());
        case ValueKind::NumericList:
            return list_to_string(as_numeric_list(),
                                  [](double d) { return core::format_double(d); });
        case ValueKind::StringList:
            return list_to_string(as_string_list(),
                                  [](const std::string& s) { return quote_if_needed(s); });
        case ValueKind::ParSet:
            return "see below";
        case ValueKind::ParSetList:
            return as_parset_list().empty() ? "[]" : "see below";
        case ValueKind::Callable:
            return as_callable().name;
    }
    return "";
}

bool Value::operator==(const Value& other) const {
    if (kind() != other.kind()) return false;

    switch (kind()) {
        case ValueKind::ParSet: {
            const auto& a = as_parset();
            const auto& b = other.as_parset();
            if (!a || !b) return a == b;
            return *a == *b;
        }
        case ValueKind::ParSetList: {
            const auto& a = as_parset_list();
            const auto& b = other.as_parset_list();
            if (a.size() != b.size()) return false;
            for (std::size_t i = 0; i < a.size(); ++i) {
                if (!a[i] || !b[i]) {
                    if (a[i] != b[i]) return false;
                    continue;
                }
                if (!(*a[i] == *b[i])) return false;
            }
            return true;
        }
        default:
            return storage_ == other.storage_;
    }
}

bool values_equal(const OptionalValue& a, const OptionalValue& b) {
    if (!a || !b) return !a && !b;
    return *a == *b;
}

std::string optional_to_config_string(const OptionalValue& v) {
    return v ? v->to_config_string() : "None";
}

namespace {

bool allowed(const std::vector<ValueKind>& kinds, ValueKind k) {
    return kinds.empty() || std::find(kinds.begin(), kinds.end(), k) != kinds.end();
}

// Index of the quote closing the one at open; backslash escapes the next char
std::size_t closing_quote(const std::string& s, std::size_t open) {
    const char q = s[open];
    for (std::size_t i = open + 1; i < s.size(); ++i) {
        if (s[i] == '\\') {
            ++i;
        } else if (s[i] == q) {
            return i;
        }
    }
    return std::string::npos;
}

// True only when a single quoted token spans the whole text
bool is_quoted(const std::string& s) {
    if (s.size() < 2 || (s.front() != '"' && s.front() != '\'')) return false;
    return closing_quote(s, 0) == s.size() - 1;
}

std::string unquote(const std::string& s) {
    if (!is_quoted(s)) return s;
    std::string out;
    for (std::size_t i = 1; i + 1 < s.size(); ++i) {
        if (s[i] == '\\') ++i;
        out += s[i];
    }
    return out;
}

/**
 * Split on commas outside quotes; a trailing empty item is dropped. A quote
 * only opens at the start of an item, so apostrophes inside bare words are
 * plain characters.
 */
std::vector<std::string> split_list(const std::string& text, bool& is_list) {
    std::vector<std::string> items;
    std::string current;
    char quote = 0;
    is_list = false;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (quote) {
            current += c;
            if (c == '\\' && i + 1 < text.size()) {
                current += text[++i];
            } else if (c == quote) {
                quote = 0;
            }
        } else if ((c == '"' || c == '\'') && core::trim(current).empty()) {
            quote = c;
            current += c;
        } else if (c == ',') {
            is_list = true;
            items.push_back(core::trim(current));
            current.clear();
        } else {
            current += c;
        }
    }
    std::string last = core::trim(current);
    if (!is_list || !last.empty()) {
        items.push_back(last);
    }
    return items;
}

std::optional<int> try_parse_int(const std::string& s) {
    if (s.empty()) return std::nullopt;
    std::size_t i = (s[0] == '+' || s[0] == '-') ? 1 : 0;
    if (i == s.size()) return std::nullopt;
    for (std::size_t j = i; j < s.size(); ++j) {
        if (s[j] < '0' || s[j] > '9') return std::nullopt;
    }
    errno = 0;
    long v = std::strtol(s.c_str(), nullptr, 10);
    if (errno == ERANGE || v > std::numeric_limits<int>::max() ||
        v < std::numeric_limits<int>::min()) {
        return std::nullopt;
    }
    return static_cast<int>(v);
}

std::optional<double> try_parse_double(const std::string& s) {
    if (!parses_as_number(s)) return std::nullopt;
    return std::strtod(s.c_str(), nullptr);
}

std::optional<bool> try_parse_bool(const std::string& s) {
    if (s == "True" || s == "true") return true;
    if (s == "False" || s == "false") return false;
    return std::nullopt;
}

} // namespace

OptionalValue parse_config_value(const std::string& raw,
                                 const std::vector<ValueKind>& kinds) {
    const std::string text = core::trim(raw);
    if (text == "None") return std::nullopt;

    bool is_list = false;
    std::vector<std::string> items;
    if (text == "[]") {
        is_list = true;
    } else if (!is_quoted(text)) {
        items = split_list(text, is_list);
    }

    if (is_list) {
        if (allowed(kinds, ValueKind::NumericList)) {
            std::vector<double> numbers;
            bool all_numeric = true;
            for (const auto& item : items) {
                auto d = try_parse_double(item);
                if (!d) {
                    all_numeric = false;
                    break;
                }
                numbers.push_back(*d);
            }
            if (all_numeric) return Value(std::move(numbers));
        }
        if (allowed(kinds, ValueKind::StringList)) {
            std::vector<std::string> strings;
            for (const auto& item : items) strings.push_back(unquote(item));
            return Value(std::move(strings));
        }
        throw ValidationError("Cannot interpret list value '" + text + "' as any of the "
                              "allowed types");
    }

    return parse_scalar_value(text, kinds);
}

OptionalValue parse_scalar_value(const std::string& raw,
                                 const std::vector<ValueKind>& kinds) {
    const std::string text = core::trim(raw);
    if (text == "None") return std::nullopt;

    if (is_quoted(text)) {
        if (allowed(kinds, ValueKind::String)) return Value(unquote(text));
        if (allowed(kinds, ValueKind::StringList)) {
            return Value(std::vector<std::string>{unquote(text)});
        }
        throw ValidationError("Quoted value '" + text + "' given for a non-string parameter");
    }

    if (allowed(kinds, ValueKind::Bool)) {
        if (auto b = try_parse_bool(text)) return Value(*b);
    }
    if (allowed(kinds, ValueKind::Int)) {
        if (auto i = try_parse_int(text)) return Value(*i);
    }
    if (allowed(kinds, ValueKind::Float)) {
        if (auto d = try_parse_double(text)) return Value(*d);
    }
    if (allowed(kinds, ValueKind::String)) {
        return Value(text);
    }
    if (allowed(kinds, ValueKind::NumericList)) {
        if (auto d = try_parse_double(text)) return Value(std::vector<double>{*d});
    }
    if (allowed(kinds, ValueKind::StringList)) {
        return Value(std::vector<std::string>{text});
    }
    throw ValidationError("Cannot interpret value '" + text + "' as any of the allowed types");
}

} // namespace flexcal::config
