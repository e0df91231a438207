#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace flexcal::config {

class ParameterSet;
using ParSetPtr = std::shared_ptr<ParameterSet>;

// Closed set of value categories a parameter can hold
enum class ValueKind {
    Bool,
    Int,
    Float,
    String,
    NumericList,
    StringList,
    ParSet,
    ParSetList,
    Callable
};

std::string value_kind_to_string(ValueKind kind);
ValueKind string_to_value_kind(const std::string& s);

// Named reference to an invocable operation
struct CallableRef {
    std::string name;
    std::function<double(double)> fn;

    bool invocable() const { return static_cast<bool>(fn); }
    bool operator==(const CallableRef& other) const { return name == other.name; }
};

class Value {
public:
    using Storage = std::variant<bool, int, double, std::string,
                                 std::vector<double>, std::vector<std::string>,
                                 ParSetPtr, std::vector<ParSetPtr>, CallableRef>;

    Value(bool v) : storage_(v) {}
    Value(int v) : storage_(v) {}
    Value(double v) : storage_(v) {}
    Value(const char* v) : storage_(std::string(v)) {}
    Value(std::string v) : storage_(std::move(v)) {}
    Value(std::vector<double> v) : storage_(std::move(v)) {}
    Value(std::vector<std::string> v) : storage_(std::move(v)) {}
    Value(ParSetPtr v) : storage_(std::move(v)) {}
    Value(std::vector<ParSetPtr> v) : storage_(std::move(v)) {}
    Value(CallableRef v) : storage_(std::move(v)) {}

    ValueKind kind() const;

    template <typename T>
    bool is() const { return std::holds_alternative<T>(storage_); }

    bool as_bool() const;
    int as_int() const;
    // Int values promote to double
    double as_double() const;
    const std::string& as_string() const;
    const std::vector<double>& as_numeric_list() const;
    const std::vector<std::string>& as_string_list() const;
    const ParSetPtr& as_parset() const;
    const std::vector<ParSetPtr>& as_parset_list() const;
    const CallableRef& as_callable() const;

    bool is_nested() const {
        return kind() == ValueKind::ParSet || kind() == ValueKind::ParSetList;
    }

    // Deep copy; nested parameter sets are cloned
    Value clone() const;

    // Text used on the right of "key = " in a config file
    std::string to_config_string() const;

    const Storage& storage() const { return storage_; }

    // Structural equality; nested sets compare by content
    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    Storage storage_;
};

using OptionalValue = std::optional<Value>;

bool values_equal(const OptionalValue& a, const OptionalValue& b);

// Config text of an optional value; unset renders as "None"
std::string optional_to_config_string(const OptionalValue& v);

/**
 * Parse config text into a value. The allowed kinds steer the interpretation
 * ("1" is Int when Int is allowed, Float when only Float is); an empty kinds
 * list lets the text decide. "None" parses to an unset value. Nested kinds
 * cannot be parsed from a single value and raise ValidationError.
 */
OptionalValue parse_config_value(const std::string& text,
                                 const std::vector<ValueKind>& kinds);

// As parse_config_value, but commas never split the text into a list
OptionalValue parse_scalar_value(const std::string& text,
                                 const std::vector<ValueKind>& kinds);

} // namespace flexcal::config
