#pragma once

#include "flexcal/config/value.hpp"
#include "flexcal/core/types.hpp"
#include "flexcal/io/config_file.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace flexcal::core {
class Logger;
}

namespace flexcal::config {

/**
 * Typed, constrained, nestable key/value container.
 *
 * Every key carries a current value, a default, an optional list of allowed
 * options, an optional list of allowed kinds, a callable flag and a
 * description. Values are re-validated on every write; unset (std::nullopt)
 * is always accepted. Keys keep insertion order, which fixes the order of
 * every rendering.
 */
class ParameterSet {
public:
    /**
     * Optional lists are either empty ("not provided") or exactly as long as
     * keys; any other length, or a repeated key, raises SchemaError. Unset
     * values take their default. Per-key empty options/dtypes mean
     * unconstrained.
     */
    explicit ParameterSet(std::vector<std::string> keys,
                          std::vector<OptionalValue> values = {},
                          std::vector<OptionalValue> defaults = {},
                          std::vector<std::vector<Value>> options = {},
                          std::vector<std::vector<ValueKind>> dtypes = {},
                          std::vector<bool> can_call = {},
                          std::vector<std::string> descr = {},
                          std::string cfg_section = "",
                          std::string cfg_comment = "");

    const std::vector<std::string>& keys() const { return keys_; }
    std::size_t npar() const { return keys_.size(); }
    std::size_t size() const { return keys_.size(); }
    bool contains(const std::string& key) const;

    const OptionalValue& get(const std::string& key) const;
    const OptionalValue& operator[](const std::string& key) const { return get(key); }
    void set(const std::string& key, OptionalValue value);

    // Convenience accessors; throw ValidationError when the key is unset
    bool get_bool(const std::string& key) const;
    int get_int(const std::string& key) const;
    double get_double(const std::string& key) const;
    const std::string& get_string(const std::string& key) const;
    const ParameterSet& get_parset(const std::string& key) const;

    const OptionalValue& default_value(const std::string& key) const;
    const std::vector<Value>& options(const std::string& key) const;
    const std::vector<ValueKind>& dtypes(const std::string& key) const;
    bool can_call(const std::string& key) const;
    const std::string& description(const std::string& key) const;

    const std::string& cfg_section() const { return cfg_section_; }
    const std::string& cfg_comment() const { return cfg_comment_; }

    // Schema extension; rolls back if the initial value is rejected
    void add(const std::string& key,
             OptionalValue value,
             OptionalValue default_value = std::nullopt,
             std::vector<Value> options = {},
             std::vector<ValueKind> dtype = {},
             bool can_call = false,
             std::string descr = "");

    void validate_keys(const std::optional<std::vector<std::string>>& required,
                       const std::optional<std::vector<std::string>>& can_be_none) const;

    std::shared_ptr<ParameterSet> clone() const;

    static std::vector<std::string> config_lines(const ParameterSet& par,
                                                 const std::string& section_name,
                                                 const std::string& section_comment = "",
                                                 int section_level = 0,
                                                 bool exclude_defaults = false,
                                                 bool include_descr = true);

    std::vector<std::string> to_config(const std::string& section_name = "",
                                       const std::string& section_comment = "",
                                       int section_level = 0,
                                       bool exclude_defaults = false,
                                       bool include_descr = true) const;

    void write_config(const fs::path& path,
                      const std::string& section_name = "",
                      const std::string& section_comment = "",
                      bool append = false,
                      bool exclude_defaults = false,
                      bool include_descr = true,
                      core::Logger* logger = nullptr) const;

    /**
     * Parse config text against a schema. The result is a deep copy of
     * schema with every parsed value assigned through set(). When schema has
     * a cfg_section and holds plain values, the root must contain that
     * section; otherwise each top-level section maps to a nested key.
     */
    static ParameterSet from_config(const std::vector<std::string>& lines,
                                    const ParameterSet& schema);
    static ParameterSet from_config_file(const fs::path& path, const ParameterSet& schema);

    YAML::Node to_yaml() const;
    static ParameterSet from_yaml(const YAML::Node& node, const ParameterSet& schema);

    nlohmann::json schema_json() const;

    // Short table: Parameter, Value, Default, Type, Callable
    std::string to_string(const std::string& header = "") const;
    // Long form including options and descriptions
    std::string info(const std::string& basekey = "") const;

    // Same keys with equal values; schema metadata is not compared
    bool operator==(const ParameterSet& other) const;
    bool operator!=(const ParameterSet& other) const { return !(*this == other); }

private:
    std::size_t index_of(const std::string& key) const;
    void check_value(std::size_t idx, const Value& value) const;
    void assign_text(std::size_t idx, const std::string& text, bool split_lists);
    void apply_section(const io::ConfigSection& section);
    void apply_yaml(const YAML::Node& node);

    std::vector<std::string> keys_;
    std::vector<OptionalValue> data_;
    std::vector<OptionalValue> defaults_;
    std::vector<std::vector<Value>> options_;
    std::vector<std::vector<ValueKind>> dtypes_;
    std::vector<bool> can_call_;
    std::vector<std::string> descr_;
    std::string cfg_section_;
    std::string cfg_comment_;
};

// Comma-separated kind names, e.g. "int, float"
std::string kinds_to_string(const std::vector<ValueKind>& kinds);

} // namespace flexcal::config
