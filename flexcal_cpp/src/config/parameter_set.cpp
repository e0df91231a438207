#include "flexcal/config/parameter_set.hpp"
#include "flexcal/core/errors.hpp"
#include "flexcal/core/logging.hpp"
#include "flexcal/core/utils.hpp"

#include <algorithm>
#include <set>
#include <sstream>

namespace flexcal::config {

std::string kinds_to_string(const std::vector<ValueKind>& kinds) {
    std::vector<std::string> names;
    names.reserve(kinds.size());
    for (auto k : kinds) names.push_back(value_kind_to_string(k));
    return core::join(names, ", ");
}

namespace {

template <typename T>
void check_length(const std::vector<T>& list, std::size_t npar, const std::string& what) {
    if (!list.empty() && list.size() != npar) {
        throw SchemaError(what + " must be a list with the same length as the keys list");
    }
}

bool option_matches(const Value& option, const Value& value) {
    const bool opt_numeric = option.kind() == ValueKind::Int || option.kind() == ValueKind::Float;
    const bool val_numeric = value.kind() == ValueKind::Int || value.kind() == ValueKind::Float;
    if (opt_numeric && val_numeric) {
        return option.as_double() == value.as_double();
    }
    return option == value;
}

std::string options_to_string(const std::vector<Value>& options) {
    std::vector<std::string> parts;
    parts.reserve(options.size());
    for (const auto& o : options) parts.push_back(o.to_config_string());
    return core::join(parts, ", ");
}

std::string list_to_string(const std::vector<std::string>& items) {
    return "[" + core::join(items, ", ") + "]";
}

std::vector<std::string> config_comment(const std::string& comment, const std::string& indent,
                                        std::size_t full_width = 72) {
    const std::string head = indent + "# ";
    std::vector<std::string> lines;
    for (const auto& l : core::wrap_text(comment, full_width - std::min(full_width, head.size()))) {
        lines.push_back(head + l);
    }
    return lines;
}

bool holds_parset(const OptionalValue& v) {
    return v && v->kind() == ValueKind::ParSet && v->as_parset();
}

} // namespace

ParameterSet::ParameterSet(std::vector<std::string> keys,
                           std::vector<OptionalValue> values,
                           std::vector<OptionalValue> defaults,
                           std::vector<std::vector<Value>> options,
                           std::vector<std::vector<ValueKind>> dtypes,
                           std::vector<bool> can_call,
                           std::vector<std::string> descr,
                           std::string cfg_section,
                           std::string cfg_comment)
    : keys_(std::move(keys)),
      cfg_section_(std::move(cfg_section)),
      cfg_comment_(std::move(cfg_comment)) {
    const std::size_t npar = keys_.size();

    std::set<std::string> unique(keys_.begin(), keys_.end());
    if (unique.size() != npar) {
        throw SchemaError("All input parameter keys must be unique");
    }
    for (const auto& k : keys_) {
        if (k.empty()) throw SchemaError("Input parameter keys must be non-empty strings");
    }

    check_length(values, npar, "Values");
    check_length(defaults, npar, "Defaults");
    check_length(options, npar, "Options");
    check_length(dtypes, npar, "Data types");
    check_length(can_call, npar, "Callable flags");
    check_length(descr, npar, "Descriptions");

    defaults_ = defaults.empty() ? std::vector<OptionalValue>(npar) : std::move(defaults);
    options_ = options.empty() ? std::vector<std::vector<Value>>(npar) : std::move(options);
    dtypes_ = dtypes.empty() ? std::vector<std::vector<ValueKind>>(npar) : std::move(dtypes);
    can_call_ = can_call.empty() ? std::vector<bool>(npar, false) : std::move(can_call);
    descr_ = descr.empty() ? std::vector<std::string>(npar) : std::move(descr);
    data_.resize(npar);

    for (std::size_t i = 0; i < npar; ++i) {
        OptionalValue v = (values.empty() || !values[i]) ? defaults_[i] : values[i];
        set(keys_[i], std::move(v));
    }
}

bool ParameterSet::contains(const std::string& key) const {
    return std::find(keys_.begin(), keys_.end(), key) != keys_.end();
}

std::size_t ParameterSet::index_of(const std::string& key) const {
    auto it = std::find(keys_.begin(), keys_.end(), key);
    if (it == keys_.end()) {
        throw ValidationError("Unknown parameter: " + key);
    }
    return static_cast<std::size_t>(it - keys_.begin());
}

void ParameterSet::check_value(std::size_t idx, const Value& value) const {
    const std::string& key = keys_[idx];

    if (value.kind() == ValueKind::ParSetList) {
        for (const auto& p : value.as_parset_list()) {
            if (!p) {
                throw ValidationError("List for " + key + " contains an empty parameter set");
            }
        }
    }

    const auto& opts = options_[idx];
    if (!opts.empty()) {
        bool found = std::any_of(opts.begin(), opts.end(),
                                 [&](const Value& o) { return option_matches(o, value); });
        if (!found) {
            throw ValidationError("Input value for " + key + " invalid: " +
                                  value.to_config_string() + ". Options are: " +
                                  options_to_string(opts));
        }
    }

    const auto& kinds = dtypes_[idx];
    if (!kinds.empty() && std::find(kinds.begin(), kinds.end(), value.kind()) == kinds.end()) {
        throw TypeError("Input value for " + key + " has incorrect type: " +
                        value_kind_to_string(value.kind()) + ". Valid types are: " +
                        kinds_to_string(kinds));
    }

    if (can_call_[idx] &&
        !(value.kind() == ValueKind::Callable && value.as_callable().invocable())) {
        throw TypeError(value.to_config_string() + " is not a callable object");
    }
}

const OptionalValue& ParameterSet::get(const std::string& key) const {
    return data_[index_of(key)];
}

void ParameterSet::set(const std::string& key, OptionalValue value) {
    const std::size_t idx = index_of(key);
    if (!value) {
        data_[idx].reset();
        return;
    }
    check_value(idx, *value);
    data_[idx] = std::move(value);
}

namespace {

const Value& require_set(const OptionalValue& v, const std::string& key) {
    if (!v) throw ValidationError("Parameter " + key + " is not set");
    return *v;
}

} // namespace

bool ParameterSet::get_bool(const std::string& key) const {
    return require_set(get(key), key).as_bool();
}

int ParameterSet::get_int(const std::string& key) const {
    return require_set(get(key), key).as_int();
}

double ParameterSet::get_double(const std::string& key) const {
    return require_set(get(key), key).as_double();
}

const std::string& ParameterSet::get_string(const std::string& key) const {
    return require_set(get(key), key).as_string();
}

const ParameterSet& ParameterSet::get_parset(const std::string& key) const {
    const auto& p = require_set(get(key), key).as_parset();
    if (!p) throw ValidationError("Parameter " + key + " is not set");
    return *p;
}

const OptionalValue& ParameterSet::default_value(const std::string& key) const {
    return defaults_[index_of(key)];
}

const std::vector<Value>& ParameterSet::options(const std::string& key) const {
    return options_[index_of(key)];
}

const std::vector<ValueKind>& ParameterSet::dtypes(const std::string& key) const {
    return dtypes_[index_of(key)];
}

bool ParameterSet::can_call(const std::string& key) const {
    return can_call_[index_of(key)];
}

const std::string& ParameterSet::description(const std::string& key) const {
    return descr_[index_of(key)];
}

void ParameterSet::add(const std::string& key,
                       OptionalValue value,
                       OptionalValue default_value,
                       std::vector<Value> options,
                       std::vector<ValueKind> dtype,
                       bool can_call,
                       std::string descr) {
    if (contains(key)) {
        throw DuplicateKeyError(key);
    }
    if (key.empty()) {
        throw SchemaError("Input parameter keys must be non-empty strings");
    }

    keys_.push_back(key);
    data_.emplace_back();
    defaults_.push_back(std::move(default_value));
    options_.push_back(std::move(options));
    dtypes_.push_back(std::move(dtype));
    can_call_.push_back(can_call);
    descr_.push_back(std::move(descr));

    try {
        set(key, std::move(value));
    } catch (const FlexcalError&) {
        keys_.pop_back();
        data_.pop_back();
        defaults_.pop_back();
        options_.pop_back();
        dtypes_.pop_back();
        can_call_.pop_back();
        descr_.pop_back();
        throw;
    }
}

void ParameterSet::validate_keys(const std::optional<std::vector<std::string>>& required,
                                 const std::optional<std::vector<std::string>>& can_be_none) const {
    if (required) {
        std::vector<std::string> missing;
        for (const auto& k : *required) {
            if (!contains(k)) missing.push_back(k);
        }
        if (!missing.empty()) {
            throw ValidationError("Required keys were not defined: " + list_to_string(missing));
        }
    }

    if (can_be_none) {
        std::vector<std::string> unset;
        for (std::size_t i = 0; i < keys_.size(); ++i) {
            if (data_[i]) continue;
            if (std::find(can_be_none->begin(), can_be_none->end(), keys_[i]) ==
                can_be_none->end()) {
                unset.push_back(keys_[i]);
            }
        }
        if (!unset.empty()) {
            throw ValidationError("These keys should not be None: " + list_to_string(unset));
        }
    }
}

std::shared_ptr<ParameterSet> ParameterSet::clone() const {
    auto copy = std::make_shared<ParameterSet>(*this);
    for (auto& v : copy->data_) {
        if (v) v = v->clone();
    }
    for (auto& v : copy->defaults_) {
        if (v) v = v->clone();
    }
    return copy;
}

std::vector<std::string> ParameterSet::config_lines(const ParameterSet& par,
                                                    const std::string& section_name,
                                                    const std::string& section_comment,
                                                    int section_level,
                                                    bool exclude_defaults,
                                                    bool include_descr) {
    const std::string section_indent(static_cast<std::size_t>(4 * section_level), ' ');
    const std::string component_indent = section_indent + "    ";
    const std::string open(static_cast<std::size_t>(section_level + 1), '[');
    const std::string close(static_cast<std::size_t>(section_level + 1), ']');

    std::vector<std::string> lines;
    if (!section_comment.empty()) {
        lines = config_comment(section_comment, section_indent);
    }
    lines.push_back(section_indent + open + section_name + close);
    const std::size_t min_lines = lines.size();

    auto append = [&lines](std::vector<std::string> more) {
        lines.insert(lines.end(), std::make_move_iterator(more.begin()),
                     std::make_move_iterator(more.end()));
    };

    // Plain keys come first; anything after a subsection header would be
    // read back as part of that subsection
    std::vector<std::size_t> nested;
    for (std::size_t i = 0; i < par.keys_.size(); ++i) {
        const std::string& k = par.keys_[i];
        const OptionalValue& v = par.data_[i];

        if (holds_parset(v) ||
            (v && v->kind() == ValueKind::ParSetList && !v->as_parset_list().empty())) {
            nested.push_back(i);
            continue;
        }

        if (exclude_defaults && values_equal(v, par.defaults_[i])) continue;

        if (include_descr && !par.descr_[i].empty()) {
            append(config_comment(par.descr_[i], component_indent));
        }
        lines.push_back(component_indent + k + " = " + optional_to_config_string(v));
    }

    for (std::size_t i : nested) {
        const std::string& k = par.keys_[i];
        const Value& v = *par.data_[i];
        if (v.kind() == ValueKind::ParSet) {
            const std::string comment = include_descr ? par.descr_[i] : std::string();
            append(config_lines(*v.as_parset(), k, comment, section_level + 1,
                                exclude_defaults, include_descr));
            continue;
        }

        // Lists of parameter sets become indexed subsections
        const auto& list = v.as_parset_list();
        const std::size_t ndig = core::decimal_width(list.size());
        for (std::size_t j = 0; j < list.size(); ++j) {
            const std::string indx = core::zero_pad(j + 1, ndig);
            std::string comment;
            if (include_descr && !par.descr_[i].empty()) {
                comment = par.descr_[i] + ": " + indx;
            }
            append(config_lines(*list[j], k + indx, comment, section_level + 1,
                                exclude_defaults, include_descr));
        }
    }

    if (lines.size() <= min_lines) return {};
    return lines;
}

std::vector<std::string> ParameterSet::to_config(const std::string& section_name,
                                                 const std::string& section_comment,
                                                 int section_level,
                                                 bool exclude_defaults,
                                                 bool include_descr) const {
    std::vector<std::string> output;

    const bool all_nested = std::all_of(data_.begin(), data_.end(), [](const OptionalValue& v) {
        return !v || holds_parset(v);
    });

    if (all_nested) {
        for (std::size_t i = 0; i < keys_.size(); ++i) {
            if (!data_[i]) continue;
            const std::string comment = include_descr ? descr_[i] : std::string();
            auto lines = config_lines(*data_[i]->as_parset(), keys_[i], comment, section_level,
                                      exclude_defaults, include_descr);
            output.insert(output.end(), lines.begin(), lines.end());
        }
        return output;
    }

    const std::string name = section_name.empty() ? cfg_section_ : section_name;
    if (name.empty()) {
        throw SchemaError("No top-level section name available for configuration");
    }
    const std::string comment = section_comment.empty() ? cfg_comment_ : section_comment;
    return config_lines(*this, name, include_descr ? comment : std::string(), section_level,
                        exclude_defaults, include_descr);
}

void ParameterSet::write_config(const fs::path& path,
                                const std::string& section_name,
                                const std::string& section_comment,
                                bool append,
                                bool exclude_defaults,
                                bool include_descr,
                                core::Logger* logger) const {
    if (!append && fs::exists(path) && logger != nullptr) {
        logger->warn("Selected configuration file already exists and will be overwritten: " +
                     path.string());
    }
    auto lines = to_config(section_name, section_comment, 0, exclude_defaults, include_descr);
    std::string text = core::join(lines, "\n");
    if (!text.empty()) text += "\n";
    core::write_text(path, text, append);
}

std::string ParameterSet::to_string(const std::string& header) const {
    std::vector<std::vector<std::string>> rows;
    rows.push_back({"Parameter", "Value", "Default", "Type", "Callable"});

    std::vector<std::string> nested_tables;
    for (std::size_t i = 0; i < keys_.size(); ++i) {
        std::vector<std::string> row{keys_[i]};
        if (holds_parset(data_[i])) {
            const std::string sub = header.empty() ? keys_[i] : header + ":" + keys_[i];
            nested_tables.push_back(data_[i]->as_parset()->to_string(sub));
            row.push_back("see below");
            row.push_back("see below");
        } else {
            row.push_back(optional_to_config_string(data_[i]));
            row.push_back(optional_to_config_string(defaults_[i]));
        }
        row.push_back(kinds_to_string(dtypes_[i]));
        row.push_back(can_call_[i] ? "True" : "False");
        rows.push_back(std::move(row));
    }

    std::vector<std::size_t> width(5, 0);
    for (const auto& r : rows) {
        for (std::size_t c = 0; c < r.size(); ++c) width[c] = std::max(width[c], r[c].size());
    }

    std::ostringstream oss;
    if (!header.empty()) oss << header << "\n";
    for (std::size_t r = 0; r < rows.size(); ++r) {
        std::string line;
        for (std::size_t c = 0; c < rows[r].size(); ++c) {
            std::string cell = rows[r][c];
            if (c + 1 < rows[r].size()) cell.resize(width[c] + 2, ' ');
            line += cell;
        }
        oss << line << "\n";
        if (r == 0) {
            std::string rule;
            for (std::size_t c = 0; c < width.size(); ++c) {
                rule += std::string(width[c], '-');
                if (c + 1 < width.size()) rule += "  ";
            }
            oss << rule << "\n";
        }
    }
    for (const auto& t : nested_tables) oss << t;
    return oss.str();
}

std::string ParameterSet::info(const std::string& basekey) const {
    std::ostringstream oss;
    for (std::size_t i = 0; i < keys_.size(); ++i) {
        if (holds_parset(data_[i])) {
            oss << data_[i]->as_parset()->info(keys_[i]);
            continue;
        }
        oss << (basekey.empty() ? keys_[i] : basekey + ":" + keys_[i]) << "\n";
        oss << "        Value: " << optional_to_config_string(data_[i]) << "\n";
        oss << "      Default: " << optional_to_config_string(defaults_[i]) << "\n";
        oss << "      Options: "
            << (options_[i].empty() ? "None" : options_to_string(options_[i])) << "\n";
        oss << "  Valid Types: "
            << (dtypes_[i].empty() ? "None" : kinds_to_string(dtypes_[i])) << "\n";
        oss << "     Callable: " << (can_call_[i] ? "True" : "False") << "\n";
        oss << "  Description: " << (descr_[i].empty() ? "None" : descr_[i]) << "\n";
        oss << " \n";
    }
    return oss.str();
}

bool ParameterSet::operator==(const ParameterSet& other) const {
    if (keys_ != other.keys_) return false;
    for (std::size_t i = 0; i < data_.size(); ++i) {
        if (!values_equal(data_[i], other.data_[i])) return false;
    }
    return true;
}

} // namespace flexcal::config
