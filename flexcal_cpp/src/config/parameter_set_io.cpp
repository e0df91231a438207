#include "flexcal/config/parameter_set.hpp"
#include "flexcal/core/errors.hpp"
#include "flexcal/core/utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <map>

namespace flexcal::config {

namespace {

bool has_kind(const std::vector<ValueKind>& kinds, ValueKind k) {
    return std::find(kinds.begin(), kinds.end(), k) != kinds.end();
}

// Kinds that can be read from a single right-hand side
std::vector<ValueKind> text_kinds(const std::vector<ValueKind>& kinds) {
    std::vector<ValueKind> out;
    for (auto k : kinds) {
        if (k != ValueKind::ParSet && k != ValueKind::ParSetList && k != ValueKind::Callable) {
            out.push_back(k);
        }
    }
    return out;
}

bool is_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return c >= '0' && c <= '9';
    });
}

bool all_nested_or_unset(const ParameterSet& par) {
    for (const auto& k : par.keys()) {
        const auto& v = par.get(k);
        if (v && v->kind() != ValueKind::ParSet) return false;
    }
    return true;
}

} // namespace

void ParameterSet::assign_text(std::size_t idx, const std::string& raw, bool split_lists) {
    const std::string& key = keys_[idx];
    const std::string text = core::trim(raw);
    const auto& kinds = dtypes_[idx];
    const OptionalValue& current = data_[idx] ? data_[idx] : defaults_[idx];

    if (text == "None") {
        set(key, std::nullopt);
        return;
    }

    // Callables are written by name; only the current one can be resolved
    if (can_call_[idx] || has_kind(kinds, ValueKind::Callable) ||
        (current && current->kind() == ValueKind::Callable)) {
        if (current && current->kind() == ValueKind::Callable &&
            current->as_callable().name == text) {
            set(key, current);
            return;
        }
        throw ValidationError("Cannot resolve callable '" + text + "' for " + key);
    }

    const bool parset_list = has_kind(kinds, ValueKind::ParSetList) ||
                             (current && current->kind() == ValueKind::ParSetList);
    if (parset_list && text == "[]") {
        set(key, Value(std::vector<ParSetPtr>{}));
        return;
    }

    const auto parse_kinds = text_kinds(kinds);
    if (!kinds.empty() && parse_kinds.empty()) {
        throw ValidationError(key + " holds nested parameters and must be given as a section");
    }
    set(key, split_lists ? parse_config_value(text, parse_kinds)
                         : parse_scalar_value(text, parse_kinds));
}

void ParameterSet::apply_section(const io::ConfigSection& section) {
    for (const auto& [key, text] : section.entries) {
        if (!contains(key)) {
            throw ValidationError("Unknown parameter '" + key + "' in section [" +
                                  section.name + "]");
        }
        assign_text(index_of(key), text, true);
    }

    // Indexed subsections, grouped per list key: index -> section
    std::map<std::size_t, std::map<std::size_t, const io::ConfigSection*>> indexed;

    for (const auto& child : section.children) {
        if (contains(child.name)) {
            const std::size_t idx = index_of(child.name);
            const OptionalValue& v = data_[idx];
            if (!v || v->kind() != ValueKind::ParSet || !v->as_parset()) {
                throw ValidationError("Section [" + child.name +
                                      "] does not correspond to a nested parameter set");
            }
            // data_ was deep-copied from the schema, so the nested set is ours
            v->as_parset()->apply_section(child);
            continue;
        }

        bool matched = false;
        for (std::size_t i = 0; i < keys_.size() && !matched; ++i) {
            const std::string& k = keys_[i];
            if (!core::starts_with(child.name, k)) continue;
            const std::string suffix = child.name.substr(k.size());
            if (!is_digits(suffix)) continue;
            const OptionalValue& v = data_[i];
            const bool list_key = (v && v->kind() == ValueKind::ParSetList) ||
                                  has_kind(dtypes_[i], ValueKind::ParSetList);
            if (!list_key) continue;
            const std::size_t n = std::stoul(suffix);
            if (n == 0) {
                throw ValidationError("Section [" + child.name + "] has index 0");
            }
            indexed[i][n] = &child;
            matched = true;
        }
        if (!matched) {
            throw ValidationError("Unknown section [" + child.name + "] in [" + section.name +
                                  "]");
        }
    }

    for (const auto& [idx, sections] : indexed) {
        std::vector<ParSetPtr> templ;
        if (data_[idx] && data_[idx]->kind() == ValueKind::ParSetList) {
            templ = data_[idx]->as_parset_list();
        } else if (defaults_[idx] && defaults_[idx]->kind() == ValueKind::ParSetList) {
            templ = defaults_[idx]->as_parset_list();
        }
        if (templ.empty()) {
            throw ValidationError("No template parameter set available for " + keys_[idx]);
        }

        const std::size_t n = std::max(templ.size(), sections.rbegin()->first);
        std::vector<ParSetPtr> list;
        list.reserve(n);
        for (std::size_t j = 0; j < n; ++j) {
            list.push_back(j < templ.size() ? templ[j]->clone() : templ.front()->clone());
        }
        for (const auto& [n_idx, sec] : sections) {
            list[n_idx - 1]->apply_section(*sec);
        }
        set(keys_[idx], Value(std::move(list)));
    }
}

ParameterSet ParameterSet::from_config(const std::vector<std::string>& lines,
                                       const ParameterSet& schema) {
    const io::ConfigSection root = io::parse_config_lines(lines);
    ParameterSet result = *schema.clone();

    if (all_nested_or_unset(result)) {
        result.apply_section(root);
        return result;
    }

    if (!root.entries.empty()) {
        throw ValidationError("Parameters given outside of any section");
    }
    if (root.children.size() != 1) {
        throw ValidationError("Expected exactly one top-level section, found " +
                              std::to_string(root.children.size()));
    }
    const io::ConfigSection& top = root.children.front();
    if (!result.cfg_section_.empty() && top.name != result.cfg_section_) {
        throw ValidationError("Expected section [" + result.cfg_section_ + "], found [" +
                              top.name + "]");
    }
    result.apply_section(top);
    return result;
}

ParameterSet ParameterSet::from_config_file(const fs::path& path, const ParameterSet& schema) {
    if (!fs::exists(path)) {
        throw IOError("Config file not found: " + path.string());
    }
    return from_config(core::read_lines(path), schema);
}

namespace {

YAML::Node value_to_yaml(const Value& v);

YAML::Node optional_to_yaml(const OptionalValue& v) {
    if (!v) return YAML::Node(YAML::NodeType::Null);
    return value_to_yaml(*v);
}

YAML::Node value_to_yaml(const Value& v) {
    YAML::Node node;
    switch (v.kind()) {
        case ValueKind::Bool: node = v.as_bool(); break;
        case ValueKind::Int: node = v.as_int(); break;
        case ValueKind::Float: node = v.as_double(); break;
        case ValueKind::String: node = v.as_string(); break;
        case ValueKind::NumericList:
            node = YAML::Node(YAML::NodeType::Sequence);
            for (double d : v.as_numeric_list()) node.push_back(d);
            break;
        case ValueKind::StringList:
            node = YAML::Node(YAML::NodeType::Sequence);
            for (const auto& s : v.as_string_list()) node.push_back(s);
            break;
        case ValueKind::ParSet:
            node = v.as_parset() ? v.as_parset()->to_yaml() : YAML::Node(YAML::NodeType::Null);
            break;
        case ValueKind::ParSetList:
            node = YAML::Node(YAML::NodeType::Sequence);
            for (const auto& p : v.as_parset_list()) node.push_back(p->to_yaml());
            break;
        case ValueKind::Callable: node = v.as_callable().name; break;
    }
    return node;
}

} // namespace

YAML::Node ParameterSet::to_yaml() const {
    YAML::Node node(YAML::NodeType::Map);
    for (std::size_t i = 0; i < keys_.size(); ++i) {
        node[keys_[i]] = optional_to_yaml(data_[i]);
    }
    return node;
}

void ParameterSet::apply_yaml(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw ValidationError("Expected a mapping of parameters");
    }
    for (const auto& it : node) {
        const std::string key = it.first.as<std::string>();
        const YAML::Node& child = it.second;
        if (!contains(key)) {
            throw ValidationError("Unknown parameter: " + key);
        }
        const std::size_t idx = index_of(key);
        const OptionalValue& current = data_[idx] ? data_[idx] : defaults_[idx];

        if (child.IsNull()) {
            set(key, std::nullopt);
            continue;
        }

        if (child.IsMap()) {
            if (!data_[idx] || data_[idx]->kind() != ValueKind::ParSet ||
                !data_[idx]->as_parset()) {
                throw ValidationError(key + " is not a nested parameter set");
            }
            data_[idx]->as_parset()->apply_yaml(child);
            continue;
        }

        if (child.IsSequence()) {
            const bool parset_list = has_kind(dtypes_[idx], ValueKind::ParSetList) ||
                                     (current && current->kind() == ValueKind::ParSetList);
            if (parset_list) {
                std::vector<ParSetPtr> templ;
                if (current && current->kind() == ValueKind::ParSetList) {
                    templ = current->as_parset_list();
                }
                if (templ.empty() && child.size() > 0) {
                    throw ValidationError("No template parameter set available for " + key);
                }
                std::vector<ParSetPtr> list;
                for (std::size_t j = 0; j < child.size(); ++j) {
                    auto p = j < templ.size() ? templ[j]->clone() : templ.front()->clone();
                    p->apply_yaml(child[j]);
                    list.push_back(std::move(p));
                }
                set(key, Value(std::move(list)));
                continue;
            }

            std::vector<std::string> items;
            for (const auto& e : child) items.push_back(e.as<std::string>());
            const auto& kinds = dtypes_[idx];
            const bool numeric_ok = kinds.empty() || has_kind(kinds, ValueKind::NumericList);
            if (numeric_ok) {
                std::vector<double> numbers;
                bool all_numeric = true;
                for (const auto& s : items) {
                    char* end = nullptr;
                    const double d = std::strtod(s.c_str(), &end);
                    if (s.empty() || end != s.c_str() + s.size()) {
                        all_numeric = false;
                        break;
                    }
                    numbers.push_back(d);
                }
                if (all_numeric) {
                    set(key, Value(std::move(numbers)));
                    continue;
                }
            }
            set(key, Value(std::move(items)));
            continue;
        }

        assign_text(idx, child.Scalar(), false);
    }
}

ParameterSet ParameterSet::from_yaml(const YAML::Node& node, const ParameterSet& schema) {
    ParameterSet result = *schema.clone();
    result.apply_yaml(node);
    return result;
}

namespace {

nlohmann::json value_to_json(const Value& v) {
    switch (v.kind()) {
        case ValueKind::Bool: return v.as_bool();
        case ValueKind::Int: return v.as_int();
        case ValueKind::Float: return v.as_double();
        case ValueKind::String: return v.as_string();
        case ValueKind::NumericList: return v.as_numeric_list();
        case ValueKind::StringList: return v.as_string_list();
        case ValueKind::Callable: return v.as_callable().name;
        case ValueKind::ParSet:
        case ValueKind::ParSetList:
            break;
    }
    return nullptr;
}

nlohmann::json kind_schema(ValueKind k) {
    switch (k) {
        case ValueKind::Bool: return {{"type", "boolean"}};
        case ValueKind::Int: return {{"type", "integer"}};
        case ValueKind::Float: return {{"type", "number"}};
        case ValueKind::String: return {{"type", "string"}};
        case ValueKind::NumericList:
            return {{"type", "array"}, {"items", {{"type", "number"}}}};
        case ValueKind::StringList:
            return {{"type", "array"}, {"items", {{"type", "string"}}}};
        case ValueKind::ParSet: return {{"type", "object"}};
        case ValueKind::ParSetList: return {{"type", "array"}};
        case ValueKind::Callable: return {{"type", "string"}, {"format", "callable"}};
    }
    return nlohmann::json::object();
}

} // namespace

nlohmann::json ParameterSet::schema_json() const {
    nlohmann::json schema;
    schema["type"] = "object";
    if (!cfg_section_.empty()) schema["title"] = cfg_section_;
    if (!cfg_comment_.empty()) schema["description"] = cfg_comment_;

    nlohmann::json props = nlohmann::json::object();
    for (std::size_t i = 0; i < keys_.size(); ++i) {
        nlohmann::json prop;
        const OptionalValue& v = data_[i];

        if (v && v->kind() == ValueKind::ParSet && v->as_parset()) {
            prop = v->as_parset()->schema_json();
        } else if (v && v->kind() == ValueKind::ParSetList && !v->as_parset_list().empty()) {
            prop["type"] = "array";
            prop["items"] = v->as_parset_list().front()->schema_json();
        } else {
            const auto& kinds = dtypes_[i];
            if (kinds.size() == 1) {
                prop = kind_schema(kinds.front());
            } else if (kinds.size() > 1) {
                prop["anyOf"] = nlohmann::json::array();
                for (auto k : kinds) prop["anyOf"].push_back(kind_schema(k));
            }
            if (!options_[i].empty()) {
                prop["enum"] = nlohmann::json::array();
                for (const auto& o : options_[i]) prop["enum"].push_back(value_to_json(o));
            }
            if (defaults_[i]) prop["default"] = value_to_json(*defaults_[i]);
        }

        if (!descr_[i].empty()) prop["description"] = descr_[i];
        if (can_call_[i]) prop["callable"] = true;
        props[keys_[i]] = prop;
    }
    schema["properties"] = props;
    return schema;
}

} // namespace flexcal::config
