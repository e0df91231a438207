#pragma once

#include "flexcal/core/types.hpp"

#include <string>
#include <utility>
#include <vector>

namespace flexcal::io {

/**
 * One bracketed section of a config file. The root section has an empty
 * name and depth -1; "[name]" opens depth 0, "[[name]]" depth 1, and so on.
 * Entries keep the raw right-hand side text; typing happens in the
 * consumer, which knows the allowed kinds of each key.
 */
struct ConfigSection {
    std::string name;
    int depth = -1;
    int line = 0;
    std::vector<std::pair<std::string, std::string>> entries;
    std::vector<ConfigSection> children;

    const ConfigSection* find_child(const std::string& child_name) const;
    const std::string* find_entry(const std::string& key) const;
};

ConfigSection parse_config_lines(const std::vector<std::string>& lines);
ConfigSection parse_config_file(const fs::path& path);

} // namespace flexcal::io
