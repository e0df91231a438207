#include "flexcal/io/config_file.hpp"
#include "flexcal/core/errors.hpp"
#include "flexcal/core/utils.hpp"

namespace flexcal::io {

const ConfigSection* ConfigSection::find_child(const std::string& child_name) const {
    for (const auto& c : children) {
        if (c.name == child_name) return &c;
    }
    return nullptr;
}

const std::string* ConfigSection::find_entry(const std::string& key) const {
    for (const auto& e : entries) {
        if (e.first == key) return &e.second;
    }
    return nullptr;
}

namespace {

std::string line_error(int line_no, const std::string& what) {
    return "config line " + std::to_string(line_no) + ": " + what;
}

// Drops an unquoted trailing "# comment". Quotes open only at the start of
// a value or list item and honour backslash escapes.
std::string strip_inline_comment(const std::string& text) {
    char quote = 0;
    bool item_start = true;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (quote) {
            if (c == '\\') {
                ++i;
            } else if (c == quote) {
                quote = 0;
            }
        } else if ((c == '"' || c == '\'') && item_start) {
            quote = c;
        } else if (c == '#') {
            return text.substr(0, i);
        } else if (c == ',') {
            item_start = true;
            continue;
        }
        if (c != ' ' && c != '\t') item_start = false;
    }
    return text;
}

} // namespace

ConfigSection parse_config_lines(const std::vector<std::string>& lines) {
    ConfigSection root;
    std::vector<ConfigSection*> stack{&root};

    int line_no = 0;
    for (const auto& raw : lines) {
        ++line_no;
        std::string line = core::trim(raw);
        if (line.empty() || line[0] == '#') continue;

        if (line[0] == '[') {
            std::size_t open = 0;
            while (open < line.size() && line[open] == '[') ++open;
            std::size_t close = 0;
            while (close < line.size() - open && line[line.size() - 1 - close] == ']') ++close;
            if (open != close) {
                throw ValidationError(line_error(line_no, "unbalanced brackets in '" + line + "'"));
            }
            std::string name = core::trim(line.substr(open, line.size() - open - close));
            if (name.empty()) {
                throw ValidationError(line_error(line_no, "empty section name"));
            }

            const int depth = static_cast<int>(open) - 1;
            if (depth > stack.back()->depth + 1) {
                throw ValidationError(line_error(line_no, "section [" + name +
                                                 "] is nested deeper than its parent"));
            }
            while (stack.back()->depth >= depth) stack.pop_back();

            ConfigSection* parent = stack.back();
            if (parent->find_child(name) != nullptr) {
                throw ValidationError(line_error(line_no, "duplicate section [" + name + "]"));
            }
            ConfigSection child;
            child.name = name;
            child.depth = depth;
            child.line = line_no;
            parent->children.push_back(std::move(child));
            stack.push_back(&parent->children.back());
            continue;
        }

        const std::size_t eq = line.find('=');
        if (eq == std::string::npos) {
            throw ValidationError(line_error(line_no, "expected 'key = value', got '" + line + "'"));
        }
        std::string key = core::trim(line.substr(0, eq));
        std::string value = core::trim(strip_inline_comment(line.substr(eq + 1)));
        if (key.empty()) {
            throw ValidationError(line_error(line_no, "missing key"));
        }
        ConfigSection* section = stack.back();
        if (section->find_entry(key) != nullptr) {
            throw ValidationError(line_error(line_no, "duplicate key '" + key + "' in section [" +
                                             section->name + "]"));
        }
        section->entries.emplace_back(key, value);
    }

    return root;
}

ConfigSection parse_config_file(const fs::path& path) {
    if (!fs::exists(path)) {
        throw IOError("Config file not found: " + path.string());
    }
    return parse_config_lines(core::read_lines(path));
}

} // namespace flexcal::io
