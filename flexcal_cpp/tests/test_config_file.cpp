#include "flexcal/core/errors.hpp"
#include "flexcal/io/config_file.hpp"

#include <catch2/catch_test_macros.hpp>

using flexcal::io::ConfigSection;
using flexcal::io::parse_config_lines;

TEST_CASE("config_parser_builds_nested_sections") {
    const std::vector<std::string> lines{
        "# Top comment",
        "[rdx]",
        "    spectrograph = kast_blue",
        "    verbosity = 2   # inline comment",
        "[flexure]",
        "    method = optimal",
        "    [[sub]]",
        "        value = \"a # b\"",
        "",
    };
    ConfigSection root = parse_config_lines(lines);

    REQUIRE(root.children.size() == 2);
    const ConfigSection* rdx = root.find_child("rdx");
    REQUIRE(rdx != nullptr);
    REQUIRE(rdx->depth == 0);
    REQUIRE(*rdx->find_entry("spectrograph") == "kast_blue");
    REQUIRE(*rdx->find_entry("verbosity") == "2");

    const ConfigSection* flex = root.find_child("flexure");
    REQUIRE(flex != nullptr);
    REQUIRE(flex->children.size() == 1);
    const ConfigSection& sub = flex->children.front();
    REQUIRE(sub.name == "sub");
    REQUIRE(sub.depth == 1);
    REQUIRE(*sub.find_entry("value") == "\"a # b\"");
}

TEST_CASE("config_parser_keeps_entry_order") {
    ConfigSection root = parse_config_lines({"[s]", "b = 1", "a = 2", "c = 3"});
    const auto& entries = root.children.front().entries;
    REQUIRE(entries.size() == 3);
    REQUIRE(entries[0].first == "b");
    REQUIRE(entries[1].first == "a");
    REQUIRE(entries[2].first == "c");
}

TEST_CASE("config_parser_returns_to_shallower_sections") {
    ConfigSection root = parse_config_lines({"[a]", "[[b]]", "[[[c]]]", "[[d]]", "[e]"});
    REQUIRE(root.children.size() == 2);
    const ConfigSection* a = root.find_child("a");
    REQUIRE(a->children.size() == 2);
    REQUIRE(a->children[0].children.size() == 1);
    REQUIRE(a->find_child("d") != nullptr);
}

TEST_CASE("config_parser_rejects_malformed_input") {
    REQUIRE_THROWS_AS(parse_config_lines({"[a]]"}), flexcal::ValidationError);
    REQUIRE_THROWS_AS(parse_config_lines({"[]"}), flexcal::ValidationError);
    REQUIRE_THROWS_AS(parse_config_lines({"[[a]]"}), flexcal::ValidationError);
    REQUIRE_THROWS_AS(parse_config_lines({"[a]", "no equals sign"}), flexcal::ValidationError);
    REQUIRE_THROWS_AS(parse_config_lines({"[a]", "x = 1", "x = 2"}), flexcal::ValidationError);
    REQUIRE_THROWS_AS(parse_config_lines({"[a]", "[a]"}), flexcal::ValidationError);
    REQUIRE_THROWS_AS(parse_config_lines({"[a]", " = 1"}), flexcal::ValidationError);
}

TEST_CASE("config_parser_reports_line_number") {
    try {
        parse_config_lines({"[a]", "x = 1", "broken"});
        FAIL("expected ValidationError");
    } catch (const flexcal::ValidationError& e) {
        REQUIRE(std::string(e.what()).find("line 3") != std::string::npos);
    }
}

TEST_CASE("config_file_missing_raises_io_error") {
    REQUIRE_THROWS_AS(flexcal::io::parse_config_file("/nonexistent/flexcal.cfg"),
                      flexcal::IOError);
}
