#include <csvdecode/parser/config.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace csvdecode::parser;

TEST_CASE("Default config is comma and CRLF") {
    auto config = default_config();
    REQUIRE(config.field_separator() == ",");
    REQUIRE(config.row_separator() == "\r\n");
    REQUIRE(config.accepts_bare_newline());
    REQUIRE(config.field_lead() == ',');
    REQUIRE(config.row_lead() == '\r');
}

TEST_CASE("Build config with custom separators") {
    auto config = build_config({.field_separator = "\t", .row_separator = "\n"});
    REQUIRE(config.has_value());
    REQUIRE(config->field_separator() == "\t");
    REQUIRE(config->row_separator() == "\n");
    REQUIRE_FALSE(config->accepts_bare_newline());
}

TEST_CASE("Build config keeps multi-character separators") {
    auto config = build_config({.field_separator = "||", .row_separator = ";;\n"});
    REQUIRE(config.has_value());
    REQUIRE(config->field_separator() == "||");
    REQUIRE(config->row_separator() == ";;\n");
    REQUIRE(config->field_lead() == '|');
    REQUIRE(config->row_lead() == ';');
}

TEST_CASE("Build config rejects an empty field separator") {
    auto config = build_config({.field_separator = "", .row_separator = "\n"});
    REQUIRE_FALSE(config.has_value());
    REQUIRE(config.error() == ConfigProblem::NeedNonBlankFieldSeparator);
}

TEST_CASE("Build config rejects an empty row separator") {
    auto config = build_config({.field_separator = ",", .row_separator = ""});
    REQUIRE_FALSE(config.has_value());
    REQUIRE(config.error() == ConfigProblem::NeedNonBlankRowSeparator);
}

TEST_CASE("Build config reports the field separator first when both are empty") {
    auto config = build_config({.field_separator = "", .row_separator = ""});
    REQUIRE_FALSE(config.has_value());
    REQUIRE(config.error() == ConfigProblem::NeedNonBlankFieldSeparator);
}

TEST_CASE("Config problems have messages") {
    REQUIRE(format(ConfigProblem::NeedNonBlankFieldSeparator) ==
            "field separator must not be empty");
    REQUIRE(format(ConfigProblem::NeedNonBlankRowSeparator) == "row separator must not be empty");
}
