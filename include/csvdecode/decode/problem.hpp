#pragma once

#include <csvdecode/parser/parser.hpp>

#include <cstddef>
#include <string>
#include <variant>

namespace csvdecode::decode {

/// The row has fewer fields than the requested column needs.
struct ExpectedColumn {
    std::size_t index = 0;
    auto operator==(const ExpectedColumn&) const -> bool = default;
};

/// The named field is not in the header (or there is no header).
struct ExpectedField {
    std::string name;
    auto operator==(const ExpectedField&) const -> bool = default;
};

/// No location was given and the row does not have exactly one field.
struct ExpectedOneColumn {
    std::size_t found = 0;
    auto operator==(const ExpectedOneColumn&) const -> bool = default;
};

struct ExpectedInt {
    std::string raw;
    auto operator==(const ExpectedInt&) const -> bool = default;
};

struct ExpectedFloat {
    std::string raw;
    auto operator==(const ExpectedFloat&) const -> bool = default;
};

/// Field names were requested from the first row of an empty table.
struct NoFieldNamesOnFirstRow {
    auto operator==(const NoFieldNamesOnFirstRow&) const -> bool = default;
};

/// Raised by user code through `fail` or `and_then`.
struct Failure {
    std::string message;
    auto operator==(const Failure&) const -> bool = default;
};

using Problem = std::variant<ExpectedColumn, ExpectedField, ExpectedOneColumn, ExpectedInt,
                             ExpectedFloat, NoFieldNamesOnFirstRow, Failure>;

/// Decoding failed at `row`, counted in source rows (a header row counts).
struct DecodingError {
    std::size_t row = 0;
    Problem problem;
    auto operator==(const DecodingError&) const -> bool = default;
};

/// The text could not be split into rows at all.
struct ParsingError {
    parser::ParseProblem problem;
    auto operator==(const ParsingError&) const -> bool = default;
};

using Error = std::variant<ParsingError, DecodingError>;

[[nodiscard]] auto format(const Problem& problem) -> std::string;
[[nodiscard]] auto format(const Error& error) -> std::string;

}  // namespace csvdecode::decode
