#pragma once

#include <csvdecode/parser/config.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace csvdecode::parser {

/// One line of a table: its fields, in order.
using Row = std::vector<std::string>;

/// A parsed table. Rows may differ in length.
using Rows = std::vector<Row>;

enum class ParseProblemKind : std::uint8_t {
    SourceEndedWithoutClosingQuote,
    AdditionalCharactersAfterClosingQuote,
};

/// Structural parse failure.
///
/// `row` is 0-based: the number of rows completed before the row in which
/// the problem was detected.
struct ParseProblem {
    ParseProblemKind kind = ParseProblemKind::SourceEndedWithoutClosingQuote;
    std::size_t row = 0;

    auto operator==(const ParseProblem&) const -> bool = default;

    [[nodiscard]] auto format() const -> std::string;
};

using ParseResult = std::expected<Rows, ParseProblem>;

/// Split `source` into rows of fields according to `config`.
///
/// Quoted fields may contain separators and line breaks; `""` inside a quoted
/// field stands for one literal quote. Empty input yields zero rows, and a
/// trailing row separator does not produce an extra empty row.
[[nodiscard]] auto parse(const Config& config, std::string_view source) -> ParseResult;

}  // namespace csvdecode::parser
