#pragma once

#include <csvdecode/decode/problem.hpp>
#include <csvdecode/parser/parser.hpp>

#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace csvdecode::decode {

/// Every parsed row is data; `field(...)` lookups always fail.
struct NoFieldNames {};

/// The first parsed row is the header and is not decoded.
struct FromFirstRow {};

/// Header supplied by the caller; every parsed row is data.
struct CustomFieldNames {
    std::vector<std::string> names;
};

using FieldNames = std::variant<NoFieldNames, FromFirstRow, CustomFieldNames>;

/// Field name to 0-based column index.
using HeaderIndex = std::unordered_map<std::string, std::size_t>;

/// The outcome of applying a FieldNames policy to a parsed table.
struct ResolvedRows {
    std::optional<HeaderIndex> header;
    /// Data rows, viewing into the parsed table.
    std::span<const parser::Row> rows;
    /// Source index of `rows.front()`: 1 when the header came from the table.
    std::size_t first_row = 0;
};

/// Build a header index from `names`. When a name repeats, the last
/// occurrence wins.
[[nodiscard]] auto make_header_index(std::span<const std::string> names) -> HeaderIndex;

/// Apply `field_names` to `rows`. Fails only for FromFirstRow on an empty
/// table.
[[nodiscard]] auto resolve_field_names(const FieldNames& field_names,
                                       const parser::Rows& rows)
    -> std::expected<ResolvedRows, Problem>;

}  // namespace csvdecode::decode
