#pragma once

#include <csvdecode/parser/config.hpp>
#include <csvdecode/parser/parser.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace csvdecode::encode {

/// A record's fields, each paired with the column name it belongs under.
using NamedFields = std::vector<std::pair<std::string, std::string>>;

/// Quote `field` when it contains a separator, a quote or a line break, or
/// when a separator written next to it would be read from a different
/// position. Quotes inside a quoted field are doubled.
[[nodiscard]] auto quote_if_needed(std::string_view field, const parser::Config& config)
    -> std::string;

/// Join rows into text. Rows may differ in length. Rows are separated, not
/// terminated, by the row separator.
[[nodiscard]] auto encode_rows(const parser::Rows& rows,
                               const parser::Config& config = parser::default_config())
    -> std::string;

/// Encode named records under a header row. Columns appear in the order
/// their names are first seen; a record without a column leaves it empty.
[[nodiscard]] auto encode_named_rows(const std::vector<NamedFields>& records,
                                     const parser::Config& config = parser::default_config())
    -> std::string;

/// Encode records without a header row.
template <typename T, typename F>
[[nodiscard]] auto encode_without_field_names(const std::vector<T>& records, F to_fields,
                                              const parser::Config& config =
                                                  parser::default_config()) -> std::string {
    parser::Rows rows;
    rows.reserve(records.size());
    for (const auto& record : records) {
        rows.push_back(to_fields(record));
    }
    return encode_rows(rows, config);
}

/// Encode records under a header row built from their field names.
template <typename T, typename F>
[[nodiscard]] auto encode_with_field_names(const std::vector<T>& records, F to_named_fields,
                                           const parser::Config& config =
                                               parser::default_config()) -> std::string {
    std::vector<NamedFields> named;
    named.reserve(records.size());
    for (const auto& record : records) {
        named.push_back(to_named_fields(record));
    }
    return encode_named_rows(named, config);
}

}  // namespace csvdecode::encode
