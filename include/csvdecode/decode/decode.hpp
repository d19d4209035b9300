#pragma once

#include <csvdecode/decode/decoder.hpp>
#include <csvdecode/decode/field_names.hpp>
#include <csvdecode/decode/problem.hpp>
#include <csvdecode/parser/config.hpp>
#include <csvdecode/parser/parser.hpp>

#include <cstddef>
#include <expected>
#include <string_view>
#include <utility>
#include <vector>

namespace csvdecode::decode {

template <typename T>
using DecodeCsvResult = std::expected<std::vector<T>, Error>;

namespace detail {

void note_decoding_failure(std::size_t row, const Problem& problem);

}  // namespace detail

/// Decode already-parsed rows, stopping at the first row that fails.
template <typename T>
[[nodiscard]] auto decode_rows(const FieldNames& field_names, const Decoder<T>& decoder,
                               const parser::Rows& rows) -> DecodeCsvResult<T> {
    auto resolved = resolve_field_names(field_names, rows);
    if (!resolved) {
        detail::note_decoding_failure(0, resolved.error());
        return std::unexpected(Error{DecodingError{.row = 0, .problem = resolved.error()}});
    }

    const HeaderIndex* header = resolved->header ? &*resolved->header : nullptr;
    std::vector<T> values;
    values.reserve(resolved->rows.size());
    for (std::size_t i = 0; i < resolved->rows.size(); ++i) {
        auto value = decoder.decode(RowContext{.fields = resolved->rows[i], .header = header});
        if (!value) {
            const std::size_t row = resolved->first_row + i;
            detail::note_decoding_failure(row, value.error());
            return std::unexpected(
                Error{DecodingError{.row = row, .problem = std::move(value.error())}});
        }
        values.push_back(std::move(*value));
    }
    return values;
}

/// Parse `source` with `config`, then decode every data row.
template <typename T>
[[nodiscard]] auto decode_custom(const parser::Config& config, const FieldNames& field_names,
                                 const Decoder<T>& decoder, std::string_view source)
    -> DecodeCsvResult<T> {
    auto rows = parser::parse(config, source);
    if (!rows) {
        return std::unexpected(Error{ParsingError{.problem = rows.error()}});
    }
    return decode_rows(field_names, decoder, *rows);
}

/// Parse comma-separated, CRLF (or LF) terminated `source` and decode every
/// data row.
template <typename T>
[[nodiscard]] auto decode_csv(const FieldNames& field_names, const Decoder<T>& decoder,
                              std::string_view source) -> DecodeCsvResult<T> {
    return decode_custom(parser::default_config(), field_names, decoder, source);
}

}  // namespace csvdecode::decode
