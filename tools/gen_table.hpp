#pragma once
// gen_table: synthetic trade table for csvdecode benchmarks.
//
// Columns: symbol, price, qty, note. Every seventh note is quoted and holds
// the field separator; every thirteenth holds an escaped quote.

#include <csvdecode/encode/encoder.hpp>
#include <csvdecode/parser/config.hpp>
#include <csvdecode/parser/parser.hpp>

#include <fmt/core.h>

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

inline auto gen_table(std::size_t rows) -> csvdecode::parser::Rows {
    constexpr std::array<std::string_view, 4> symbols = {"AAPL", "MSFT", "GOOG", "AMZN"};

    csvdecode::parser::Rows table;
    table.reserve(rows + 1);
    table.push_back({"symbol", "price", "qty", "note"});
    for (std::size_t i = 0; i < rows; ++i) {
        std::string note = "plain";
        if (i % 7 == 0) {
            note = "split, here";
        } else if (i % 13 == 0) {
            note = "say \"hi\"";
        }
        table.push_back({
            std::string(symbols[i % symbols.size()]),
            fmt::format("{:.2f}", 100.0 + static_cast<double>(i % 100) / 4.0),
            fmt::format("{}", i % 500),
            std::move(note),
        });
    }
    return table;
}

inline auto gen_table_text(std::size_t rows, const csvdecode::parser::Config& config)
    -> std::string {
    return csvdecode::encode::encode_rows(gen_table(rows), config);
}
