#include <csvdecode/csvdecode.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

/// Expand the escapes a shell user is likely to type for separators.
auto unescape(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\\' || i + 1 == text.size()) {
            out.push_back(text[i]);
            continue;
        }
        switch (text[++i]) {
            case 't':
                out.push_back('\t');
                break;
            case 'n':
                out.push_back('\n');
                break;
            case 'r':
                out.push_back('\r');
                break;
            default:
                out.push_back('\\');
                out.push_back(text[i]);
                break;
        }
    }
    return out;
}

auto split_names(std::string_view list) -> std::vector<std::string> {
    std::vector<std::string> names;
    std::size_t pos = 0;
    while (true) {
        const auto comma = list.find(',', pos);
        names.emplace_back(list.substr(pos, comma - pos));
        if (comma == std::string_view::npos) {
            break;
        }
        pos = comma + 1;
    }
    return names;
}

template <typename T>
auto print_values(const csvdecode::parser::Config& config,
                  const csvdecode::decode::FieldNames& field_names,
                  const csvdecode::decode::Decoder<T>& decoder, const std::string& source) -> int {
    auto values = csvdecode::decode::decode_custom(config, field_names, decoder, source);
    if (!values) {
        std::cerr << "csvdecode_inspect: " << csvdecode::decode::format(values.error()) << "\n";
        return 1;
    }
    for (const auto& value : *values) {
        fmt::print("{}\n", value);
    }
    spdlog::debug("decoded {} values", values->size());
    return 0;
}

auto print_summary(const csvdecode::parser::Config& config,
                   const csvdecode::decode::FieldNames& field_names, const std::string& source)
    -> int {
    auto rows = csvdecode::parser::parse(config, source);
    if (!rows) {
        std::cerr << "csvdecode_inspect: parse error at " << rows.error().format() << "\n";
        return 1;
    }
    auto resolved = csvdecode::decode::resolve_field_names(field_names, *rows);
    if (!resolved) {
        std::cerr << "csvdecode_inspect: " << csvdecode::decode::format(resolved.error()) << "\n";
        return 1;
    }

    std::size_t narrowest = resolved->rows.empty() ? 0 : resolved->rows.front().size();
    std::size_t widest = 0;
    for (const auto& row : resolved->rows) {
        narrowest = std::min(narrowest, row.size());
        widest = std::max(widest, row.size());
    }

    fmt::print("rows: {}\n", resolved->rows.size());
    fmt::print("fields per row: {}..{}\n", narrowest, widest);
    if (resolved->header) {
        std::vector<std::pair<std::size_t, std::string>> columns;
        for (const auto& [name, index] : *resolved->header) {
            columns.emplace_back(index, name);
        }
        std::sort(columns.begin(), columns.end());
        fmt::print("fields:\n");
        for (const auto& [index, name] : columns) {
            fmt::print("  {}: {}\n", index, name);
        }
    }
    return 0;
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"csvdecode inspector: parse a delimited file and decode one column"};
    app.set_version_flag("--version", "csvdecode_inspect 0.1.0");

    std::string input_path;
    std::string field_separator = ",";
    std::string row_separator = "\\r\\n";
    bool header = false;
    std::string names;
    std::optional<std::size_t> column;
    std::string field;
    std::string type = "string";
    bool verbose = false;

    app.add_option("input", input_path, "Input file")->required()->check(CLI::ExistingFile);
    app.add_option("-F,--field-separator", field_separator,
                   "Field separator (escapes \\t, \\n, \\r allowed; default: ,)");
    app.add_option("-R,--row-separator", row_separator,
                   "Row separator (default: \\r\\n, bare \\n also accepted)");
    auto* header_flag = app.add_flag("-H,--header", header, "Take field names from the first row");
    app.add_option("--names", names, "Comma-separated field names for headerless input")
        ->excludes(header_flag);
    auto* column_opt = app.add_option("-c,--column", column, "Decode this 0-based column");
    app.add_option("-f,--field", field, "Decode this named field")->excludes(column_opt);
    app.add_option("-t,--type", type, "Value type: string, int or float")
        ->check(CLI::IsMember({"string", "int", "float"}));
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);

    auto config = csvdecode::parser::build_config({
        .field_separator = unescape(field_separator),
        .row_separator = unescape(row_separator),
    });
    if (!config) {
        std::cerr << "csvdecode_inspect: " << csvdecode::parser::format(config.error()) << "\n";
        return 1;
    }

    std::ifstream in_file(input_path, std::ios::binary);
    if (!in_file) {
        std::cerr << "csvdecode_inspect: cannot open '" << input_path << "'\n";
        return 1;
    }
    std::string source(std::istreambuf_iterator<char>{in_file}, {});
    spdlog::debug("read {} bytes from {}", source.size(), input_path);

    csvdecode::decode::FieldNames field_names = csvdecode::decode::NoFieldNames{};
    if (header) {
        field_names = csvdecode::decode::FromFirstRow{};
    } else if (!names.empty()) {
        field_names = csvdecode::decode::CustomFieldNames{.names = split_names(names)};
    }

    if (!column && field.empty()) {
        return print_summary(*config, field_names, source);
    }

    csvdecode::decode::Location location = csvdecode::decode::OnlyColumn{};
    if (column) {
        location = csvdecode::decode::Column{.index = *column};
    } else {
        location = csvdecode::decode::Field{.name = field};
    }

    namespace decode = csvdecode::decode;
    if (type == "int") {
        return print_values(*config, field_names, decode::at(location, decode::int64()), source);
    }
    if (type == "float") {
        return print_values(*config, field_names, decode::at(location, decode::float64()), source);
    }
    return print_values(*config, field_names, decode::at(location, decode::string()), source);
}
