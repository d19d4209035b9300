#include <csvdecode/encode/encoder.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>

namespace csvdecode::encode {

namespace {

// Length of the separator the parser would read at `i`, or 0. The field
// separator is tried first, as in the parser.
auto separator_at(std::string_view text, std::size_t i, const parser::Config& config)
    -> std::size_t {
    if (text.substr(i).starts_with(config.field_separator())) {
        return config.field_separator().size();
    }
    if (text.substr(i).starts_with(config.row_separator())) {
        return config.row_separator().size();
    }
    return 0;
}

// True when `field`, written unquoted between `before` and `after`, reads
// back as the same separators around the same text. Fails when the field
// ends in a prefix of a self-overlapping separator ("a|" before "||") or
// starts with text that extends `before` into the other separator.
auto reads_back(std::string_view before, std::string_view field, std::string_view after,
                const parser::Config& config) -> bool {
    std::string joined(before);
    joined += field;
    joined += after;
    if (separator_at(joined, 0, config) != before.size()) {
        return false;
    }
    for (std::size_t i = before.size(); i < before.size() + field.size(); ++i) {
        if (separator_at(joined, i, config) > 0) {
            return false;
        }
    }
    return true;
}

auto needs_quotes(std::string_view field, const parser::Config& config) -> bool {
    if (field.find_first_of("\"\r\n") != std::string_view::npos) {
        return true;
    }
    const std::string_view separators[] = {config.field_separator(), config.row_separator()};
    for (const auto before : separators) {
        for (const auto after : separators) {
            if (!reads_back(before, field, after, config)) {
                return true;
            }
        }
    }
    return false;
}

void append_row(std::string& out, const parser::Row& row, const parser::Config& config) {
    // A lone empty field would otherwise encode to nothing at all.
    if (row.size() == 1 && row.front().empty()) {
        out += "\"\"";
        return;
    }
    for (std::size_t i = 0; i < row.size(); ++i) {
        if (i > 0) {
            out += config.field_separator();
        }
        out += quote_if_needed(row[i], config);
    }
}

}  // namespace

auto quote_if_needed(std::string_view field, const parser::Config& config) -> std::string {
    if (!needs_quotes(field, config)) {
        return std::string(field);
    }
    std::string quoted;
    quoted.reserve(field.size() + 2);
    quoted.push_back('"');
    for (char ch : field) {
        if (ch == '"') {
            quoted.push_back('"');
        }
        quoted.push_back(ch);
    }
    quoted.push_back('"');
    return quoted;
}

auto encode_rows(const parser::Rows& rows, const parser::Config& config) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (i > 0) {
            out += config.row_separator();
        }
        append_row(out, rows[i], config);
    }
    return out;
}

auto encode_named_rows(const std::vector<NamedFields>& records, const parser::Config& config)
    -> std::string {
    if (records.empty()) {
        return {};
    }

    parser::Row header;
    std::unordered_map<std::string, std::size_t> positions;
    for (const auto& record : records) {
        for (const auto& [name, value] : record) {
            if (positions.try_emplace(name, header.size()).second) {
                header.push_back(name);
            }
        }
    }

    parser::Rows rows;
    rows.reserve(records.size() + 1);
    rows.push_back(header);
    for (const auto& record : records) {
        parser::Row row(header.size());
        for (const auto& [name, value] : record) {
            row[positions.at(name)] = value;
        }
        rows.push_back(std::move(row));
    }
    return encode_rows(rows, config);
}

}  // namespace csvdecode::encode
