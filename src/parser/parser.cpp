#include <csvdecode/parser/parser.hpp>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace csvdecode::parser {

namespace {

/// Separator matcher for the common single-character field separators with
/// CRLF rows. Compares literal characters instead of consulting a Config.
template <char FieldSeparator>
struct LiteralSeparators {
    [[nodiscard]] auto field_separator_at(std::string_view source, std::size_t i) const
        -> std::size_t {
        return source[i] == FieldSeparator ? 1 : 0;
    }

    [[nodiscard]] auto row_separator_at(std::string_view source, std::size_t i) const
        -> std::size_t {
        if (source[i] == '\n') {
            return 1;
        }
        if (source[i] == '\r' && i + 1 < source.size() && source[i + 1] == '\n') {
            return 2;
        }
        return 0;
    }
};

/// Separator matcher for arbitrary (possibly multi-character) separators.
class ConfiguredSeparators {
   public:
    explicit ConfiguredSeparators(const Config& config)
        : field_(config.field_separator()),
          row_(config.row_separator()),
          field_lead_(config.field_lead()),
          row_lead_(config.row_lead()),
          bare_newline_(config.accepts_bare_newline()) {}

    [[nodiscard]] auto field_separator_at(std::string_view source, std::size_t i) const
        -> std::size_t {
        if (source[i] != field_lead_ || !source.substr(i).starts_with(field_)) {
            return 0;
        }
        return field_.size();
    }

    [[nodiscard]] auto row_separator_at(std::string_view source, std::size_t i) const
        -> std::size_t {
        if (source[i] == row_lead_ && source.substr(i).starts_with(row_)) {
            return row_.size();
        }
        if (bare_newline_ && source[i] == '\n') {
            return 1;
        }
        return 0;
    }

   private:
    std::string_view field_;
    std::string_view row_;
    char field_lead_;
    char row_lead_;
    bool bare_newline_;
};

template <typename Separators>
auto scan(std::string_view source, const Separators& separators) -> ParseResult {
    Rows rows;
    Row row;

    const std::size_t end = source.size();
    std::size_t start = 0;
    std::size_t cursor = 0;

    const auto close_field = [&]() {
        row.emplace_back(source.substr(start, cursor - start));
    };
    const auto close_row = [&]() {
        rows.push_back(std::move(row));
        row = Row{};
    };
    const auto problem = [&](ParseProblemKind kind) -> std::unexpected<ParseProblem> {
        return std::unexpected(ParseProblem{.kind = kind, .row = rows.size()});
    };

    while (true) {
        if (cursor >= end) {
            // A trailing row separator leaves nothing pending: no extra row.
            if (cursor != start || !row.empty()) {
                close_field();
                close_row();
            }
            break;
        }

        if (const auto n = separators.field_separator_at(source, cursor); n > 0) {
            close_field();
            cursor += n;
            start = cursor;
            continue;
        }

        if (const auto n = separators.row_separator_at(source, cursor); n > 0) {
            close_field();
            close_row();
            cursor += n;
            start = cursor;
            continue;
        }

        if (source[cursor] != '"') {
            ++cursor;
            continue;
        }

        // Quoted field. Text already scanned in this field is kept as the
        // first segment; every `""` pair contributes one literal quote.
        std::string text(source.substr(start, cursor - start));
        std::size_t segment = cursor + 1;
        while (true) {
            const auto quote = source.find('"', segment);
            if (quote == std::string_view::npos) {
                return problem(ParseProblemKind::SourceEndedWithoutClosingQuote);
            }
            if (quote + 1 < end && source[quote + 1] == '"') {
                text.append(source.substr(segment, quote + 1 - segment));
                segment = quote + 2;
                continue;
            }
            text.append(source.substr(segment, quote - segment));
            cursor = quote + 1;
            break;
        }
        row.push_back(std::move(text));

        if (cursor >= end) {
            close_row();
            break;
        }
        if (const auto n = separators.field_separator_at(source, cursor); n > 0) {
            cursor += n;
            start = cursor;
            continue;
        }
        if (const auto n = separators.row_separator_at(source, cursor); n > 0) {
            close_row();
            cursor += n;
            start = cursor;
            continue;
        }
        return problem(ParseProblemKind::AdditionalCharactersAfterClosingQuote);
    }

    return rows;
}

}  // namespace

auto ParseProblem::format() const -> std::string {
    switch (kind) {
        case ParseProblemKind::SourceEndedWithoutClosingQuote:
            return fmt::format("row {}: source ended without a closing quote", row);
        case ParseProblemKind::AdditionalCharactersAfterClosingQuote:
            return fmt::format("row {}: additional characters after a closing quote", row);
    }
    return fmt::format("row {}: unknown parse problem", row);
}

auto parse(const Config& config, std::string_view source) -> ParseResult {
    if (source.empty()) {
        return Rows{};
    }

    ParseResult result;
    if (config.row_separator() == "\r\n" && config.field_separator() == ",") {
        result = scan(source, LiteralSeparators<','>{});
    } else if (config.row_separator() == "\r\n" && config.field_separator() == ";") {
        result = scan(source, LiteralSeparators<';'>{});
    } else {
        result = scan(source, ConfiguredSeparators(config));
    }

    if (result) {
        spdlog::debug("parse: {} rows from {} bytes", result->size(), source.size());
    } else {
        spdlog::debug("parse: {}", result.error().format());
    }
    return result;
}

}  // namespace csvdecode::parser
