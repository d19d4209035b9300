#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace csvdecode::parser {

enum class ConfigProblem : std::uint8_t {
    NeedNonBlankFieldSeparator,
    NeedNonBlankRowSeparator,
};

/// Unvalidated separator settings, as supplied by a caller.
struct ConfigOptions {
    std::string field_separator = ",";
    std::string row_separator = "\r\n";
};

/// Validated separator configuration.
///
/// Both separators are guaranteed non-empty. The first character of each is
/// cached so the scanner can reject most positions with a single compare.
class Config {
   public:
    [[nodiscard]] auto field_separator() const noexcept -> std::string_view {
        return field_separator_;
    }
    [[nodiscard]] auto row_separator() const noexcept -> std::string_view {
        return row_separator_;
    }
    [[nodiscard]] auto field_lead() const noexcept -> char { return field_separator_.front(); }
    [[nodiscard]] auto row_lead() const noexcept -> char { return row_separator_.front(); }

    /// True when a bare "\n" also terminates a row (row separator is CRLF).
    [[nodiscard]] auto accepts_bare_newline() const noexcept -> bool {
        return row_separator_ == "\r\n";
    }

    auto operator==(const Config&) const -> bool = default;

   private:
    friend auto build_config(ConfigOptions options) -> std::expected<Config, ConfigProblem>;

    Config(std::string field_separator, std::string row_separator)
        : field_separator_(std::move(field_separator)), row_separator_(std::move(row_separator)) {}

    std::string field_separator_;
    std::string row_separator_;
};

/// Validate separator settings. The field separator is checked first.
[[nodiscard]] auto build_config(ConfigOptions options) -> std::expected<Config, ConfigProblem>;

/// Comma-separated fields, CRLF-separated rows (bare LF tolerated).
[[nodiscard]] auto default_config() -> Config;

[[nodiscard]] auto format(ConfigProblem problem) -> std::string;

}  // namespace csvdecode::parser
