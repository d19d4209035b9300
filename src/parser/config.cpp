#include <csvdecode/parser/config.hpp>

#include <utility>

namespace csvdecode::parser {

auto build_config(ConfigOptions options) -> std::expected<Config, ConfigProblem> {
    if (options.field_separator.empty()) {
        return std::unexpected(ConfigProblem::NeedNonBlankFieldSeparator);
    }
    if (options.row_separator.empty()) {
        return std::unexpected(ConfigProblem::NeedNonBlankRowSeparator);
    }
    return Config(std::move(options.field_separator), std::move(options.row_separator));
}

auto default_config() -> Config {
    // The default options are non-empty, so this cannot fail.
    return *build_config(ConfigOptions{});
}

auto format(ConfigProblem problem) -> std::string {
    switch (problem) {
        case ConfigProblem::NeedNonBlankFieldSeparator:
            return "field separator must not be empty";
        case ConfigProblem::NeedNonBlankRowSeparator:
            return "row separator must not be empty";
    }
    return "unknown config problem";
}

}  // namespace csvdecode::parser
