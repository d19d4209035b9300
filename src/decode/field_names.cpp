#include <csvdecode/decode/field_names.hpp>

#include <spdlog/spdlog.h>

namespace csvdecode::decode {

auto make_header_index(std::span<const std::string> names) -> HeaderIndex {
    HeaderIndex index;
    index.reserve(names.size());
    for (std::size_t i = 0; i < names.size(); ++i) {
        index.insert_or_assign(names[i], i);
    }
    return index;
}

auto resolve_field_names(const FieldNames& field_names, const parser::Rows& rows)
    -> std::expected<ResolvedRows, Problem> {
    const std::span<const parser::Row> all{rows};

    if (std::holds_alternative<NoFieldNames>(field_names)) {
        return ResolvedRows{.header = std::nullopt, .rows = all, .first_row = 0};
    }

    if (const auto* custom = std::get_if<CustomFieldNames>(&field_names)) {
        spdlog::debug("field names: {} supplied by caller", custom->names.size());
        return ResolvedRows{
            .header = make_header_index(custom->names),
            .rows = all,
            .first_row = 0,
        };
    }

    if (rows.empty()) {
        return std::unexpected(Problem{NoFieldNamesOnFirstRow{}});
    }
    spdlog::debug("field names: {} taken from the first row", rows.front().size());
    return ResolvedRows{
        .header = make_header_index(rows.front()),
        .rows = all.subspan(1),
        .first_row = 1,
    };
}

}  // namespace csvdecode::decode
