#include <csvdecode/decode/decoder.hpp>

#include <charconv>
#include <system_error>

namespace csvdecode::decode {

namespace {

auto trim_blanks(std::string_view text) -> std::string_view {
    const auto begin = text.find_first_not_of(" \t");
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

// std::from_chars rejects a leading '+', which users do write.
auto strip_plus(std::string_view text) -> std::string_view {
    if (text.size() > 1 && text.front() == '+' && text[1] != '-' && text[1] != '+') {
        text.remove_prefix(1);
    }
    return text;
}

auto try_parse_int(std::string_view text, std::int64_t& out) -> bool {
    text = strip_plus(trim_blanks(text));
    if (text.empty()) {
        return false;
    }
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, out);
    return result.ec == std::errc() && result.ptr == end;
}

auto try_parse_double(std::string_view text, double& out) -> bool {
    text = strip_plus(trim_blanks(text));
    if (text.empty()) {
        return false;
    }
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, out);
    return result.ec == std::errc() && result.ptr == end;
}

auto column_text(const RowContext& context, std::size_t index)
    -> std::expected<std::string_view, Problem> {
    if (index >= context.fields.size()) {
        return std::unexpected(Problem{ExpectedColumn{.index = index}});
    }
    return std::string_view{context.fields[index]};
}

}  // namespace

auto locate(const RowContext& context) -> std::expected<std::string_view, Problem> {
    if (context.location == nullptr || std::holds_alternative<OnlyColumn>(*context.location)) {
        if (context.fields.size() != 1) {
            return std::unexpected(Problem{ExpectedOneColumn{.found = context.fields.size()}});
        }
        return std::string_view{context.fields.front()};
    }

    if (const auto* column = std::get_if<Column>(context.location)) {
        return column_text(context, column->index);
    }

    const auto& name = std::get<Field>(*context.location).name;
    if (context.header == nullptr) {
        return std::unexpected(Problem{ExpectedField{.name = name}});
    }
    const auto it = context.header->find(name);
    if (it == context.header->end()) {
        return std::unexpected(Problem{ExpectedField{.name = name}});
    }
    return column_text(context, it->second);
}

auto string() -> Decoder<std::string> {
    return Decoder<std::string>([](const RowContext& context) -> DecodeResult<std::string> {
        auto text = locate(context);
        if (!text) {
            return std::unexpected(std::move(text.error()));
        }
        return std::string(*text);
    });
}

auto int64() -> Decoder<std::int64_t> {
    return Decoder<std::int64_t>([](const RowContext& context) -> DecodeResult<std::int64_t> {
        auto text = locate(context);
        if (!text) {
            return std::unexpected(std::move(text.error()));
        }
        std::int64_t value = 0;
        if (!try_parse_int(*text, value)) {
            return std::unexpected(Problem{ExpectedInt{.raw = std::string(*text)}});
        }
        return value;
    });
}

auto float64() -> Decoder<double> {
    return Decoder<double>([](const RowContext& context) -> DecodeResult<double> {
        auto text = locate(context);
        if (!text) {
            return std::unexpected(std::move(text.error()));
        }
        double value = 0.0;
        if (!try_parse_double(*text, value)) {
            return std::unexpected(Problem{ExpectedFloat{.raw = std::string(*text)}});
        }
        return value;
    });
}

}  // namespace csvdecode::decode
