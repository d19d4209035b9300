#pragma once

#include <csvdecode/decode/field_names.hpp>
#include <csvdecode/decode/problem.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace csvdecode::decode {

/// Read the row's only field. The row must have exactly one.
struct OnlyColumn {
    auto operator==(const OnlyColumn&) const -> bool = default;
};

/// Read the field at a 0-based position.
struct Column {
    std::size_t index = 0;
    auto operator==(const Column&) const -> bool = default;
};

/// Read the field whose header name matches.
struct Field {
    std::string name;
    auto operator==(const Field&) const -> bool = default;
};

using Location = std::variant<OnlyColumn, Column, Field>;

/// Everything a decoder may look at while decoding one row.
struct RowContext {
    std::span<const std::string> fields;
    const HeaderIndex* header = nullptr;
    /// Current location; nullptr reads the row's only column.
    const Location* location = nullptr;
};

template <typename T>
using DecodeResult = std::expected<T, Problem>;

/// A composable rule turning one row into a `T`.
///
/// Decoders are immutable values: copying one shares no state with the
/// original, and decoding a row never affects how another row decodes.
template <typename T>
class Decoder {
   public:
    using value_type = T;
    using Fn = std::function<DecodeResult<T>(const RowContext&)>;

    explicit Decoder(Fn fn) : fn_(std::move(fn)) {}

    [[nodiscard]] auto decode(const RowContext& context) const -> DecodeResult<T> {
        return fn_(context);
    }

    /// Decode a standalone row, optionally against a header.
    [[nodiscard]] auto decode_row(std::span<const std::string> fields,
                                  const HeaderIndex* header = nullptr) const -> DecodeResult<T> {
        return fn_(RowContext{.fields = fields, .header = header});
    }

    template <typename F>
    [[nodiscard]] auto map(F f) const;

    template <typename F>
    [[nodiscard]] auto and_then(F f) const;

   private:
    Fn fn_;
};

template <typename D>
struct is_decoder : std::false_type {};

template <typename T>
struct is_decoder<Decoder<T>> : std::true_type {};

template <typename D>
concept AnyDecoder = is_decoder<std::remove_cvref_t<D>>::value;

// ---------------------------------------------------------------------------
// Primitives

/// Resolve the context's location to the field text it names.
[[nodiscard]] auto locate(const RowContext& context) -> std::expected<std::string_view, Problem>;

/// Field text, verbatim.
[[nodiscard]] auto string() -> Decoder<std::string>;

/// A 64-bit signed integer. Surrounding blanks are ignored.
[[nodiscard]] auto int64() -> Decoder<std::int64_t>;

/// A double. Surrounding blanks are ignored.
[[nodiscard]] auto float64() -> Decoder<double>;

// ---------------------------------------------------------------------------
// Locations

/// Run `decoder` with `location` as its current location.
template <typename T>
[[nodiscard]] auto at(Location location, Decoder<T> decoder) -> Decoder<T> {
    return Decoder<T>([location = std::move(location),
                       decoder = std::move(decoder)](const RowContext& context) {
        RowContext inner = context;
        inner.location = &location;
        return decoder.decode(inner);
    });
}

template <typename T>
[[nodiscard]] auto column(std::size_t index, Decoder<T> decoder) -> Decoder<T> {
    return at(Column{.index = index}, std::move(decoder));
}

template <typename T>
[[nodiscard]] auto field(std::string name, Decoder<T> decoder) -> Decoder<T> {
    return at(Field{.name = std::move(name)}, std::move(decoder));
}

// ---------------------------------------------------------------------------
// Constant decoders

template <typename T>
[[nodiscard]] auto succeed(T value) -> Decoder<T> {
    return Decoder<T>(
        [value = std::move(value)](const RowContext&) -> DecodeResult<T> { return value; });
}

template <typename T>
[[nodiscard]] auto fail(std::string message) -> Decoder<T> {
    return Decoder<T>([message = std::move(message)](const RowContext&) -> DecodeResult<T> {
        return std::unexpected(Problem{Failure{.message = message}});
    });
}

template <typename T>
[[nodiscard]] auto from_result(std::expected<T, std::string> result) -> Decoder<T> {
    if (result) {
        return succeed(std::move(*result));
    }
    return fail<T>(std::move(result.error()));
}

template <typename T>
[[nodiscard]] auto from_optional(std::optional<T> value, std::string message) -> Decoder<T> {
    if (value) {
        return succeed(std::move(*value));
    }
    return fail<T>(std::move(message));
}

// ---------------------------------------------------------------------------
// Composition

namespace detail {

template <typename R, typename F>
auto apply_each(const RowContext&, F& f) -> DecodeResult<R> {
    return std::invoke(f);
}

// Decodes left to right, binding each value into `f` before moving on, so
// the first failing decoder decides the problem.
template <typename R, typename F, typename T, typename... Rest>
auto apply_each(const RowContext& context, F& f, const Decoder<T>& first,
                const Decoder<Rest>&... rest) -> DecodeResult<R> {
    auto value = first.decode(context);
    if (!value) {
        return std::unexpected(std::move(value.error()));
    }
    auto bound = [&f, &value](auto&&... args) -> R {
        return std::invoke(f, std::move(*value), std::forward<decltype(args)>(args)...);
    };
    return apply_each<R>(context, bound, rest...);
}

}  // namespace detail

/// Decode every decoder against the same row and combine the values with
/// `f`. Works for any number of decoders.
template <typename F, typename T, typename... Ts>
[[nodiscard]] auto map(F f, Decoder<T> first, Decoder<Ts>... rest)
    -> Decoder<std::invoke_result_t<const F&, T, Ts...>> {
    using R = std::invoke_result_t<const F&, T, Ts...>;
    return Decoder<R>([f = std::move(f), first = std::move(first),
                       ... rest = std::move(rest)](const RowContext& context) {
        return detail::apply_each<R>(context, f, first, rest...);
    });
}

/// Decode with `decoder`, then decode the same row with the decoder that
/// `f` picks for the value.
template <typename F, typename T>
    requires AnyDecoder<std::invoke_result_t<const F&, T>>
[[nodiscard]] auto and_then(F f, Decoder<T> decoder) {
    using Next = std::remove_cvref_t<std::invoke_result_t<const F&, T>>;
    using U = typename Next::value_type;
    return Decoder<U>([f = std::move(f),
                       decoder = std::move(decoder)](const RowContext& context) -> DecodeResult<U> {
        auto value = decoder.decode(context);
        if (!value) {
            return std::unexpected(std::move(value.error()));
        }
        return std::invoke(f, std::move(*value)).decode(context);
    });
}

template <typename T>
template <typename F>
auto Decoder<T>::map(F f) const {
    return decode::map(std::move(f), *this);
}

template <typename T>
template <typename F>
auto Decoder<T>::and_then(F f) const {
    return decode::and_then(std::move(f), *this);
}

/// Try each decoder in turn; the first success wins. When all fail, the
/// last decoder's problem is reported.
template <typename T, typename... Rest>
    requires(std::same_as<Rest, Decoder<T>> && ...)
[[nodiscard]] auto one_of(Decoder<T> first, Rest... rest) -> Decoder<T> {
    std::vector<Decoder<T>> alternatives{std::move(first), std::move(rest)...};
    return Decoder<T>([alternatives = std::move(alternatives)](const RowContext& context) {
        auto result = alternatives.front().decode(context);
        for (std::size_t i = 1; i < alternatives.size() && !result; ++i) {
            result = alternatives[i].decode(context);
        }
        return result;
    });
}

/// Empty field text decodes to std::nullopt; anything else goes through
/// `decoder`, whose problems still propagate.
template <typename T>
[[nodiscard]] auto blank(Decoder<T> decoder) -> Decoder<std::optional<T>> {
    return Decoder<std::optional<T>>(
        [decoder = std::move(decoder)](
            const RowContext& context) -> DecodeResult<std::optional<T>> {
            auto text = locate(context);
            if (!text) {
                return std::unexpected(std::move(text.error()));
            }
            if (text->empty()) {
                return std::optional<T>{};
            }
            auto value = decoder.decode(context);
            if (!value) {
                return std::unexpected(std::move(value.error()));
            }
            return std::optional<T>{std::move(*value)};
        });
}

/// A missing column or field decodes to std::nullopt; other problems
/// propagate.
template <typename T>
[[nodiscard]] auto optional(Decoder<T> decoder) -> Decoder<std::optional<T>> {
    return Decoder<std::optional<T>>(
        [decoder = std::move(decoder)](
            const RowContext& context) -> DecodeResult<std::optional<T>> {
            auto value = decoder.decode(context);
            if (value) {
                return std::optional<T>{std::move(*value)};
            }
            if (std::holds_alternative<ExpectedColumn>(value.error()) ||
                std::holds_alternative<ExpectedField>(value.error())) {
                return std::optional<T>{};
            }
            return std::unexpected(std::move(value.error()));
        });
}

}  // namespace csvdecode::decode
