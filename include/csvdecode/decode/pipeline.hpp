#pragma once

#include <csvdecode/decode/decoder.hpp>

#include <functional>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

namespace csvdecode::decode {

/// Fluent builder for records with many fields.
///
/// Each step decodes one more positional argument for `F`; `build()` applies
/// `F` to all of them. Steps are plain `and_then`/`map` compositions, so a
/// pipeline decodes exactly like the equivalent hand-written decoder: left to
/// right, stopping at the first problem.
///
///     auto person = pipeline([](std::string name, std::int64_t age) {
///                       return Person{std::move(name), age};
///                   })
///                       .required(Field{"name"}, string())
///                       .required(Field{"age"}, int64())
///                       .build();
template <typename F, typename... Args>
class Pipeline {
   public:
    using Arguments = std::tuple<Args...>;

    Pipeline(F constructor, Decoder<Arguments> arguments)
        : constructor_(std::move(constructor)), arguments_(std::move(arguments)) {}

    /// Append the value of `decoder`.
    template <typename T>
    [[nodiscard]] auto required(Decoder<T> decoder) const -> Pipeline<F, Args..., T> {
        return Pipeline<F, Args..., T>(
            constructor_, arguments_.and_then([decoder = std::move(decoder)](Arguments collected) {
                return decoder.map([collected = std::move(collected)](T value) {
                    return std::tuple_cat(collected, std::tuple<T>(std::move(value)));
                });
            }));
    }

    /// Append the value of `decoder` read at `location`.
    template <typename T>
    [[nodiscard]] auto required(Location location, Decoder<T> decoder) const
        -> Pipeline<F, Args..., T> {
        return required(at(std::move(location), std::move(decoder)));
    }

    /// Append `std::optional<T>`: empty text at `location` is std::nullopt.
    template <typename T>
    [[nodiscard]] auto blank(Location location, Decoder<T> decoder) const
        -> Pipeline<F, Args..., std::optional<T>> {
        return required(at(std::move(location), decode::blank(std::move(decoder))));
    }

    /// Append `std::optional<T>`: a missing column or field is std::nullopt.
    template <typename T>
    [[nodiscard]] auto optional(Decoder<T> decoder) const
        -> Pipeline<F, Args..., std::optional<T>> {
        return required(decode::optional(std::move(decoder)));
    }

    [[nodiscard]] auto build() const {
        return arguments_.map([constructor = constructor_](Arguments arguments) {
            return std::apply(constructor, std::move(arguments));
        });
    }

   private:
    F constructor_;
    Decoder<Arguments> arguments_;
};

/// Start a pipeline around `constructor`.
template <typename F>
[[nodiscard]] auto pipeline(F constructor) -> Pipeline<F> {
    return Pipeline<F>(std::move(constructor), succeed(std::tuple<>{}));
}

}  // namespace csvdecode::decode
