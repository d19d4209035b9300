#include <csvdecode/decode/decoder.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

using namespace csvdecode::decode;
using csvdecode::parser::Row;

template <typename T>
auto problem_of(const DecodeResult<T>& result) -> Problem {
    REQUIRE_FALSE(result.has_value());
    return result.error();
}

}  // namespace

TEST_CASE("String reads the only column verbatim") {
    REQUIRE(string().decode_row(Row{" a b "}) == " a b ");
    REQUIRE(string().decode_row(Row{""}) == "");
}

TEST_CASE("Primitives without a location need exactly one column") {
    REQUIRE(problem_of(string().decode_row(Row{"a", "b"})) == Problem{ExpectedOneColumn{2}});
    REQUIRE(problem_of(int64().decode_row(Row{})) == Problem{ExpectedOneColumn{0}});
}

TEST_CASE("Int64 parses integers") {
    REQUIRE(int64().decode_row(Row{"42"}) == 42);
    REQUIRE(int64().decode_row(Row{"-7"}) == -7);
    REQUIRE(int64().decode_row(Row{"+7"}) == 7);
    REQUIRE(int64().decode_row(Row{" 12\t"}) == 12);
    REQUIRE(int64().decode_row(Row{"9223372036854775807"}) == INT64_MAX);
}

TEST_CASE("Int64 keeps the raw text on failure") {
    REQUIRE(problem_of(int64().decode_row(Row{"1.5"})) == Problem{ExpectedInt{"1.5"}});
    REQUIRE(problem_of(int64().decode_row(Row{"abc"})) == Problem{ExpectedInt{"abc"}});
    REQUIRE(problem_of(int64().decode_row(Row{""})) == Problem{ExpectedInt{""}});
    REQUIRE(problem_of(int64().decode_row(Row{" 1 2 "})) == Problem{ExpectedInt{" 1 2 "}});
    REQUIRE(problem_of(int64().decode_row(Row{"+-1"})) == Problem{ExpectedInt{"+-1"}});
    REQUIRE(problem_of(int64().decode_row(Row{"99999999999999999999"})) ==
            Problem{ExpectedInt{"99999999999999999999"}});
}

TEST_CASE("Float64 parses numbers") {
    REQUIRE(*float64().decode_row(Row{"3.14"}) == Catch::Approx(3.14));
    REQUIRE(*float64().decode_row(Row{"-2"}) == Catch::Approx(-2.0));
    REQUIRE(*float64().decode_row(Row{"+1e3"}) == Catch::Approx(1000.0));
    REQUIRE(*float64().decode_row(Row{" .5 "}) == Catch::Approx(0.5));
}

TEST_CASE("Float64 keeps the raw text on failure") {
    REQUIRE(problem_of(float64().decode_row(Row{"1.5x"})) == Problem{ExpectedFloat{"1.5x"}});
    REQUIRE(problem_of(float64().decode_row(Row{""})) == Problem{ExpectedFloat{""}});
    REQUIRE(problem_of(float64().decode_row(Row{"one"})) == Problem{ExpectedFloat{"one"}});
}

TEST_CASE("Column reads by position") {
    const Row row{"a", "b", "c"};
    REQUIRE(column(0, string()).decode_row(row) == "a");
    REQUIRE(column(2, string()).decode_row(row) == "c");
}

TEST_CASE("Column past the end of the row fails") {
    REQUIRE(problem_of(column(1, string()).decode_row(Row{"a"})) ==
            Problem{ExpectedColumn{1}});
}

TEST_CASE("Column problems from the inner decoder pass through") {
    REQUIRE(problem_of(column(1, int64()).decode_row(Row{"1", "x"})) ==
            Problem{ExpectedInt{"x"}});
}

TEST_CASE("Field reads through the header") {
    const HeaderIndex header{{"id", 0}, {"name", 1}};
    const Row row{"1", "Atlas"};
    REQUIRE(field("name", string()).decode_row(row, &header) == "Atlas");
    REQUIRE(field("id", int64()).decode_row(row, &header) == 1);
}

TEST_CASE("Field missing from the header fails") {
    const HeaderIndex header{{"id", 0}};
    REQUIRE(problem_of(field("name", string()).decode_row(Row{"1"}, &header)) ==
            Problem{ExpectedField{"name"}});
}

TEST_CASE("Field without a header fails") {
    REQUIRE(problem_of(field("name", string()).decode_row(Row{"1"})) ==
            Problem{ExpectedField{"name"}});
}

TEST_CASE("Field naming a column the row lacks fails as a column") {
    const HeaderIndex header{{"id", 0}, {"name", 1}};
    REQUIRE(problem_of(field("name", string()).decode_row(Row{"1"}, &header)) ==
            Problem{ExpectedColumn{1}});
}

TEST_CASE("Innermost location wins") {
    const Row row{"a", "b", "c"};
    REQUIRE(column(0, column(2, string())).decode_row(row) == "c");
}

TEST_CASE("Succeed ignores the row") {
    REQUIRE(succeed(5).decode_row(Row{}) == 5);
    REQUIRE(succeed(std::string("x")).decode_row(Row{"a", "b"}) == "x");
}

TEST_CASE("Fail ignores the row") {
    REQUIRE(problem_of(fail<int>("nope").decode_row(Row{"1"})) == Problem{Failure{"nope"}});
}

TEST_CASE("Map transforms values and keeps failures") {
    auto twice = map([](std::int64_t n) { return n * 2; }, int64());
    REQUIRE(twice.decode_row(Row{"21"}) == 42);
    REQUIRE(problem_of(twice.decode_row(Row{"x"})) == Problem{ExpectedInt{"x"}});
    REQUIRE(int64().map([](std::int64_t n) { return n + 1; }).decode_row(Row{"1"}) == 2);
}

TEST_CASE("Map obeys the functor laws") {
    const auto f = [](std::int64_t n) { return n + 3; };
    const auto g = [](std::int64_t n) { return n * 5; };
    const auto d = column(0, int64());

    for (const Row& row : {Row{"4"}, Row{"-1", "x"}, Row{"x"}, Row{}}) {
        auto identity = map([](std::int64_t n) { return n; }, d);
        REQUIRE(identity.decode_row(row) == d.decode_row(row));

        auto composed = map([&](std::int64_t n) { return g(f(n)); }, d);
        auto chained = map(g, map(f, d));
        REQUIRE(composed.decode_row(row) == chained.decode_row(row));
    }
}

TEST_CASE("Map combines several decoders") {
    auto sum3 = map([](std::int64_t a, std::int64_t b, std::int64_t c) { return a + b + c; },
                    column(0, int64()), column(1, int64()), column(2, int64()));
    REQUIRE(sum3.decode_row(Row{"1", "2", "3"}) == 6);

    auto pair = map([](std::string s, double x) { return std::make_pair(std::move(s), x); },
                    column(0, string()), column(1, float64()));
    auto decoded = pair.decode_row(Row{"pi", "3.5"});
    REQUIRE(decoded->first == "pi");
    REQUIRE(decoded->second == Catch::Approx(3.5));
}

TEST_CASE("Map with eight decoders") {
    auto all = map(
        [](std::int64_t a, std::int64_t b, std::int64_t c, std::int64_t d, std::int64_t e,
           std::int64_t f, std::int64_t g, std::int64_t h) {
            return std::vector<std::int64_t>{a, b, c, d, e, f, g, h};
        },
        column(0, int64()), column(1, int64()), column(2, int64()), column(3, int64()),
        column(4, int64()), column(5, int64()), column(6, int64()), column(7, int64()));
    REQUIRE(all.decode_row(Row{"1", "2", "3", "4", "5", "6", "7", "8"}) ==
            std::vector<std::int64_t>{1, 2, 3, 4, 5, 6, 7, 8});
}

TEST_CASE("Map reports the leftmost failure") {
    auto both = map([](std::int64_t a, std::int64_t b) { return a + b; }, column(0, int64()),
                    column(1, int64()));
    REQUIRE(problem_of(both.decode_row(Row{"x", "y"})) == Problem{ExpectedInt{"x"}});
    REQUIRE(problem_of(both.decode_row(Row{"1", "y"})) == Problem{ExpectedInt{"y"}});
    REQUIRE(problem_of(both.decode_row(Row{"x"})) == Problem{ExpectedInt{"x"}});
    REQUIRE(problem_of(both.decode_row(Row{"1"})) == Problem{ExpectedColumn{1}});
}

TEST_CASE("And then picks a column from a value") {
    auto indirect = and_then(
        [](std::int64_t index) {
            if (index < 0) {
                return fail<std::string>("column index must not be negative, got " +
                                         std::to_string(index));
            }
            return column(static_cast<std::size_t>(index), string());
        },
        column(0, int64()));
    REQUIRE(indirect.decode_row(Row{"1", "a", "b"}) == "a");
    REQUIRE(indirect.decode_row(Row{"2", "a", "b"}) == "b");
    REQUIRE(problem_of(indirect.decode_row(Row{"3", "a", "b"})) == Problem{ExpectedColumn{3}});
    REQUIRE(problem_of(indirect.decode_row(Row{"x", "a"})) == Problem{ExpectedInt{"x"}});
    REQUIRE(problem_of(indirect.decode_row(Row{"-1", "a"})) ==
            Problem{Failure{"column index must not be negative, got -1"}});
}

TEST_CASE("And then validates values") {
    auto positive = int64().and_then([](std::int64_t n) {
        return n > 0 ? succeed(n) : fail<std::int64_t>("expected a positive number");
    });
    REQUIRE(positive.decode_row(Row{"3"}) == 3);
    REQUIRE(problem_of(positive.decode_row(Row{"-3"})) ==
            Problem{Failure{"expected a positive number"}});
}

TEST_CASE("And then obeys the monad laws") {
    const auto f = [](std::int64_t n) { return column(static_cast<std::size_t>(n), int64()); };
    const auto g = [](std::int64_t n) {
        return n % 2 == 0 ? succeed(n / 2) : fail<std::int64_t>("odd");
    };
    const auto d = column(0, int64());

    for (const Row& row : {Row{"1", "4"}, Row{"2", "7", "3"}, Row{"1", "x"}, Row{"9"}, Row{}}) {
        // Left identity: succeed(x) >>= f is f(x).
        REQUIRE(and_then(f, succeed<std::int64_t>(1)).decode_row(row) == f(1).decode_row(row));

        // Right identity: d >>= succeed is d.
        auto right = and_then([](std::int64_t n) { return succeed(n); }, d);
        REQUIRE(right.decode_row(row) == d.decode_row(row));

        // Associativity.
        auto nested_left = and_then(g, and_then(f, d));
        auto nested_right = and_then([&](std::int64_t n) { return and_then(g, f(n)); }, d);
        REQUIRE(nested_left.decode_row(row) == nested_right.decode_row(row));
    }
}

TEST_CASE("One of takes the first success") {
    auto number = one_of(float64().map([](double x) { return std::to_string(x); }),
                         string().map([](std::string s) { return "text:" + s; }));
    REQUIRE(number.decode_row(Row{"abc"}) == "text:abc");

    auto id = one_of(field("id", int64()), field("identifier", int64()), succeed<std::int64_t>(0));
    const HeaderIndex header{{"identifier", 0}};
    REQUIRE(id.decode_row(Row{"17"}, &header) == 17);
    REQUIRE(id.decode_row(Row{"x"}, &header) == 0);
}

TEST_CASE("One of reports the last problem when all fail") {
    auto either = one_of(column(0, int64()), column(1, int64()));
    REQUIRE(problem_of(either.decode_row(Row{"x", "y"})) == Problem{ExpectedInt{"y"}});
}

TEST_CASE("Blank treats empty text as absent") {
    auto weight = column(1, blank(float64()));
    REQUIRE(weight.decode_row(Row{"a", ""}) == std::optional<double>{});
    REQUIRE(*weight.decode_row(Row{"a", "2.5"}).value() == Catch::Approx(2.5));
    REQUIRE(problem_of(weight.decode_row(Row{"a", "heavy"})) == Problem{ExpectedFloat{"heavy"}});
    REQUIRE(problem_of(weight.decode_row(Row{"a"})) == Problem{ExpectedColumn{1}});
}

TEST_CASE("Blank does not treat whitespace as empty") {
    REQUIRE(problem_of(blank(int64()).decode_row(Row{" "})) == Problem{ExpectedInt{" "}});
}

TEST_CASE("Optional treats a missing column or field as absent") {
    auto third = optional(column(2, int64()));
    REQUIRE(third.decode_row(Row{"1", "2"}) == std::optional<std::int64_t>{});
    REQUIRE(third.decode_row(Row{"1", "2", "3"}) == std::optional<std::int64_t>{3});
    REQUIRE(problem_of(third.decode_row(Row{"1", "2", "x"})) == Problem{ExpectedInt{"x"}});

    auto nickname = optional(field("nickname", string()));
    const HeaderIndex header{{"name", 0}};
    REQUIRE(nickname.decode_row(Row{"Atlas"}, &header) == std::optional<std::string>{});
}

TEST_CASE("From result and from optional lift plain values") {
    REQUIRE(from_result(std::expected<int, std::string>{3}).decode_row(Row{}) == 3);
    REQUIRE(problem_of(from_result(std::expected<int, std::string>{std::unexpected("bad")})
                           .decode_row(Row{})) == Problem{Failure{"bad"}});
    REQUIRE(from_optional(std::optional<int>{4}, "missing").decode_row(Row{}) == 4);
    REQUIRE(problem_of(from_optional(std::optional<int>{}, "missing").decode_row(Row{})) ==
            Problem{Failure{"missing"}});
}

TEST_CASE("Decoders are reusable values") {
    const auto d = column(0, int64());
    const auto copy = d;
    REQUIRE(d.decode_row(Row{"1"}) == 1);
    REQUIRE(copy.decode_row(Row{"2"}) == 2);
    REQUIRE(d.decode_row(Row{"1"}) == d.decode_row(Row{"1"}));
}

TEST_CASE("Problems format as messages") {
    REQUIRE(format(Problem{ExpectedColumn{3}}) == "expected a field in column 3");
    REQUIRE(format(Problem{ExpectedField{"Name"}}) == "expected a field named \"Name\"");
    REQUIRE(format(Problem{ExpectedOneColumn{2}}) == "expected exactly one column, but found 2");
    REQUIRE(format(Problem{ExpectedInt{"x"}}) == "expected an integer, but got \"x\"");
    REQUIRE(format(Problem{ExpectedFloat{"x"}}) ==
            "expected a floating-point number, but got \"x\"");
    REQUIRE(format(Problem{Failure{"custom"}}) == "custom");
}
