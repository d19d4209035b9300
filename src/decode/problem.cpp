#include <csvdecode/decode/problem.hpp>

#include <fmt/core.h>

namespace csvdecode::decode {

namespace {

struct ProblemFormatter {
    auto operator()(const ExpectedColumn& p) const -> std::string {
        return fmt::format("expected a field in column {}", p.index);
    }
    auto operator()(const ExpectedField& p) const -> std::string {
        return fmt::format("expected a field named \"{}\"", p.name);
    }
    auto operator()(const ExpectedOneColumn& p) const -> std::string {
        return fmt::format("expected exactly one column, but found {}", p.found);
    }
    auto operator()(const ExpectedInt& p) const -> std::string {
        return fmt::format("expected an integer, but got \"{}\"", p.raw);
    }
    auto operator()(const ExpectedFloat& p) const -> std::string {
        return fmt::format("expected a floating-point number, but got \"{}\"", p.raw);
    }
    auto operator()(const NoFieldNamesOnFirstRow&) const -> std::string {
        return "expected field names on the first row, but the input is empty";
    }
    auto operator()(const Failure& p) const -> std::string { return p.message; }
};

}  // namespace

auto format(const Problem& problem) -> std::string {
    return std::visit(ProblemFormatter{}, problem);
}

auto format(const Error& error) -> std::string {
    if (const auto* parsing = std::get_if<ParsingError>(&error)) {
        return fmt::format("parse error at {}", parsing->problem.format());
    }
    const auto& decoding = std::get<DecodingError>(error);
    return fmt::format("decoding error at row {}: {}", decoding.row, format(decoding.problem));
}

}  // namespace csvdecode::decode
