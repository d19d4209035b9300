#include <csvdecode/csvdecode.hpp>

#include <fmt/core.h>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

struct Pet {
    std::int64_t id = 0;
    std::string name;
    std::string species;
    std::optional<double> weight;
};

}  // namespace

auto main() -> int {
    namespace decode = csvdecode::decode;

    const std::string source =
        "id,name,species,weight\r\n"
        "1,Atlas,cat,14.5\r\n"
        "2,Axel,puffin,\r\n"
        "3,\"Boots, the \"\"Brave\"\"\",dog,30\r\n";

    fmt::print("=== Parsing ===\n");

    auto rows = csvdecode::parser::parse(csvdecode::parser::default_config(), source);
    if (!rows) {
        fmt::print("parse failed: {}\n", rows.error().format());
        return 1;
    }
    fmt::print("parsed {} rows, first row has {} fields\n", rows->size(), rows->front().size());

    fmt::print("\n=== Decoding with a pipeline ===\n");

    auto pet = decode::pipeline([](std::int64_t id, std::string name, std::string species,
                                   std::optional<double> weight) {
                   return Pet{id, std::move(name), std::move(species), weight};
               })
                   .required(decode::Field{"id"}, decode::int64())
                   .required(decode::Field{"name"}, decode::string())
                   .required(decode::Field{"species"}, decode::string())
                   .blank(decode::Field{"weight"}, decode::float64())
                   .build();

    auto pets = decode::decode_csv(decode::FromFirstRow{}, pet, source);
    if (!pets) {
        fmt::print("decode failed: {}\n", decode::format(pets.error()));
        return 1;
    }
    for (const auto& p : *pets) {
        fmt::print("#{} {} ({}), weight: {}\n", p.id, p.name, p.species,
                   p.weight ? fmt::format("{}", *p.weight) : std::string("unknown"));
    }

    fmt::print("\n=== Choosing a column from the data ===\n");

    // Column 0 says which of the following columns holds the value.
    auto indirect = decode::and_then(
        [](std::int64_t index) {
            if (index < 0) {
                return decode::fail<std::string>(
                    fmt::format("column index must not be negative, got {}", index));
            }
            return decode::column(static_cast<std::size_t>(index), decode::string());
        },
        decode::column(0, decode::int64()));

    for (const char* text : {"1,a,b", "2,a,b", "3,a,b", "-1,a,b"}) {
        auto result = decode::decode_csv(decode::NoFieldNames{}, indirect, text);
        if (result) {
            fmt::print("{} -> {}\n", text, result->front());
        } else {
            fmt::print("{} -> {}\n", text, decode::format(result.error()));
        }
    }

    fmt::print("\n=== Encoding ===\n");

    fmt::print("{}\n", csvdecode::encode::encode_with_field_names(
                           *pets, [](const Pet& p) -> csvdecode::encode::NamedFields {
                               return {{"id", std::to_string(p.id)}, {"name", p.name}};
                           }));
    return 0;
}
