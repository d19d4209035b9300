#include <csvdecode/decode/decode.hpp>

#include <spdlog/spdlog.h>

namespace csvdecode::decode::detail {

void note_decoding_failure(std::size_t row, const Problem& problem) {
    spdlog::debug("decode: row {} failed: {}", row, format(problem));
}

}  // namespace csvdecode::decode::detail
