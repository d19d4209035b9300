#pragma once

/// Convenience umbrella header for the csvdecode library.

#include <csvdecode/decode/decode.hpp>
#include <csvdecode/decode/decoder.hpp>
#include <csvdecode/decode/field_names.hpp>
#include <csvdecode/decode/pipeline.hpp>
#include <csvdecode/decode/problem.hpp>
#include <csvdecode/encode/encoder.hpp>
#include <csvdecode/parser/config.hpp>
#include <csvdecode/parser/parser.hpp>
