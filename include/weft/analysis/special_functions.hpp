#pragma once

#include <cstdint>
#include <optional>

#include "weft/library/function.hpp"

namespace weft::analysis {

struct Env;

enum class FunctionType : uint8_t {
  // `to_string`/`get_name` of an enumeration or bitfield, emitted as a
  // static string lookup.
  kStaticStringify,
};

auto DetectSpecialFunction(const Env& env, const library::Function& function)
    -> std::optional<FunctionType>;

auto ToString(FunctionType type) -> const char*;

}  // namespace weft::analysis
