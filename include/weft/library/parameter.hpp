#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "weft/library/type.hpp"

namespace weft::library {

enum class ParameterDirection : uint8_t {
  kIn,
  kOut,
  kInOut,
  kReturn,
};

// Ownership handed across the call.
enum class Transfer : uint8_t {
  kNone,       // Callee borrows
  kContainer,  // Container moves, elements are borrowed
  kFull,       // Everything moves
};

// Lifetime of a callback argument.
enum class ParameterScope : uint8_t {
  kCall,      // Valid for the duration of the call
  kAsync,     // Valid until the async operation completes
  kNotified,  // Valid until the destroy notifier runs
  kForever,   // Never released
};

// One parameter (or the return value) of a native function as extracted
// from the interface description. Indices refer to positions in the
// owning function's parameter list.
struct Parameter {
  std::string name;
  TypeId typ;
  std::string c_type;
  ParameterDirection direction = ParameterDirection::kIn;
  bool nullable = false;
  bool allow_none = false;
  Transfer transfer = Transfer::kNone;
  bool caller_allocates = false;
  ParameterScope scope = ParameterScope::kCall;
  std::optional<uint32_t> array_length;
  std::optional<uint32_t> closure;
  std::optional<uint32_t> destroy;
  bool is_error = false;
  bool instance_parameter = false;
};

auto ToString(ParameterDirection direction) -> const char*;
auto ToString(Transfer transfer) -> const char*;
auto ToString(ParameterScope scope) -> const char*;

}  // namespace weft::library
