#include "weft/library/parameter.hpp"

namespace weft::library {

auto ToString(ParameterDirection direction) -> const char* {
  switch (direction) {
    case ParameterDirection::kIn:
      return "in";
    case ParameterDirection::kOut:
      return "out";
    case ParameterDirection::kInOut:
      return "inout";
    case ParameterDirection::kReturn:
      return "return";
  }
  return "in";
}

auto ToString(Transfer transfer) -> const char* {
  switch (transfer) {
    case Transfer::kNone:
      return "none";
    case Transfer::kContainer:
      return "container";
    case Transfer::kFull:
      return "full";
  }
  return "none";
}

auto ToString(ParameterScope scope) -> const char* {
  switch (scope) {
    case ParameterScope::kCall:
      return "call";
    case ParameterScope::kAsync:
      return "async";
    case ParameterScope::kNotified:
      return "notified";
    case ParameterScope::kForever:
      return "forever";
  }
  return "call";
}

}  // namespace weft::library
