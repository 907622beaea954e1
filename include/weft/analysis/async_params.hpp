#pragma once

#include <string_view>

#include "weft/analysis/parameter_set.hpp"

namespace weft::analysis {

inline constexpr std::string_view kCallbackParamName = "callback";
inline constexpr std::string_view kUserDataParamName = "user_data";

// Parameters of an async function that carry the future's completion state
// and are hidden from the surface signature.
// TODO: use the callback's closure index instead of the name suffix,
// "...data" also hides ordinary payload parameters such as "data".
auto IsAsyncParamToRemove(std::string_view name) -> bool;

// Late substitution applied to the primary step of an async function's
// parameter: the callback slot is always supplied, so its conversion
// becomes ToSome; the user data slot smuggles the completion state, so its
// pointer conversion becomes IntoRaw. Any other step is returned unchanged.
auto RestructureAsyncTransformation(TransformationKind kind)
    -> TransformationKind;

}  // namespace weft::analysis
