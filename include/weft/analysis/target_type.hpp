#pragma once

#include <string>

#include "weft/common/diagnostic/diagnostic.hpp"
#include "weft/library/type.hpp"

namespace weft::analysis {

struct Env;

// Spelling of a type in generated binding source, e.g. "u32", "GString",
// "Vec<Widget>". Types from another namespace are prefixed with that
// namespace's module ("gio::Cancellable"). Fails for shapes with no binding
// spelling (varargs, callbacks, unsupported fundamentals).
auto TargetTypeName(const Env& env, library::TypeId type)
    -> Result<std::string>;

// TargetTypeName, or "/*Unimplemented*/<name>" when the type has no
// binding spelling. Generated code carrying the marker does not compile,
// which flags it for manual review.
auto TargetTypeString(const Env& env, library::TypeId type) -> std::string;

}  // namespace weft::analysis
