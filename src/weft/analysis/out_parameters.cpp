#include "weft/analysis/out_parameters.hpp"

#include "weft/analysis/conversion_type.hpp"
#include "weft/analysis/env.hpp"
#include "weft/analysis/target_type.hpp"
#include "weft/library/library.hpp"
#include "weft/library/parameter.hpp"
#include "weft/library/type.hpp"

namespace weft::analysis {

namespace {

auto IsCArrayWithDirectElements(const Env& env, library::TypeId type) -> bool {
  const library::Type& info = env.TypeOf(env.library->ResolveAlias(type));
  if (info.Kind() != library::TypeKind::kCArray) {
    return false;
  }
  return ClassifyConversion(env, info.AsContainer().element) ==
         ConversionType::kDirect;
}

}  // namespace

auto CanAsReturn(const Env& env, const library::Parameter& par) -> bool {
  switch (ClassifyConversion(env, par.typ)) {
    case ConversionType::kDirect:
    case ConversionType::kScalar:
      return true;
    case ConversionType::kPointer:
      // A buffer of plain values is unusable without its element count.
      if (IsCArrayWithDirectElements(env, par.typ) && !par.array_length) {
        return false;
      }
      return TargetTypeName(env, par.typ).has_value();
    case ConversionType::kBorrow:
    case ConversionType::kUnknown:
      return false;
  }
  return false;
}

}  // namespace weft::analysis
