#pragma once

#include <optional>
#include <string>
#include <vector>

#include "weft/analysis/parameter_set.hpp"
#include "weft/analysis/special_functions.hpp"
#include "weft/common/diagnostic/diagnostic_sink.hpp"
#include "weft/library/function.hpp"
#include "weft/library/type.hpp"

namespace weft::analysis {

struct Env;

// c_type of the completion callback that marks an async function.
inline constexpr const char* kAsyncReadyCallbackCType = "GAsyncReadyCallback";

struct FunctionInfo {
  std::string name;
  std::string c_identifier;
  library::TypeId owner = library::TypeId::Invalid();
  bool is_async = false;
  bool throws = false;
  bool in_trait = false;
  bool disable_length_detect = false;
  ParameterSet parameters;
  std::optional<FunctionType> special;
  std::optional<std::string> finish_func;
};

// Dotted path used in diagnostics: "<owner full name>.<name>", or
// "<namespace>.<name>" for free functions.
auto FunctionPath(const Env& env, const library::Function& function)
    -> std::string;

// A function is async when it declares a finish function or takes a
// GAsyncReadyCallback. `_finish` functions never are.
auto IsAsyncFunction(const Env& env, const library::Function& function)
    -> bool;

// Whether the function is generated inside the owner's shared trait: the
// owner is an interface, or a class that is not final and whose trait is
// not disabled in the configuration.
auto IsInTrait(const Env& env, const library::Function& function) -> bool;

// Lower the parameters of one function and run the return post-pass. When
// `sink` is given, unknown conversions and configuration entries that match
// no parameter are reported as warnings.
auto AnalyzeFunction(
    const Env& env, const library::Function& function,
    DiagnosticSink* sink = nullptr) -> FunctionInfo;

// Analyze every function of the library in declaration order. Also warns
// about object and function configuration entries that match nothing.
auto AnalyzeLibrary(const Env& env, DiagnosticSink* sink = nullptr)
    -> std::vector<FunctionInfo>;

}  // namespace weft::analysis
