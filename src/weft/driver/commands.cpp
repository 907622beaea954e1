#include "commands.hpp"

#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "argparse/argparse.hpp"
#include "input.hpp"
#include "print.hpp"
#include "weft/analysis/dumper.hpp"
#include "weft/analysis/env.hpp"
#include "weft/analysis/functions.hpp"
#include "weft/analysis/verify.hpp"
#include "weft/common/diagnostic/diagnostic_sink.hpp"
#include "weft/common/internal_error.hpp"
#include "weft/library/function.hpp"

namespace weft::driver {

namespace {

// Functions selected by --function (binding name or native symbol), or all
// of them.
auto SelectFunctions(
    const analysis::Env& env, const std::optional<std::string>& filter)
    -> std::vector<const library::Function*> {
  std::vector<const library::Function*> result;
  for (const library::Function& function : env.library->Functions()) {
    if (!filter || function.name == *filter ||
        function.c_identifier == *filter) {
      result.push_back(&function);
    }
  }
  return result;
}

void VerifyOrThrow(
    const analysis::Env& env, const library::Function& function,
    const analysis::FunctionInfo& info) {
  auto verified = analysis::VerifyParameterSet(
      info.parameters, function.parameters.size(),
      analysis::FunctionPath(env, function));
  if (!verified) {
    throw common::InternalError(
        "parameter lowering",
        fmt::format(
            "{}: {}", FormatDiagSpan(verified.error().primary.span),
            verified.error().primary.message));
  }
}

}  // namespace

auto DumpCommand(const argparse::ArgumentParser& cmd) -> int {
  auto input = PrepareInput(cmd);
  if (!input) {
    PrintDiagnostic(input.error());
    return 1;
  }

  analysis::Env env{.library = &input->library, .config = &input->config};
  auto filter = cmd.present<std::string>("--function");
  auto selected = SelectFunctions(env, filter);
  if (filter && selected.empty()) {
    PrintError(fmt::format("no function named '{}'", *filter));
    return 1;
  }

  std::vector<analysis::FunctionInfo> functions;
  functions.reserve(selected.size());
  for (const library::Function* function : selected) {
    functions.push_back(analysis::AnalyzeFunction(env, *function));
    VerifyOrThrow(env, *function, functions.back());
  }

  analysis::Dumper dumper(&env, &std::cout);
  dumper.Dump(functions);
  return 0;
}

auto CheckCommand(const argparse::ArgumentParser& cmd) -> int {
  auto input = PrepareInput(cmd);
  if (!input) {
    PrintDiagnostic(input.error());
    return 1;
  }

  analysis::Env env{.library = &input->library, .config = &input->config};
  DiagnosticSink sink;
  std::vector<analysis::FunctionInfo> functions =
      analysis::AnalyzeLibrary(env, &sink);

  const auto& declared = env.library->Functions();
  for (size_t i = 0; i < declared.size(); ++i) {
    VerifyOrThrow(env, declared[i], functions[i]);
  }

  PrintDiagnostics(sink);
  if (sink.HasErrors()) {
    return 1;
  }
  fmt::print(
      "{}: {} functions checked\n", env.library->Namespace(), functions.size());
  return 0;
}

}  // namespace weft::driver
