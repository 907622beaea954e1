#pragma once

#include <string>

#include "weft/common/diagnostic/diagnostic.hpp"
#include "weft/common/diagnostic/diagnostic_sink.hpp"

namespace weft::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);

// Print every diagnostic in reporting order, then a warning/error summary.
void PrintDiagnostics(const DiagnosticSink& sink);

}  // namespace weft::driver
