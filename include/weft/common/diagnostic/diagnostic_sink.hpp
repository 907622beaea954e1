#pragma once

#include <string>
#include <utility>
#include <vector>

#include "weft/common/diagnostic/diagnostic.hpp"

namespace weft {

// Collects diagnostics during analysis. Not thread-safe.
// Diagnostics are stored in order of reporting; callers may rely on this.
class DiagnosticSink {
 public:
  void Report(Diagnostic diag) {
    if (diag.primary.kind == DiagKind::kError ||
        diag.primary.kind == DiagKind::kHostError) {
      has_errors_ = true;
    }
    diagnostics_.push_back(std::move(diag));
  }

  void Error(ElementPath element, std::string msg) {
    Report(Diagnostic::Error(std::move(element), std::move(msg)));
  }

  void Warning(ElementPath element, std::string msg) {
    Report(Diagnostic::Warning(std::move(element), std::move(msg)));
  }

  [[nodiscard]] auto HasErrors() const -> bool {
    return has_errors_;
  }

  [[nodiscard]] auto GetDiagnostics() const -> const std::vector<Diagnostic>& {
    return diagnostics_;
  }

 private:
  std::vector<Diagnostic> diagnostics_;
  bool has_errors_ = false;
};

}  // namespace weft
