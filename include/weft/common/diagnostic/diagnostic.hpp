#pragma once

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace weft {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kError,      // Inconsistent library description
  kHostError,  // I/O, malformed manifest or configuration
  kWarning,    // Non-fatal, output needs manual review
  kNote,       // Auxiliary message
};

// Position inside a manifest or configuration file
struct FileLocation {
  std::string file;
  uint32_t line = 0;

  auto operator==(const FileLocation&) const -> bool = default;
};

// Dotted path of a library element, e.g. "Demo.Widget.set_data"
struct ElementPath {
  std::string path;

  auto operator==(const ElementPath&) const -> bool = default;
};

// Represents missing location
struct UnknownSpan {
  auto operator==(const UnknownSpan&) const -> bool = default;
};

using DiagSpan = std::variant<FileLocation, ElementPath, UnknownSpan>;

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  DiagSpan span;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  // Factory: inconsistent library element
  static auto Error(ElementPath element, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kError,
             .span = std::move(element),
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: host error without location
  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .span = UnknownSpan{},
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: host error pointing into an input file
  static auto HostError(FileLocation location, std::string msg)
      -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .span = std::move(location),
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: warning
  static auto Warning(ElementPath element, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kWarning,
             .span = std::move(element),
             .message = std::move(msg)},
        .notes = {},
    };
  }

  // Add a note without location
  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .span = UnknownSpan{},
            .message = std::move(msg),
        });
    return std::move(*this);
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

class DiagnosticException : public std::exception {
 public:
  explicit DiagnosticException(Diagnostic diag) : diag_(std::move(diag)) {
  }

  [[nodiscard]] auto GetDiagnostic() const -> const Diagnostic& {
    return diag_;
  }
  [[nodiscard]] auto what() const noexcept -> const char* override {
    return diag_.primary.message.c_str();
  }

 private:
  Diagnostic diag_;
};

// Render a span for printing; empty for UnknownSpan.
auto FormatDiagSpan(const DiagSpan& span) -> std::string;

}  // namespace weft
