#pragma once

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "lifter/common/source_span.hpp"

namespace lifter {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kError,      // Invalid program / semantic error
  kFatal,      // Broken invariant; processing of the unit stopped
  kHostError,  // I/O, malformed external input
  kWarning,    // Non-fatal
  kNote,       // Auxiliary message
};

// Stable error identity for lifecycle analysis diagnostics. Tests and tools
// match on the code, never on the message text.
enum class DiagCode : uint8_t {
  kDuplicateBinding,
  kInvalidSignature,
  kNonNominalReceiver,
  kConflictingIndirectionBinding,
  kUnresolvableRecursiveType,
  kIllegalDestructibleUsage,
  kMissingScopeExitEdge,
};

auto ToString(DiagCode code) -> std::string_view;
auto ParseDiagCode(std::string_view name) -> std::optional<DiagCode>;

// Represents missing source span (for host errors or when span unavailable)
struct UnknownSpan {
  auto operator==(const UnknownSpan&) const -> bool = default;
};

// A diagnostic span: either a resolved SourceSpan or UnknownSpan
using DiagSpan = std::variant<SourceSpan, UnknownSpan>;

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  DiagSpan span;
  std::string message;
  std::optional<DiagCode> code;  // set for lifecycle analysis errors

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  // Factory: semantic error in the analyzed program
  static auto Error(SourceSpan span, DiagCode code, std::string msg)
      -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kError,
             .span = span,
             .message = std::move(msg),
             .code = code},
        .notes = {},
    };
  }

  // Factory: unrecoverable invariant violation for the current unit
  static auto Fatal(DiagSpan span, DiagCode code, std::string msg)
      -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kFatal,
             .span = span,
             .message = std::move(msg),
             .code = code},
        .notes = {},
    };
  }

  // Factory: host error without source location
  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .span = UnknownSpan{},
             .message = std::move(msg),
             .code = std::nullopt},
        .notes = {},
    };
  }

  // Factory: host error with source location (e.g. a malformed YAML node)
  static auto HostError(SourceSpan span, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .span = span,
             .message = std::move(msg),
             .code = std::nullopt},
        .notes = {},
    };
  }

  // Factory: warning
  static auto Warning(SourceSpan span, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kWarning,
             .span = span,
             .message = std::move(msg),
             .code = std::nullopt},
        .notes = {},
    };
  }

  // Add a note with source location
  auto WithNote(SourceSpan span, std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .span = span,
            .message = std::move(msg),
            .code = std::nullopt,
        });
    return std::move(*this);
  }

  // Add a note without source location
  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .span = UnknownSpan{},
            .message = std::move(msg),
            .code = std::nullopt,
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

}  // namespace lifter
