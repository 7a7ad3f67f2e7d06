#pragma once

#include <cstddef>
#include <vector>

#include "lifter/common/diagnostic/diagnostic.hpp"

namespace lifter {

// Collects diagnostics during analysis. Not thread-safe.
// Diagnostics are stored in order of reporting; callers may rely on this.
class DiagnosticSink {
 public:
  void Report(Diagnostic diag) {
    if (diag.primary.kind == DiagKind::kError ||
        diag.primary.kind == DiagKind::kFatal ||
        diag.primary.kind == DiagKind::kHostError) {
      has_errors_ = true;
    }
    diagnostics_.push_back(std::move(diag));
  }

  void Error(SourceSpan loc, DiagCode code, std::string msg) {
    Report(Diagnostic::Error(loc, code, std::move(msg)));
  }

  void Warning(SourceSpan loc, std::string msg) {
    Report(Diagnostic::Warning(loc, std::move(msg)));
  }

  [[nodiscard]] auto HasErrors() const -> bool {
    return has_errors_;
  }

  // Number of diagnostics carrying the given code.
  [[nodiscard]] auto CountCode(DiagCode code) const -> size_t {
    size_t count = 0;
    for (const auto& diag : diagnostics_) {
      if (diag.primary.code == code) {
        ++count;
      }
    }
    return count;
  }

  [[nodiscard]] auto GetDiagnostics() const -> const std::vector<Diagnostic>& {
    return diagnostics_;
  }

  void Clear() {
    diagnostics_.clear();
    has_errors_ = false;
  }

 private:
  std::vector<Diagnostic> diagnostics_;
  bool has_errors_ = false;
};

}  // namespace lifter
