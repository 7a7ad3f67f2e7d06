#pragma once

#include <cstdint>
#include <string>

#include "lifter/common/source_manager.hpp"

namespace lifter {

struct SourceSpan {
  FileId file_id;
  uint32_t begin = 0;
  uint32_t end = 0;

  auto operator==(const SourceSpan&) const -> bool = default;
};

// Compute the 1-based line and column of span.begin.
// Returns {1, 1} if the file is unknown.
auto ComputeLineColumn(const SourceSpan& span, const SourceManager& mgr)
    -> LineColumn;

// Format a SourceSpan as "file:line:col" using the SourceManager.
// Returns empty string if the span or file is invalid.
auto FormatSourceLocation(const SourceSpan& span, const SourceManager& mgr)
    -> std::string;

}  // namespace lifter
