#include "lifter/common/source_span.hpp"

#include <cstdint>
#include <string>

#include <fmt/core.h>

namespace lifter {

auto ComputeLineColumn(const SourceSpan& span, const SourceManager& mgr)
    -> LineColumn {
  LineColumn pos;
  const FileInfo* file = mgr.GetFile(span.file_id);
  if (file == nullptr) {
    return pos;
  }

  const std::string& content = file->content;
  for (uint32_t i = 0; i < span.begin && i < content.size(); ++i) {
    if (content[i] == '\n') {
      ++pos.line;
      pos.column = 1;
    } else {
      ++pos.column;
    }
  }
  return pos;
}

auto FormatSourceLocation(const SourceSpan& span, const SourceManager& mgr)
    -> std::string {
  if (!span.file_id) {
    return "";
  }

  const FileInfo* file = mgr.GetFile(span.file_id);
  if (file == nullptr) {
    return "";
  }

  LineColumn pos = ComputeLineColumn(span, mgr);
  return fmt::format("{}:{}:{}", file->path, pos.line, pos.column);
}

}  // namespace lifter
