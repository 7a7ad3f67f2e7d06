#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "lifter/common/diagnostic/diagnostic.hpp"
#include "lifter/common/source_manager.hpp"
#include "lifter/ir/unit.hpp"

namespace lifter::frontend {

// Builds a compilation unit (resolved types, lifecycle operator
// declarations, procedure bodies) from its YAML description. Every node's
// position becomes the span of what it produces. Malformed input is a host
// error; nothing of the unit is returned then.
auto LoadUnit(std::string_view text, FileId file, std::string unit_name)
    -> Result<ir::CompilationUnit>;

// Reads `path` into `sources` and loads it. The unit is named after the
// file stem unless the document names it.
auto LoadUnitFile(const std::filesystem::path& path, SourceManager& sources)
    -> Result<ir::CompilationUnit>;

}  // namespace lifter::frontend
