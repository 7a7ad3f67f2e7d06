#pragma once

#include <string>

#include "lifter/common/diagnostic/diagnostic_sink.hpp"
#include "lifter/common/source_manager.hpp"

namespace lifter::driver {

void PrintError(const std::string& message);

// Prints every diagnostic with its notes, followed by an
// "N errors generated." summary. `source_manager` may be null.
void PrintDiagnostics(
    const DiagnosticSink& sink, const SourceManager* source_manager);

}  // namespace lifter::driver
