#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace lifter::common {

// Exception type for internal errors (compiler bugs and broken invariants of
// upstream collaborators, not user errors).
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            fmt::format(
                "Internal error in {}: {}\n"
                "This is a bug in lifter or in the component that produced "
                "its input.",
                context, detail)) {
  }
};

}  // namespace lifter::common
