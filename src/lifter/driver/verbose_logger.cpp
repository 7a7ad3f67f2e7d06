#include "verbose_logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

#include <fmt/core.h>

namespace lifter::driver {

namespace {

// Format current time as HH:MM:SS
auto FormatTime() -> std::string {
  auto now = std::chrono::system_clock::now();
  auto time_t_now = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf{};
  localtime_r(&time_t_now, &tm_buf);
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%H:%M:%S");
  return oss.str();
}

}  // namespace

void VerboseLogger::PhaseBegin(std::string_view phase_name) {
  if (!Enabled(1)) return;
  fmt::print(
      sink_, "[lifter][{}][phase] {}: begin\n", FormatTime(), phase_name);
  std::fflush(sink_);
}

void VerboseLogger::PhaseDone(std::string_view phase_name, double seconds) {
  if (!Enabled(1)) return;
  fmt::print(
      sink_, "[lifter][{}][phase] {}: done ({:.2f}s)\n", FormatTime(),
      phase_name, seconds);
  std::fflush(sink_);
}

PhaseTimer::PhaseTimer(VerboseLogger& logger, std::string phase_name)
    : logger_(logger),
      phase_name_(std::move(phase_name)),
      start_(std::chrono::steady_clock::now()),
      enabled_(logger.Enabled(1)) {
  if (enabled_) {
    logger_.PhaseBegin(phase_name_);
  }
}

PhaseTimer::~PhaseTimer() {
  auto end = std::chrono::steady_clock::now();
  auto duration =
      std::chrono::duration_cast<std::chrono::milliseconds>(end - start_);
  double seconds = duration.count() / 1000.0;

  // ALWAYS record duration (for --stats), regardless of verbosity
  logger_.RecordPhaseDuration(phase_name_, seconds);

  if (enabled_) {
    logger_.PhaseDone(phase_name_, seconds);
  }
}

void VerboseLogger::RecordPhaseDuration(std::string_view name, double seconds) {
  phase_durations_[std::string(name)] += seconds;
}

void VerboseLogger::PrintPhaseSummary(FILE* sink) const {
  std::string line = "[lifter][stats][phase]";
  for (std::string_view phase : kPhaseOrder) {
    auto it = phase_durations_.find(std::string(phase));
    if (it != phase_durations_.end()) {
      line += fmt::format(" {}={:.2f}s", phase, it->second);
    }
  }
  fmt::print(sink, "{}\n", line);
  std::fflush(sink);
}

}  // namespace lifter::driver
