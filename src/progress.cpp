#include "progress.hpp"
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <fmt/format.h>
#include <optional>
#include <ostream>
#include <string>

namespace chunkdl {

double seconds_since(clk::time_point start) {
  return std::chrono::duration_cast<std::chrono::duration<double>>(clk::now() - start).count();
}

std::string format_duration(double total_seconds) {
  if (total_seconds < 0.0) total_seconds = 0.0;

  const double total_minutes = std::floor(total_seconds / 60.0);
  const double seconds       = total_seconds - total_minutes * 60.0;

  std::string result = fmt::format("{:3.1f}s", seconds);
  if (total_minutes >= 1.0) {
    auto minutes_count = static_cast<std::uint64_t>(total_minutes);
    auto hours         = minutes_count / 60;
    auto minutes       = minutes_count % 60;
    result             = fmt::format("{}m {}", minutes, result);
    if (hours != 0) {
      result = fmt::format("{}h {}", hours, result);
    }
  }
  return result;
}

progress_snapshot make_progress_snapshot(std::uint64_t                received_bytes,
                                         std::optional<std::uint64_t> total_bytes,
                                         double                       elapsed_seconds) {
  progress_snapshot snap;
  snap.elapsed_seconds = elapsed_seconds;
  snap.received_bytes  = received_bytes;
  snap.total_bytes     = total_bytes;

  // a zero total gives no useful ratio: show the unbounded form
  if (total_bytes && *total_bytes != 0) {
    double ratio = static_cast<double>(received_bytes) / static_cast<double>(*total_bytes);
    if (ratio > 1.0) ratio = 1.0;
    snap.ratio = ratio;
    if (ratio > 0.0) {
      snap.estimated_seconds_remaining = elapsed_seconds * (1.0 - ratio) / ratio;
    }
  }
  return snap;
}

std::string format_progress(const progress_snapshot& snapshot, std::size_t bar_width) {
  if (!snapshot.bounded()) {
    return fmt::format("PROGRESS | {} bytes received, elapsed time: {}\r", snapshot.received_bytes,
                       format_duration(snapshot.elapsed_seconds));
  }

  const double ratio = *snapshot.ratio;
  auto         complete =
      static_cast<std::size_t>(std::lround(ratio * static_cast<double>(bar_width)));
  if (complete > bar_width) complete = bar_width;

  const std::string eta = snapshot.estimated_seconds_remaining
                              ? format_duration(*snapshot.estimated_seconds_remaining)
                              : "--";

  return fmt::format("PROGRESS | {}{} | {:5.1f}% | ET: {} | ETA: {}       \r",
                     std::string(complete, '#'), std::string(bar_width - complete, '-'),
                     100.0 * ratio, format_duration(snapshot.elapsed_seconds), eta);
}

void display_progress(std::ostream& os, const progress_snapshot& snapshot) {
  os << format_progress(snapshot);
  os.flush();
}

} // namespace chunkdl
