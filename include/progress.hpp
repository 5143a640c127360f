#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace chunkdl {

using clk = std::chrono::steady_clock;

double seconds_since(clk::time_point start);

// "[[<hours>h ]<minutes>m ]<seconds>s", seconds with one decimal
std::string format_duration(double total_seconds);

struct progress_snapshot {
  double                       elapsed_seconds = 0.0;
  std::uint64_t                received_bytes  = 0;
  std::optional<std::uint64_t> total_bytes;

  // only when total_bytes is known and non-zero. ratio is clamped to 1.0, servers do lie.
  std::optional<double> ratio;
  std::optional<double> estimated_seconds_remaining;

  [[nodiscard]] bool bounded() const { return ratio.has_value(); }
};

progress_snapshot make_progress_snapshot(std::uint64_t                received_bytes,
                                         std::optional<std::uint64_t> total_bytes,
                                         double                       elapsed_seconds);

constexpr std::size_t default_bar_width = 20;

// one progress line, ending in '\r' so the next one overwrites it
std::string format_progress(const progress_snapshot& snapshot,
                            std::size_t              bar_width = default_bar_width);

void display_progress(std::ostream& os, const progress_snapshot& snapshot);

} // namespace chunkdl
