#pragma once

#include <fmt/format.h>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace chunkdl {

enum class log_level { debug, info, warning, error };

std::string_view level_name(log_level level);

// "LEVEL    | message" with the label padded to 8 columns
std::string format_log_line(std::string_view label, std::string_view msg);

// simple logging. constructed once in main() and handed down by reference

class logger {
public:
  explicit logger(std::ostream& os = std::cerr, log_level min_level = log_level::info)
      : os_(&os), min_level_(min_level) {}

  void log(log_level level, std::string_view msg) const;

  template <typename... Args>
  void debug(fmt::format_string<Args...> fmtstr, Args&&... args) const {
    if (enabled(log_level::debug))
      log(log_level::debug, fmt::format(fmtstr, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void info(fmt::format_string<Args...> fmtstr, Args&&... args) const {
    if (enabled(log_level::info))
      log(log_level::info, fmt::format(fmtstr, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void warning(fmt::format_string<Args...> fmtstr, Args&&... args) const {
    if (enabled(log_level::warning))
      log(log_level::warning, fmt::format(fmtstr, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void error(fmt::format_string<Args...> fmtstr, Args&&... args) const {
    if (enabled(log_level::error))
      log(log_level::error, fmt::format(fmtstr, std::forward<Args>(args)...));
  }

  [[nodiscard]] bool enabled(log_level level) const { return level >= min_level_; }

  void set_level(log_level level) { min_level_ = level; }

  [[nodiscard]] std::ostream& stream() const { return *os_; }

private:
  std::ostream* os_; // NOLINT non-owning
  log_level     min_level_;
};

} // namespace chunkdl
