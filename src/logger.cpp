#include "logger.hpp"
#include <fmt/format.h>
#include <ostream>
#include <string>
#include <string_view>

namespace chunkdl {

std::string_view level_name(log_level level) {
  switch (level) {
  case log_level::debug:
    return "DEBUG";
  case log_level::info:
    return "INFO";
  case log_level::warning:
    return "WARNING";
  case log_level::error:
    return "ERROR";
  }
  return "UNKNOWN";
}

std::string format_log_line(std::string_view label, std::string_view msg) {
  return fmt::format("{:<8} | {}", label, msg);
}

void logger::log(log_level level, std::string_view msg) const {
  if (!enabled(level)) return;
  *os_ << format_log_line(level_name(level), msg) << '\n';
  os_->flush();
}

} // namespace chunkdl
