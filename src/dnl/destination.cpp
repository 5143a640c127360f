#include "dnl/destination.hpp"
#include "dnl/requests.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

namespace chunkdl::dnl {

namespace fs = std::filesystem;

std::string file_name_from_url(const std::string& url, const std::string& default_file_name) {
  const auto path = parse_url(url).path;
  if (path.empty() || path.ends_with('/')) {
    return default_file_name;
  }
  return path.substr(path.find_last_of('/') + 1);
}

fs::path determine_output_file_path(const std::optional<std::string>& output_path,
                                    const std::string& url, const std::string& default_file_name) {
  fs::path output_directory;
  fs::path output_file_name;

  if (output_path) {
    std::error_code ec;
    if (fs::is_directory(*output_path, ec)) {
      output_directory = *output_path;
    } else {
      const fs::path given{*output_path};
      output_directory = given.parent_path();
      output_file_name = given.filename();
    }
  }

  if (output_directory.empty()) {
    output_directory = fs::current_path();
  }
  if (output_file_name.empty()) {
    output_file_name = file_name_from_url(url, default_file_name);
  }
  return output_directory / output_file_name;
}

} // namespace chunkdl::dnl
