#pragma once

#include "chunkdl.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace chunkdl::dnl {

// last segment of the url's path, or default_file_name when the path ends in '/'
std::string file_name_from_url(const std::string& url,
                               const std::string& default_file_name = directory_index);

// Determine output directory and file name from the --output parameter.
//
// If no directory can be determined from it, use the current working directory.
// If no file name can be determined from it, derive the file name from the url.
std::filesystem::path
determine_output_file_path(const std::optional<std::string>& output_path, const std::string& url,
                           const std::string& default_file_name = directory_index);

} // namespace chunkdl::dnl
