#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chunkdl {

constexpr const char* version = "0.5.2";

// upper bound on the number of chunks (and so progress updates) for large bodies
constexpr std::size_t maximum_chunks_number = 10'000;
constexpr std::size_t minimum_chunk_size    = 1U << 16U; // 64kB

constexpr const char* directory_index = "index.html";

using header_map = std::map<std::string, std::string>;

// where the body goes
struct destination {
  enum class kind { memory, file, stdout_stream };

  static destination to_memory() { return {}; }
  static destination to_stdout() { return {kind::stdout_stream, {}}; }
  static destination to_file(std::filesystem::path path) { return {kind::file, std::move(path)}; }

  kind                  type = kind::memory;
  std::filesystem::path path;
};

struct transfer_options {
  header_map                 extra_headers;
  std::vector<std::string>   checksum_algorithms;
  bool                       show_progress = false;
  destination                dest;
  std::optional<std::size_t> chunk_size_override;
};

struct transfer_result {
  // {"SHA256", lowercase hexdigest}, in the order the algorithms were requested
  std::vector<std::pair<std::string, std::string>> checksums;
  std::uint64_t                                    received_bytes = 0;
  std::string                                      content; // only for destination::kind::memory
  int                                              returncode = EXIT_SUCCESS;
};

} // namespace chunkdl
