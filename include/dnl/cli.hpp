#pragma once

#include "chunkdl.hpp"
#include <CLI/CLI.hpp>
#include <cstddef>
#include <iostream>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace chunkdl::dnl {

struct cli_config_t {
  std::string                url;
  std::vector<std::string>   checksums;
  std::optional<std::string> output_path;
  std::optional<std::string> http_user;
  std::optional<std::size_t> chunk_size;
  bool                       progress = false;
  bool                       verbose  = false;
};

void define_options(CLI::App& app, cli_config_t& cli);

// `-o -` is stdout, anything else (or nothing) resolves to a file path. With an http_user the
// password is asked for on `os` and read from `is`.
transfer_options make_transfer_options(const cli_config_t& cli, std::istream& is = std::cin,
                                       std::ostream& os = std::cerr);

} // namespace chunkdl::dnl
