#include "dnl/cli.hpp"
#include "chunkdl.hpp"
#include "dnl/auth.hpp"
#include "dnl/destination.hpp"
#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <istream>
#include <ostream>

namespace chunkdl::dnl {

void define_options(CLI::App& app, cli_config_t& cli) {

  app.add_option("url", cli.url, "The URL to fetch")->required();

  app.add_option("-c,--checksum,--calculate-checksum", cli.checksums,
                 "Calculate the given checksum type, e.g. MD5 or SHA1 (may be specified multiple "
                 "times to calculate different digest types at the same time).")
      ->allow_extra_args(false);

  app.add_option("-o,--output", cli.output_path,
                 "Output to OUTPUT_PATH. A directory, a file name or `-` for stdout.");

  app.add_flag("-p,--progress,--show-progress,--show_progress", cli.progress,
               "Show progress while downloading. Not with `--output -`.");

  app.add_option("-u,--user,--http-user", cli.http_user,
                 "Authenticate as HTTP_USER. You will be asked for the password.");

  app.add_option("--chunk-size", cli.chunk_size,
                 fmt::format("Read the body in chunks of this many bytes (minimum {})",
                             minimum_chunk_size));

  app.add_flag("-v,--verbose", cli.verbose, "Print debugging messages.");

  app.set_version_flag("--version", version);
}

transfer_options make_transfer_options(const cli_config_t& cli, std::istream& is,
                                       std::ostream& os) {
  transfer_options options;
  options.checksum_algorithms = cli.checksums;
  options.show_progress       = cli.progress;
  options.chunk_size_override = cli.chunk_size;

  // `-` writes the file contents to stdout
  if (cli.output_path && *cli.output_path == "-") {
    options.dest = destination::to_stdout();
  } else {
    options.dest = destination::to_file(determine_output_file_path(cli.output_path, cli.url));
  }

  if (cli.http_user) {
    options.extra_headers = make_basic_auth(*cli.http_user, is, os);
  }
  return options;
}

} // namespace chunkdl::dnl
