#include "chunkdl.hpp"
#include "dnl/cli.hpp"
#include "dnl/requests.hpp"
#include "dnl/transfer.hpp"
#include "logger.hpp"
#include <CLI/CLI.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
  chunkdl::dnl::cli_config_t cli;

  CLI::App app{"Fetch a URL in chunks, display a progress bar and calculate checksums."};
  chunkdl::dnl::define_options(app, cli);
  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    // --help and --version exit 0, all argument errors exit 1
    return app.exit(e) == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
  }

  chunkdl::logger log(std::cerr,
                      cli.verbose ? chunkdl::log_level::debug : chunkdl::log_level::info);

  int returncode = EXIT_SUCCESS;
  try {
    const chunkdl::dnl::curl_global curl_and_events;

    auto options = chunkdl::dnl::make_transfer_options(cli);
    auto result  = chunkdl::dnl::save_to_file(cli.url, options, log);

    for (const auto& [checksum_type, hexdigest]: result.checksums) {
      log.info("{} checksum: {}", checksum_type, hexdigest);
    }
    returncode = result.returncode;
  } catch (const std::exception& e) {
    log.error("{}", e.what());
    returncode = EXIT_FAILURE;
  }

  log.debug("Script finished. Returncode: {}", returncode);
  return returncode;
}
