#include "dnl/transfer.hpp"
#include "checksum.hpp"
#include "chunkdl.hpp"
#include "dnl/requests.hpp"
#include "logger.hpp"
#include "progress.hpp"
#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <fmt/format.h>
#include <fstream>
#include <ios>
#include <iostream>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chunkdl::dnl {

std::size_t compute_chunk_size(std::optional<std::uint64_t> total_bytes,
                               std::optional<std::size_t>   chunk_size_override) {
  if (chunk_size_override) {
    return std::max(*chunk_size_override, minimum_chunk_size);
  }
  if (total_bytes) {
    // rounded
    const std::uint64_t chunks     = maximum_chunks_number;
    auto                chunk_size = static_cast<std::size_t>((*total_bytes + chunks / 2) / chunks);
    return std::max(chunk_size, minimum_chunk_size);
  }
  return minimum_chunk_size;
}

transfer_result download_chunks(response_stream& stream, std::vector<checksum>& checksums,
                                const write_fn_t& write_fn, const chunk_loop_options& options,
                                const logger& log) {
  transfer_result result;

  const auto total_bytes = stream.content_length();
  const auto chunk_size  = compute_chunk_size(total_bytes, options.chunk_size_override);
  if (total_bytes) {
    log.debug("Expecting {} bytes, reading chunks of up to {} bytes", *total_bytes, chunk_size);
  } else {
    log.debug("Unknown content length, reading chunks of up to {} bytes", chunk_size);
  }

  std::vector<char> chunk(chunk_size);
  const auto        start_time = clk::now();

  for (std::size_t len = 0; (len = stream.read(chunk.data(), chunk.size())) != 0;) {
    const std::string_view data{chunk.data(), len};

    for (auto& single_checksum: checksums) {
      single_checksum.update(data);
    }

    if (write_fn) {
      write_fn(data);
    } else {
      result.content.append(data);
    }

    result.received_bytes += len;
    if (options.show_progress) {
      display_progress(*options.progress_os,
                       make_progress_snapshot(result.received_bytes, total_bytes,
                                              seconds_since(start_time)));
    }
  }

  const double elapsed = seconds_since(start_time);
  if (options.show_progress) {
    *options.progress_os << '\n';
    options.progress_os->flush();
  }

  const auto rate = elapsed > 0.0
                        ? static_cast<std::uint64_t>(static_cast<double>(result.received_bytes) /
                                                     elapsed)
                        : result.received_bytes;
  log.debug("Received {} bytes in {} (~ {} bytes/sec)", result.received_bytes,
            format_duration(elapsed), rate);

  for (const auto& single_checksum: checksums) {
    result.checksums.emplace_back(single_checksum.name(), single_checksum.hexdigest());
  }
  return result;
}

std::unique_ptr<response_stream> get_http_response(const std::string& url,
                                                   const header_map& additional_headers,
                                                   const logger&     log) {
  log.debug("Request sent, waiting for response from '{}' ...", parse_url(url).host);
  const auto start_time = clk::now();
  auto       response   = std::make_unique<http_stream>(url, additional_headers);
  log.debug("Received response after {}", format_duration(seconds_since(start_time)));
  log.debug("Downloading '{}' ...", url);
  return response;
}

std::string_view state_name(transfer_state state) {
  switch (state) {
  case transfer_state::idle:
    return "idle";
  case transfer_state::request_sent:
    return "request sent";
  case transfer_state::streaming:
    return "streaming";
  case transfer_state::finalized:
    return "finalized";
  case transfer_state::failed:
    return "failed";
  }
  return "unknown";
}

// transfer_session

transfer_session::transfer_session(std::string url, transfer_options options, const logger& log)
    : url_(std::move(url)), options_(std::move(options)), log_(log) {}

void transfer_session::set_state(transfer_state state) {
  log_.debug("transfer state: {} -> {}", state_name(state_), state_name(state));
  state_ = state;
}

transfer_result transfer_session::run(const stream_opener_t& open, std::ostream& progress_os) {
  if (state_ != transfer_state::idle) {
    throw std::logic_error("transfer_session::run() called twice");
  }

  try {
    auto checksums = make_checksums(options_.checksum_algorithms, log_);

    set_state(transfer_state::request_sent);
    const auto stream = open(url_, options_.extra_headers);

    auto result = stream_to(*stream, checksums, progress_os);
    set_state(transfer_state::finalized);
    return result;
  } catch (const std::exception& e) {
    set_state(transfer_state::failed);
    log_.debug("transfer of '{}' failed: {}", url_, e.what());
    throw;
  }
}

transfer_result transfer_session::stream_to(response_stream&        stream,
                                            std::vector<checksum>& checksums,
                                            std::ostream&          progress_os) {
  chunk_loop_options loop_options{options_.chunk_size_override, options_.show_progress,
                                  &progress_os};

  switch (options_.dest.type) {
  case destination::kind::memory: {
    set_state(transfer_state::streaming);
    return download_chunks(stream, checksums, {}, loop_options, log_);
  }

  case destination::kind::stdout_stream: {
    // the body owns stdout, keep the display clean
    loop_options.show_progress = false;
    set_state(transfer_state::streaming);
    auto result = download_chunks(
        stream, checksums,
        [](std::string_view chunk) {
          std::cout.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
          if (!std::cout) {
            throw std::runtime_error("Error writing to stdout");
          }
        },
        loop_options, log_);
    std::cout.flush();
    return result;
  }

  case destination::kind::file: {
    const auto& path = options_.dest.path;

    auto output_file = std::ofstream(path, std::ios_base::binary);
    if (!output_file) {
      throw std::runtime_error(fmt::format("Error opening '{}' for writing. Because: \"{}\".",
                                           path.string(),
                                           std::strerror(errno))); // NOLINT errno
    }

    set_state(transfer_state::streaming);
    auto result = download_chunks(
        stream, checksums,
        [&](std::string_view chunk) {
          output_file.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
          if (!output_file) {
            throw std::runtime_error(fmt::format("Error writing to '{}'", path.string()));
          }
        },
        loop_options, log_);

    output_file.close();
    if (!output_file) {
      throw std::runtime_error(fmt::format("Error closing '{}'", path.string()));
    }
    log_.info("Saved {} bytes to '{}'", result.received_bytes, path.string());
    return result;
  }
  }
  throw std::logic_error("unknown destination kind");
}

// convenience entry points

transfer_result transfer(const std::string& url, const transfer_options& options,
                         const logger& log) {
  transfer_session session(url, options, log);
  return session.run([&](const std::string& session_url, const header_map& headers) {
    return get_http_response(session_url, headers, log);
  });
}

transfer_result get_content(const std::string& url, transfer_options options, const logger& log) {
  options.dest = destination::to_memory();
  return transfer(url, options, log);
}

transfer_result display_directly(const std::string& url, transfer_options options,
                                 const logger& log) {
  options.dest          = destination::to_stdout();
  options.show_progress = false;
  return transfer(url, options, log);
}

transfer_result save_to_file(const std::string& url, transfer_options options, const logger& log) {
  if (options.dest.type != destination::kind::file || options.dest.path.empty()) {
    return display_directly(url, std::move(options), log);
  }
  return transfer(url, options, log);
}

} // namespace chunkdl::dnl
