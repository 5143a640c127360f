#pragma once

#include "checksum.hpp"
#include "chunkdl.hpp"
#include "dnl/requests.hpp"
#include "logger.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace chunkdl::dnl {

// prefer use of std::function (ie stdlib type erasure) rather than templates to keep .hpp interface
// clean
using write_fn_t = std::function<void(std::string_view)>;

using stream_opener_t =
    std::function<std::unique_ptr<response_stream>(const std::string& url, const header_map&)>;

// override if given, else total / maximum_chunks_number if total is known, never less than
// minimum_chunk_size
std::size_t compute_chunk_size(std::optional<std::uint64_t> total_bytes,
                               std::optional<std::size_t>   chunk_size_override = std::nullopt);

struct chunk_loop_options {
  std::optional<std::size_t> chunk_size_override;
  bool                       show_progress = false;
  std::ostream*              progress_os   = &std::cerr; // NOLINT non-owning
};

// Read the stream chunk by chunk until exhausted. Every chunk goes, in order, to all checksums
// and then to write_fn, or into result.content if write_fn is empty.
transfer_result download_chunks(response_stream& stream, std::vector<checksum>& checksums,
                                const write_fn_t& write_fn, const chunk_loop_options& options,
                                const logger& log);

// sends the GET and waits for the response headers, logging timings
std::unique_ptr<response_stream> get_http_response(const std::string& url,
                                                   const header_map& additional_headers,
                                                   const logger&     log);

enum class transfer_state { idle, request_sent, streaming, finalized, failed };

std::string_view state_name(transfer_state state);

/* chunkdl::dnl::transfer_session
 *
 * One download invocation: resolves the checksums, opens the response and the
 * destination, runs the chunk loop and tears everything down again on every
 * exit path. Not reusable: run() may only be called once.
 */
class transfer_session {
public:
  transfer_session(std::string url, transfer_options options, const logger& log);

  transfer_result run(const stream_opener_t& open, std::ostream& progress_os = std::cerr);

  [[nodiscard]] transfer_state state() const { return state_; }

private:
  void set_state(transfer_state state);

  transfer_result stream_to(response_stream& stream, std::vector<checksum>& checksums,
                            std::ostream& progress_os);

  std::string      url_;
  transfer_options options_;
  const logger&    log_; // NOLINT reference
  transfer_state   state_ = transfer_state::idle;
};

// the complete pipeline with the real http stream
transfer_result transfer(const std::string& url, const transfer_options& options,
                         const logger& log);

// download into memory, result.content holds the body
transfer_result get_content(const std::string& url, transfer_options options, const logger& log);

// stream straight to stdout, never with progress
transfer_result display_directly(const std::string& url, transfer_options options,
                                 const logger& log);

// save to options.dest.path, or straight to stdout when there is no file destination
transfer_result save_to_file(const std::string& url, transfer_options options, const logger& log);

} // namespace chunkdl::dnl
