#pragma once

#include "chunkdl.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <curl/curl.h>
#include <event2/util.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

struct event;
struct event_base;

namespace chunkdl::dnl {

// process wide curl and libevent init/cleanup. One instance, constructed at program start
class curl_global {
public:
  curl_global();
  curl_global(const curl_global&)            = delete;
  curl_global& operator=(const curl_global&) = delete;
  ~curl_global();
};

// "unknown" rather than an exception for missing, negative or malformed values
std::optional<std::uint64_t> parse_content_length(std::string_view value);

struct url_parts {
  std::string scheme;
  std::string host; // with ":port" when one was given
  std::string path;
};

// uses curl's URL parser. Throws std::runtime_error for unparseable urls
url_parts parse_url(const std::string& url);

// A blocking, pull style reader over a response body
class response_stream {
public:
  response_stream()                                  = default;
  response_stream(const response_stream&)            = delete;
  response_stream& operator=(const response_stream&) = delete;
  virtual ~response_stream()                         = default;

  [[nodiscard]] virtual std::optional<std::uint64_t> content_length() const = 0;

  // reads up to max_bytes. returns 0 only at end of stream. throws on transfer failure
  virtual std::size_t read(char* dest, std::size_t max_bytes) = 0;
};

/* chunkdl::dnl::http_stream
 *
 * Issues a GET in the constructor and returns once the response headers have
 * arrived (or the transfer failed). The body is then pulled with read().
 *
 * Internally a curl multi handle is driven by a private libevent event_base,
 * which is only run from within the constructor and read(). When more than
 * one chunk is buffered the transfer is paused, so memory stays around one
 * chunk whatever the speed of the server.
 */
class http_stream : public response_stream {
public:
  http_stream(const std::string& url, const header_map& extra_headers);
  ~http_stream() override;

  [[nodiscard]] std::optional<std::uint64_t> content_length() const override;
  std::size_t read(char* dest, std::size_t max_bytes) override;

  [[nodiscard]] long status_code() const { return status_code_; }
  [[nodiscard]] const std::unordered_map<std::string, std::string>& headers() const {
    return headers_;
  }

private:
  // connects an event with a socketfd
  struct socket_context {
    ::event*      ev = nullptr;
    curl_socket_t sockfd{};
    http_stream*  owner = nullptr;
  };

  struct socket_context_deleter {
    void operator()(socket_context* context) const noexcept;
  };

  using socket_context_ptr = std::unique_ptr<socket_context, socket_context_deleter>;

  // curl C-API callbacks
  static std::size_t write_data_curl_cb(char* ptr, std::size_t size, std::size_t nmemb,
                                        void* userdata);
  static std::size_t header_curl_cb(char* buffer, std::size_t size, std::size_t nitems,
                                    void* userdata);
  static int start_timeout_curl_cb(CURLM* multi, long timeout_ms, void* userp);
  static int handle_socket_curl_cb(CURL* easy, curl_socket_t s, int action, void* userp,
                                   void* socketp);

  // libevent callbacks
  static void curl_perform_event_cb(evutil_socket_t fd, short event, void* arg);
  static void timeout_event_cb(evutil_socket_t fd, short events, void* arg);

  void append_request_header(const std::string& header);
  void run_once();
  void process_curl_messages();
  void throw_if_failed() const;
  void cleanup() noexcept;

  std::string url_;

  CURL*         easy_         = nullptr;
  CURLM*        multi_        = nullptr;
  curl_slist*   headers_list_ = nullptr;
  ::event_base* ebase_        = nullptr;
  ::event*      timeout_      = nullptr;

  std::unordered_map<curl_socket_t, socket_context_ptr> sockets_;

  std::vector<char>                 buffer_;
  std::size_t                       read_ahead_   = minimum_chunk_size;
  std::uint64_t                     body_bytes_   = 0; // accepted from curl so far
  bool                              paused_       = false;
  bool                              body_started_ = false;
  bool                              done_         = false;
  CURLcode                          result_       = CURLE_OK;
  long                              status_code_  = 0;
  std::array<char, CURL_ERROR_SIZE> error_buffer_{};

  std::unordered_map<std::string, std::string> headers_; // of the final response, lowercase names
};

} // namespace chunkdl::dnl
