#include "dnl/requests.hpp"
#include "chunkdl.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <curl/curl.h>
#include <event2/event.h>
#include <fmt/format.h>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace chunkdl::dnl {

namespace {

std::string_view trim(std::string_view str) {
  const auto* ws    = " \t\r\n";
  const auto  first = str.find_first_not_of(ws);
  if (first == std::string_view::npos) return {};
  const auto last = str.find_last_not_of(ws);
  return str.substr(first, last - first + 1);
}

std::string to_lower(std::string_view str) {
  std::string lower(str);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower;
}

} // namespace

curl_global::curl_global() {
  if (curl_global_init(CURL_GLOBAL_ALL) != 0) {
    throw std::runtime_error("Error: Could not init curl");
  }
}

curl_global::~curl_global() {
  libevent_global_shutdown();
  curl_global_cleanup();
}

std::optional<std::uint64_t> parse_content_length(std::string_view value) {
  value = trim(value);
  if (value.empty()) return std::nullopt;

  std::uint64_t length{};
  const auto* end = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(value.data(), end, length);
  if (ec != std::errc{} || ptr != end) return std::nullopt;
  return length;
}

url_parts parse_url(const std::string& url) {
  const std::unique_ptr<CURLU, decltype(&curl_url_cleanup)> handle(curl_url(), &curl_url_cleanup);
  if (!handle) {
    throw std::runtime_error("parse_url: curl_url() failed");
  }
  if (auto rc = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0); rc != CURLUE_OK) {
    throw std::runtime_error(fmt::format("Invalid url '{}': {}", url, curl_url_strerror(rc)));
  }

  auto get_part = [&](CURLUPart which) -> std::optional<std::string> {
    char* part = nullptr;
    if (curl_url_get(handle.get(), which, &part, 0) != CURLUE_OK) return std::nullopt;
    std::string result{part};
    curl_free(part);
    return result;
  };

  url_parts parts;
  parts.scheme = get_part(CURLUPART_SCHEME).value_or("");
  parts.host   = get_part(CURLUPART_HOST).value_or("");
  if (auto port = get_part(CURLUPART_PORT)) {
    parts.host += ":" + *port;
  }
  parts.path = get_part(CURLUPART_PATH).value_or("/");
  return parts;
}

// http_stream

http_stream::http_stream(const std::string& url, const header_map& extra_headers) : url_(url) {
  try {
    ebase_   = event_base_new();
    timeout_ = evtimer_new(ebase_, timeout_event_cb, this);
    multi_   = curl_multi_init();
    easy_    = curl_easy_init();
    if (ebase_ == nullptr || timeout_ == nullptr || multi_ == nullptr || easy_ == nullptr) {
      throw std::runtime_error("http_stream: could not init curl and event handles");
    }

    curl_multi_setopt(multi_, CURLMOPT_SOCKETFUNCTION, handle_socket_curl_cb);
    curl_multi_setopt(multi_, CURLMOPT_SOCKETDATA, this);
    curl_multi_setopt(multi_, CURLMOPT_TIMERFUNCTION, start_timeout_curl_cb);
    curl_multi_setopt(multi_, CURLMOPT_TIMERDATA, this);

    // the body is read until the server closes, see CURLOPT_IGNORE_CONTENT_LENGTH
    append_request_header("Connection: close");
    for (const auto& [name, value]: extra_headers) {
      append_request_header(fmt::format("{}: {}", name, value));
    }

    const auto user_agent = fmt::format("chunkdl/{}", version);

    curl_easy_setopt(easy_, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(easy_, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(easy_, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(easy_, CURLOPT_FOLLOWLOCATION, 1L);
    // a malformed Content-Length must not fail the transfer. The header callback still
    // records it, and a body shorter than a valid length is caught in process_curl_messages
    curl_easy_setopt(easy_, CURLOPT_IGNORE_CONTENT_LENGTH, 1L);
    curl_easy_setopt(easy_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(easy_, CURLOPT_USERAGENT, user_agent.c_str()); // copied by curl
    curl_easy_setopt(easy_, CURLOPT_HTTPHEADER, headers_list_);
    curl_easy_setopt(easy_, CURLOPT_ERRORBUFFER, error_buffer_.data());
    curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, write_data_curl_cb);
    curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);
    curl_easy_setopt(easy_, CURLOPT_HEADERFUNCTION, header_curl_cb);
    curl_easy_setopt(easy_, CURLOPT_HEADERDATA, this);
    curl_easy_setopt(easy_, CURLOPT_CONNECTTIMEOUT, 30L);
    // abort if stalled below 1 byte/sec for a minute
    curl_easy_setopt(easy_, CURLOPT_LOW_SPEED_TIME, 60L);
    curl_easy_setopt(easy_, CURLOPT_LOW_SPEED_LIMIT, 1L);

    if (auto res = curl_multi_add_handle(multi_, easy_); res != CURLM_OK) {
      throw std::runtime_error(
          fmt::format("curl_multi_add_handle: '{}'", curl_multi_strerror(res)));
    }

    // run until the final response's headers are complete, which is when curl
    // first hands us body data, or the transfer has finished
    while (!body_started_ && !done_) {
      run_once();
    }
    throw_if_failed();

    if (auto res = curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &status_code_);
        res != CURLE_OK) {
      throw std::runtime_error(
          fmt::format("curl_easy_getinfo: '{}'", curl_easy_strerror(res)));
    }
    if (status_code_ < 200 || status_code_ > 299) {
      throw std::runtime_error(
          fmt::format("Couldn't retrieve '{}'. HTTP status: {}", url_, status_code_));
    }
  } catch (...) {
    cleanup();
    throw;
  }
}

http_stream::~http_stream() { cleanup(); }

void http_stream::append_request_header(const std::string& header) {
  auto* appended = curl_slist_append(headers_list_, header.c_str());
  if (appended == nullptr) {
    throw std::runtime_error("http_stream: curl_slist_append failed");
  }
  headers_list_ = appended;
}

void http_stream::cleanup() noexcept {
  if (multi_ != nullptr && easy_ != nullptr) {
    curl_multi_remove_handle(multi_, easy_); // will call back with CURL_POLL_REMOVE
  }
  if (easy_ != nullptr) {
    curl_easy_cleanup(easy_);
    easy_ = nullptr;
  }
  if (multi_ != nullptr) {
    curl_multi_cleanup(multi_);
    multi_ = nullptr;
  }
  sockets_.clear(); // events must go before their base
  if (timeout_ != nullptr) {
    event_free(timeout_);
    timeout_ = nullptr;
  }
  if (ebase_ != nullptr) {
    event_base_free(ebase_);
    ebase_ = nullptr;
  }
  curl_slist_free_all(headers_list_);
  headers_list_ = nullptr;
}

std::optional<std::uint64_t> http_stream::content_length() const {
  if (auto iter = headers_.find("content-length"); iter != headers_.end()) {
    return parse_content_length(iter->second);
  }
  return std::nullopt;
}

std::size_t http_stream::read(char* dest, std::size_t max_bytes) {
  if (max_bytes == 0) return 0;

  read_ahead_ = max_bytes;
  while (buffer_.size() < max_bytes && !done_) {
    if (paused_) {
      paused_ = false;
      // may synchronously deliver the held back data to write_data_curl_cb
      if (auto res = curl_easy_pause(easy_, CURLPAUSE_CONT); res != CURLE_OK) {
        throw std::runtime_error(fmt::format("Couldn't resume transfer of '{}'. Error: {}", url_,
                                             curl_easy_strerror(res)));
      }
      continue;
    }
    run_once();
  }

  if (buffer_.empty()) {
    throw_if_failed(); // deliver what we have before reporting a failure
    return 0;
  }

  const auto count = std::min(max_bytes, buffer_.size());
  std::copy_n(buffer_.begin(), count, dest);
  buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(count));
  return count;
}

void http_stream::run_once() {
  const int rc = event_base_loop(ebase_, EVLOOP_ONCE);
  if (rc < 0) {
    throw std::runtime_error("http_stream: event_base_loop failed");
  }
  if (rc == 1) {
    // no events pending, let curl decide what it wants to wait for next
    int running_handles = 0;
    curl_multi_socket_action(multi_, CURL_SOCKET_TIMEOUT, 0, &running_handles);
    process_curl_messages();
  }
}

void http_stream::process_curl_messages() {
  CURLMsg* message = nullptr;
  int      pending = 0;

  while ((message = curl_multi_info_read(multi_, &pending)) != nullptr) {
    if (message->msg == CURLMSG_DONE) {
      done_   = true;
      result_ = message->data.result;
      if (auto expected = content_length();
          result_ == CURLE_OK && expected && body_bytes_ < *expected) {
        result_ = CURLE_PARTIAL_FILE;
        auto end = fmt::format_to_n(error_buffer_.begin(), error_buffer_.size() - 1,
                                    "connection closed after {} of {} bytes", body_bytes_,
                                    *expected);
        *end.out = '\0';
      }
    }
  }
}

void http_stream::throw_if_failed() const {
  if (done_ && result_ != CURLE_OK) {
    const std::string detail =
        error_buffer_[0] != '\0' ? error_buffer_.data() : curl_easy_strerror(result_);
    throw std::runtime_error(fmt::format("Couldn't retrieve '{}'. Error: {}", url_, detail));
  }
}

// CURL callbacks

std::size_t http_stream::write_data_curl_cb(char* ptr, std::size_t size, std::size_t nmemb,
                                            void* userdata) {
  auto* self     = static_cast<http_stream*>(userdata);
  auto  realsize = size * nmemb;

  self->body_started_ = true;
  if (self->buffer_.size() >= self->read_ahead_) {
    // curl keeps this data and hands it over again after curl_easy_pause(CONT)
    self->paused_ = true;
    return CURL_WRITEFUNC_PAUSE;
  }
  self->buffer_.insert(self->buffer_.end(), ptr, ptr + realsize); // NOLINT ptr arith
  self->body_bytes_ += realsize;
  return realsize;
}

std::size_t http_stream::header_curl_cb(char* buffer, std::size_t size, std::size_t nitems,
                                        void* userdata) {
  auto*                  self     = static_cast<http_stream*>(userdata);
  auto                   realsize = size * nitems;
  const std::string_view line     = trim(std::string_view{buffer, realsize});

  if (line.starts_with("HTTP/")) {
    // new response, eg after a redirect: only the final set of headers counts
    self->headers_.clear();
  } else if (auto colon = line.find(':'); colon != std::string_view::npos) {
    self->headers_[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
  }
  return realsize;
}

int http_stream::start_timeout_curl_cb(CURLM* /*multi*/, long timeout_ms, void* userp) {
  auto* self = static_cast<http_stream*>(userp);
  if (timeout_ms < 0) {
    evtimer_del(self->timeout_);
  } else {
    if (timeout_ms == 0) timeout_ms = 1; /* 0 means call socket_action asap */
    timeval tv{};
    tv.tv_sec  = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;

    evtimer_del(self->timeout_);
    evtimer_add(self->timeout_, &tv);
  }
  return 0;
}

int http_stream::handle_socket_curl_cb(CURL* /*easy*/, curl_socket_t s, int action, void* userp,
                                       void* socketp) {
  auto*           self         = static_cast<http_stream*>(userp);
  socket_context* curl_context = static_cast<socket_context*>(socketp);
  short           events       = 0;

  switch (action) {
  case CURL_POLL_IN:
  case CURL_POLL_OUT:
  case CURL_POLL_INOUT:
    if (curl_context == nullptr) {
      auto owned    = socket_context_ptr(new socket_context); // NOLINT owning new, deleter frees
      owned->sockfd = s;
      owned->owner  = self;
      owned->ev     = event_new(self->ebase_, static_cast<evutil_socket_t>(s), 0,
                                curl_perform_event_cb, owned.get());
      if (owned->ev == nullptr) return -1;
      curl_context     = owned.get();
      self->sockets_[s] = std::move(owned);
    }

    curl_multi_assign(self->multi_, s, curl_context);

    if (action != CURL_POLL_IN) events |= EV_WRITE; // NOLINT signed-bool-ops
    if (action != CURL_POLL_OUT) events |= EV_READ; // NOLINT signed-bool-ops

    events |= EV_PERSIST; // NOLINT signed bitwise

    event_del(curl_context->ev);
    event_assign(curl_context->ev, self->ebase_, static_cast<evutil_socket_t>(curl_context->sockfd),
                 events, curl_perform_event_cb, curl_context);
    event_add(curl_context->ev, nullptr);
    break;

  case CURL_POLL_REMOVE:
    if (curl_context != nullptr) {
      curl_multi_assign(self->multi_, s, nullptr);
      self->sockets_.erase(s);
    }
    break;

  default:
    return -1; // unknown action, fails the transfer
  }
  return 0;
}

void http_stream::socket_context_deleter::operator()(socket_context* context) const noexcept {
  if (context->ev != nullptr) {
    event_del(context->ev);
    event_free(context->ev);
  }
  delete context; // NOLINT manual delete
}

// event callbacks

void http_stream::curl_perform_event_cb(evutil_socket_t /*fd*/, short event, void* arg) {
  // the context can be destroyed by curl_multi_socket_action, take what we need first
  auto*               context = static_cast<socket_context*>(arg);
  http_stream*        self    = context->owner;
  const curl_socket_t sockfd  = context->sockfd;

  int running_handles = 0;
  int flags           = 0;

  if (event & EV_READ) flags |= CURL_CSELECT_IN;   // NOLINT -> bool & bitwise
  if (event & EV_WRITE) flags |= CURL_CSELECT_OUT; // NOLINT -> bool & bitwise

  curl_multi_socket_action(self->multi_, sockfd, flags, &running_handles);

  self->process_curl_messages();
}

void http_stream::timeout_event_cb(evutil_socket_t /*fd*/, short /*events*/, void* arg) {
  auto* self            = static_cast<http_stream*>(arg);
  int   running_handles = 0;
  curl_multi_socket_action(self->multi_, CURL_SOCKET_TIMEOUT, 0, &running_handles);
  self->process_curl_messages();
}

} // namespace chunkdl::dnl
