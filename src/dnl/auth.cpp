#include "dnl/auth.hpp"
#include "chunkdl.hpp"
#include "logger.hpp"
#include <cstddef>
#include <fmt/format.h>
#include <iostream>
#include <istream>
#include <openssl/evp.h>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <termios.h>
#include <unistd.h>

namespace chunkdl::dnl {

namespace {

// switches off terminal echo on stdin for its lifetime
class echo_off_guard {
public:
  echo_off_guard() {
    if (isatty(STDIN_FILENO) == 0 || tcgetattr(STDIN_FILENO, &saved_) != 0) return;
    termios silent = saved_;
    silent.c_lflag &= ~static_cast<tcflag_t>(ECHO); // NOLINT signed bitwise
    active_ = tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent) == 0;
  }
  echo_off_guard(const echo_off_guard&)            = delete;
  echo_off_guard& operator=(const echo_off_guard&) = delete;
  ~echo_off_guard() {
    if (active_) tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_);
  }

  [[nodiscard]] bool active() const { return active_; }

private:
  termios saved_{};
  bool    active_ = false;
};

} // namespace

std::string base64_encode(std::string_view data) {
  // 4 output chars per 3 input bytes, plus the terminating nul EVP_EncodeBlock writes
  std::string encoded(4 * ((data.size() + 2) / 3) + 1, '\0');
  const int   len =
      EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()),        // NOLINT reincast
                      reinterpret_cast<const unsigned char*>(data.data()),     // NOLINT reincast
                      static_cast<int>(data.size()));
  if (len < 0) {
    throw std::runtime_error("base64_encode: EVP_EncodeBlock failed");
  }
  encoded.resize(static_cast<std::size_t>(len));
  return encoded;
}

header_map basic_auth_header(const std::string& user, const std::string& password) {
  return {{"Authorization", fmt::format("Basic {}", base64_encode(user + ":" + password))}};
}

std::string prompt_password(const std::string& prompt, std::istream& is, std::ostream& os) {
  os << prompt;
  os.flush();

  std::string password;
  if (&is == &std::cin) {
    const echo_off_guard guard;
    std::getline(is, password);
    if (guard.active()) os << '\n'; // the user's newline was not echoed
  } else {
    std::getline(is, password);
  }
  if (is.bad()) {
    throw std::runtime_error("Could not read password");
  }
  return password;
}

header_map make_basic_auth(const std::string& http_user, std::istream& is, std::ostream& os) {
  const auto prompt = format_log_line(
      "QUESTION", fmt::format("Please enter password for '{}': ", http_user));
  return basic_auth_header(http_user, prompt_password(prompt, is, os));
}

} // namespace chunkdl::dnl
