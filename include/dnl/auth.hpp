#pragma once

#include "chunkdl.hpp"
#include <iostream>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>

namespace chunkdl::dnl {

std::string base64_encode(std::string_view data);

// {"Authorization": "Basic base64(user:password)"}
header_map basic_auth_header(const std::string& user, const std::string& password);

// writes prompt to `os` and reads one line from `is`, with terminal echo switched off when `is`
// is std::cin on a tty
std::string prompt_password(const std::string& prompt, std::istream& is = std::cin,
                            std::ostream& os = std::cerr);

// asks for the password of http_user and builds the basic auth header from it
header_map make_basic_auth(const std::string& http_user, std::istream& is = std::cin,
                           std::ostream& os = std::cerr);

} // namespace chunkdl::dnl
