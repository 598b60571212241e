#pragma once

#include "errors.hpp"

#include <expected>
#include <string>
#include <string_view>

namespace platform {

// Non-blocking listening socket at `path`. The parent directory is created
// with mode 0700 and a stale socket file is replaced.
std::expected<int, Error> listen_unix(const std::string& path, int backlog = 16);

// Blocking client connection, or -1.
int connect_unix(const std::string& path);

// Writes all of `data`, retrying on EINTR. Never raises SIGPIPE.
bool send_all(int fd, std::string_view data);

} // namespace platform
