#include "platform/unix_socket.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

namespace {

bool fill_address(sockaddr_un& addr, const std::string& path) {
    addr = {};
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path)) return false;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    return true;
}

std::unexpected<Error> bind_error(std::string message) {
    return std::unexpected(Error{ErrorCode::Bind, std::move(message)});
}

} // namespace

std::expected<int, Error> listen_unix(const std::string& path, int backlog) {
    auto dir = fs::path(path).parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) return bind_error(std::format("mkdir {}: {}", dir.string(), ec.message()));
        ::chmod(dir.c_str(), 0700);
    }

    sockaddr_un addr;
    if (!fill_address(addr, path)) return bind_error("socket path too long: " + path);

    // Remove stale socket
    ::unlink(path.c_str());

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) return bind_error(std::format("socket(): {}", std::strerror(errno)));

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        auto msg = std::format("bind {}: {}", path, std::strerror(errno));
        ::close(fd);
        return bind_error(std::move(msg));
    }

    if (::listen(fd, backlog) < 0) {
        auto msg = std::format("listen {}: {}", path, std::strerror(errno));
        ::close(fd);
        ::unlink(path.c_str());
        return bind_error(std::move(msg));
    }

    return fd;
}

int connect_unix(const std::string& path) {
    sockaddr_un addr;
    if (!fill_address(addr, path)) return -1;

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return -1;

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

bool send_all(int fd, std::string_view data) {
    size_t total = 0;
    while (total < data.size()) {
        ssize_t n = ::send(fd, data.data() + total, data.size() - total, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        total += static_cast<size_t>(n);
    }
    return true;
}

} // namespace platform
