#include "state_store.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <format>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace storage {

namespace {

std::unexpected<Error> persistence_error(const std::string& what, const std::string& path) {
    return std::unexpected(Error{ErrorCode::Persistence,
                                 std::format("{} {}: {}", what, path, std::strerror(errno))});
}

} // namespace

std::expected<void, Error> write_atomic(const std::string& path, std::string_view contents) {
    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    std::string tmp = path + ".tmp";
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) return persistence_error("open", tmp);

    size_t written = 0;
    while (written < contents.size()) {
        ssize_t n = ::write(fd, contents.data() + written, contents.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            auto err = persistence_error("write", tmp);
            ::close(fd);
            ::unlink(tmp.c_str());
            return err;
        }
        written += static_cast<size_t>(n);
    }

    if (::fsync(fd) < 0) {
        auto err = persistence_error("fsync", tmp);
        ::close(fd);
        ::unlink(tmp.c_str());
        return err;
    }
    ::close(fd);

    if (::rename(tmp.c_str(), path.c_str()) < 0) {
        auto err = persistence_error("rename", tmp);
        ::unlink(tmp.c_str());
        return err;
    }
    return {};
}

std::expected<void, Error> write_json(const std::string& path, const nlohmann::json& value) {
    return write_atomic(path, value.dump(2) + "\n");
}

std::expected<nlohmann::json, Error> read_json(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        return std::unexpected(Error{ErrorCode::Persistence, "could not open " + path});
    }
    try {
        return nlohmann::json::parse(f);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(Error{ErrorCode::Persistence,
                                     std::format("parse error in {}: {}", path, e.what())});
    }
}

bool append_line(const std::string& path, std::string_view line) {
    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    std::ofstream f(path, std::ios::app);
    if (!f.is_open()) return false;
    f << line << '\n';
    return static_cast<bool>(f);
}

} // namespace storage
