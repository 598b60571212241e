#pragma once

#include "errors.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace storage {

// Writes `contents` to `<path>.tmp`, fsyncs it and renames it over `path`.
// Parent directories are created. On failure the previous file is untouched.
std::expected<void, Error> write_atomic(const std::string& path, std::string_view contents);

std::expected<void, Error> write_json(const std::string& path, const nlohmann::json& value);

std::expected<nlohmann::json, Error> read_json(const std::string& path);

// Appends one line to a log file, creating it if needed.
bool append_line(const std::string& path, std::string_view line);

} // namespace storage
