#include "file_io.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#include "internal/observability/logging.hpp"

namespace gallery::persistence {

using observability::StringField;

namespace {

std::string LastErrorMessage() {
  return errno != 0 ? std::strerror(errno) : "unknown error";
}

} // namespace

bool SaveToFile(const std::string& text, const std::filesystem::path& path) {
  errno = 0;
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    GALLERY_LOG_WARN("Failed to save file", {StringField("path", path.string()), StringField("error", LastErrorMessage())});
    return false;
  }

  out.write(text.data(), static_cast<std::streamsize>(text.size()));
  out.close();
  if (!out) {
    GALLERY_LOG_WARN("Failed to save file", {StringField("path", path.string()), StringField("error", LastErrorMessage())});
    return false;
  }
  return true;
}

std::optional<std::string> LoadFromFile(const std::filesystem::path& path) {
  std::error_code ec;
  const auto      status = std::filesystem::status(path, ec);
  if (status.type() == std::filesystem::file_type::not_found) {
    return std::nullopt;
  }
  if (ec) {
    GALLERY_LOG_WARN("Failed to load file", {StringField("path", path.string()), StringField("error", ec.message())});
    return std::nullopt;
  }
  if (!std::filesystem::is_regular_file(status)) {
    GALLERY_LOG_WARN("Failed to load file", {StringField("path", path.string()), StringField("error", "not a regular file")});
    return std::nullopt;
  }

  errno = 0;
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    GALLERY_LOG_WARN("Failed to load file", {StringField("path", path.string()), StringField("error", LastErrorMessage())});
    return std::nullopt;
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    GALLERY_LOG_WARN("Failed to load file", {StringField("path", path.string()), StringField("error", LastErrorMessage())});
    return std::nullopt;
  }
  return buffer.str();
}

} // namespace gallery::persistence
