#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace gallery::persistence {

/*
  Best-effort text file access. Failures are logged, never thrown.
*/

// Returns false when the file could not be written.
bool SaveToFile(const std::string& text, const std::filesystem::path& path);

// nullopt when the path does not exist, is not a regular file, or the read fails.
std::optional<std::string> LoadFromFile(const std::filesystem::path& path);

} // namespace gallery::persistence
