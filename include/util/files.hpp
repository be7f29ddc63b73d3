#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace lightwallet {
namespace util {

/**
 * Atomic file write for crash-safe snapshots
 *
 * 1. Write to a temporary sibling file (.tmp.XXXX suffix)
 * 2. fsync() the file
 * 3. fsync() the directory
 * 4. rename() over the target
 *
 * Readers see either the old file or the complete new one.
 * Returns true on success, false on failure (temp file removed).
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode = 0644);

/**
 * Read entire file into string
 * Returns std::nullopt if the file cannot be opened or read
 */
std::optional<std::string> read_file_string(const std::filesystem::path &path);

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

} // namespace util
} // namespace lightwallet
