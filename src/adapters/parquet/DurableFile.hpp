#pragma once

#include <filesystem>
#include <string>

namespace tape::adapters::parquet {

// fsync(2) on a file; throws std::runtime_error on failure.
void sync_file(const std::filesystem::path& path);

// fsync(2) on a directory so that renames inside it are durable.
void sync_directory(const std::filesystem::path& dir);

// Flushes `tmp`, renames it over `target` and syncs the parent directory.
void publish_file(const std::filesystem::path& tmp, const std::filesystem::path& target);

// Writes `content` to `<target>.tmp` and publishes it over `target`.
void write_file_atomic(const std::filesystem::path& target, const std::string& content);

}  // namespace tape::adapters::parquet
