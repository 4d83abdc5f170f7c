// Repository: MediaHub
// Component: File Utilities
// Purpose: Small filesystem helpers shared by the speech and remote caches.
// Copyright (c) 2026 MediaHub

#ifndef MEDIAHUB_UTIL_FILE_UTILS_HPP_
#define MEDIAHUB_UTIL_FILE_UTILS_HPP_

#include <cstdint>
#include <string>

namespace mediahub::util {

struct DirectoryUsage {
  int entry_count = 0;
  uint64_t total_bytes = 0;
  std::string directory;
};

// Counts regular files directly inside `dir` whose extension equals
// `extension` (any extension when empty). A missing directory reports zero.
DirectoryUsage MeasureDirectory(const std::string& dir, const std::string& extension);

// Removes the files MeasureDirectory would count. Returns how many were removed.
int RemoveFiles(const std::string& dir, const std::string& extension);

// Writes `data` to "<path>.tmp.<pid>" and renames it over `path`, so readers
// never observe a partially written file.
bool WriteFileAtomically(const std::string& path, const std::string& data);

// Creates `dir` and its parents. Returns false (and logs) on failure.
bool EnsureDirectory(const std::string& dir);

}  // namespace mediahub::util

#endif  // MEDIAHUB_UTIL_FILE_UTILS_HPP_
