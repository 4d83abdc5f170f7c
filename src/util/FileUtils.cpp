// Repository: MediaHub
// Component: File Utilities
// Copyright (c) 2026 MediaHub

#include "mediahub/util/FileUtils.hpp"

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <system_error>
#include <vector>

#include "mediahub/util/Logger.hpp"

namespace mediahub::util {

namespace fs = std::filesystem;

namespace {

template <typename Fn>
void ForEachMatchingFile(const std::string& dir, const std::string& extension, Fn fn) {
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) return;
  for (fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) break;
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec)) continue;
    if (!extension.empty() && it->path().extension() != extension) continue;
    fn(*it);
  }
}

}  // namespace

DirectoryUsage MeasureDirectory(const std::string& dir, const std::string& extension) {
  DirectoryUsage usage;
  usage.directory = dir;
  ForEachMatchingFile(dir, extension, [&usage](const fs::directory_entry& entry) {
    std::error_code ec;
    const auto size = entry.file_size(ec);
    usage.entry_count++;
    if (!ec) usage.total_bytes += size;
  });
  return usage;
}

int RemoveFiles(const std::string& dir, const std::string& extension) {
  std::vector<fs::path> doomed;
  ForEachMatchingFile(dir, extension, [&doomed](const fs::directory_entry& entry) {
    doomed.push_back(entry.path());
  });
  int removed = 0;
  for (const auto& path : doomed) {
    std::error_code ec;
    if (fs::remove(path, ec)) {
      removed++;
    } else if (ec) {
      Logger::Warn("[FileUtils] Cannot remove " + path.string() + ": " + ec.message());
    }
  }
  return removed;
}

bool WriteFileAtomically(const std::string& path, const std::string& data) {
  const std::string tmp = path + ".tmp." + std::to_string(getpid());
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      Logger::Error("[FileUtils] Cannot open " + tmp + " for writing");
      return false;
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out) {
      Logger::Error("[FileUtils] Short write to " + tmp);
      std::error_code ec;
      fs::remove(tmp, ec);
      return false;
    }
  }
  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) {
    Logger::Error("[FileUtils] Cannot rename " + tmp + " to " + path + ": " + ec.message());
    fs::remove(tmp, ec);
    return false;
  }
  return true;
}

bool EnsureDirectory(const std::string& dir) {
  if (dir.empty()) return true;
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    Logger::Error("[FileUtils] Cannot create directory " + dir + ": " + ec.message());
    return false;
  }
  return true;
}

}  // namespace mediahub::util
