// Repository: MediaHub
// Component: Command Templates
// Copyright (c) 2026 MediaHub

#include "mediahub/process/CommandTemplate.h"

#include <unistd.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace mediahub::process {

std::vector<std::string> ExpandCommand(const std::string& command_template,
                                       const TemplateVars& vars) {
  std::vector<std::string> argv;
  std::istringstream in(command_template);
  std::string token;
  while (in >> token) {
    std::string expanded;
    expanded.reserve(token.size());
    size_t pos = 0;
    while (pos < token.size()) {
      const size_t open = token.find('{', pos);
      if (open == std::string::npos) {
        expanded.append(token, pos, std::string::npos);
        break;
      }
      const size_t close = token.find('}', open + 1);
      if (close == std::string::npos) {
        expanded.append(token, pos, std::string::npos);
        break;
      }
      expanded.append(token, pos, open - pos);
      const std::string name = token.substr(open + 1, close - open - 1);
      auto it = vars.find(name);
      if (it != vars.end()) {
        expanded += it->second;
      } else {
        expanded.append(token, open, close - open + 1);
      }
      pos = close + 1;
    }
    if (!expanded.empty()) {
      argv.push_back(std::move(expanded));
    }
  }
  return argv;
}

void AddVolumeVars(int volume_percent, TemplateVars& vars) {
  const int clamped = std::clamp(volume_percent, 0, 100);
  char gain[16];
  std::snprintf(gain, sizeof(gain), "%.2f", clamped / 100.0);
  vars["volume"] = std::to_string(clamped);
  vars["scale"] = std::to_string(clamped * 32768 / 100);
  vars["gain"] = gain;
}

std::string CommandBinary(const std::string& command_template) {
  std::istringstream in(command_template);
  std::string binary;
  in >> binary;
  return binary;
}

bool IsExecutableAvailable(const std::string& binary) {
  if (binary.empty()) return false;
  if (binary.find('/') != std::string::npos) {
    return access(binary.c_str(), X_OK) == 0;
  }
  const char* path_env = std::getenv("PATH");
  if (path_env == nullptr) return false;
  std::istringstream dirs(path_env);
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    if (dir.empty()) dir = ".";
    const std::string candidate = dir + "/" + binary;
    if (access(candidate.c_str(), X_OK) == 0) {
      return true;
    }
  }
  return false;
}

std::string JoinArgv(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& arg : argv) {
    if (!out.empty()) out += ' ';
    out += arg;
  }
  return out;
}

}  // namespace mediahub::process
