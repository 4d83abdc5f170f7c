// Repository: MediaHub
// Component: Synthesis Backends
// Copyright (c) 2026 MediaHub

#include "mediahub/tts/SynthesisBackend.h"

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "mediahub/process/CommandTemplate.h"
#include "mediahub/process/ProcessRunner.h"
#include "mediahub/util/Logger.hpp"

namespace mediahub::tts {

namespace fs = std::filesystem;
using mediahub::util::Logger;

const char* SynthesisStatusToString(SynthesisStatus status) {
  switch (status) {
    case SynthesisStatus::kSuccess:
      return "success";
    case SynthesisStatus::kUnavailable:
      return "unavailable";
    case SynthesisStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

int SpeedToWordsPerMinute(double speed) {
  return static_cast<int>(175.0 * speed);
}

CommandSynthesisBackend::CommandSynthesisBackend(std::string name,
                                                 std::string command_template,
                                                 std::chrono::milliseconds timeout)
    : name_(std::move(name)),
      command_template_(std::move(command_template)),
      timeout_(timeout) {}

bool CommandSynthesisBackend::Probe() {
  return process::IsExecutableAvailable(process::CommandBinary(command_template_));
}

SynthesisStatus CommandSynthesisBackend::Synthesize(const SynthesisRequest& request) {
  char speed_buf[32];
  std::snprintf(speed_buf, sizeof(speed_buf), "%.2f", request.speed);

  process::TemplateVars vars = {
      {"text", request.text},
      {"output", request.output_path},
      {"voice", request.voice},
      {"speed", speed_buf},
      {"wpm", std::to_string(SpeedToWordsPerMinute(request.speed))},
  };

  std::string text_file;
  if (command_template_.find("{text_file}") != std::string::npos) {
    text_file = request.output_path + ".txt";
    std::ofstream out(text_file, std::ios::trunc);
    out << request.text;
    if (!out) {
      Logger::Error("[SynthesisBackend] " + name_ + ": cannot write " + text_file);
      return SynthesisStatus::kFailed;
    }
    vars["text_file"] = text_file;
  }

  process::RunOptions options;
  options.timeout = timeout_;
  options.capture_stdout = false;
  const process::RunResult result =
      process::RunProcess(process::ExpandCommand(command_template_, vars), options);

  std::error_code ec;
  if (!text_file.empty()) fs::remove(text_file, ec);

  if (!result.spawned) {
    Logger::Info("[SynthesisBackend] " + name_ + " not executable: " +
                 std::strerror(result.spawn_errno));
    return SynthesisStatus::kUnavailable;
  }
  if (result.timed_out) {
    Logger::Warn("[SynthesisBackend] " + name_ + " timed out");
    return SynthesisStatus::kFailed;
  }
  if (!result.exit.Succeeded()) {
    Logger::Warn("[SynthesisBackend] " + name_ + " failed: " + process::DescribeExit(result.exit));
    return SynthesisStatus::kFailed;
  }
  if (!fs::is_regular_file(request.output_path, ec) ||
      fs::file_size(request.output_path, ec) == 0) {
    Logger::Warn("[SynthesisBackend] " + name_ + " exited cleanly but wrote no audio");
    return SynthesisStatus::kFailed;
  }
  return SynthesisStatus::kSuccess;
}

}  // namespace mediahub::tts
