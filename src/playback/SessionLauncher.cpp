// Repository: MediaHub
// Component: Session Launcher
// Copyright (c) 2026 MediaHub

#include "mediahub/playback/SessionLauncher.h"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include "mediahub/process/CommandTemplate.h"
#include "mediahub/process/ProcessSession.h"
#include "mediahub/process/StreamPipeline.h"
#include "mediahub/util/Logger.hpp"

namespace mediahub::playback {

using mediahub::util::Logger;

namespace {

std::string LowerExtension(const std::string& path) {
  std::string ext = std::filesystem::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

bool Accepts(const DecoderCommand& decoder, const std::string& ext) {
  if (decoder.extensions.empty()) return true;
  return std::find(decoder.extensions.begin(), decoder.extensions.end(), ext) !=
         decoder.extensions.end();
}

bool BinaryAvailable(const std::string& command) {
  return process::IsExecutableAvailable(process::CommandBinary(command));
}

}  // namespace

ProcessLauncher::ProcessLauncher(LauncherOptions options) : options_(std::move(options)) {
  auto lower_all = [](std::vector<DecoderCommand>& decoders) {
    for (auto& decoder : decoders) {
      for (auto& ext : decoder.extensions) {
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      }
    }
  };
  lower_all(options_.local_decoders);
  lower_all(options_.audio_decoders);
  lower_all(options_.video_decoders);
}

std::vector<LaunchCandidate> ProcessLauncher::Candidates(const Track& track,
                                                         const std::string& playable_ref,
                                                         int volume) {
  if (track.kind == SourceKind::kLocal) {
    return LocalCandidates(playable_ref, volume);
  }
  return RemoteCandidates(playable_ref, track.mode, volume);
}

std::vector<LaunchCandidate> ProcessLauncher::LocalCandidates(const std::string& path,
                                                              int volume) const {
  process::TemplateVars vars = {{"path", path}};
  process::AddVolumeVars(volume, vars);
  const std::string ext = LowerExtension(path);

  std::vector<LaunchCandidate> out;
  for (const auto& decoder : options_.local_decoders) {
    if (!Accepts(decoder, ext)) continue;
    if (!BinaryAvailable(decoder.command)) {
      Logger::Debug("[ProcessLauncher] Decoder " + decoder.name + " not installed, skipping");
      continue;
    }
    process::ProcessSpec spec;
    spec.argv = process::ExpandCommand(decoder.command, vars);
    spec.label = decoder.name;
    out.push_back(LaunchCandidate{decoder.name, [spec]() -> std::unique_ptr<process::ISession> {
                                    return std::make_unique<process::ProcessSession>(spec);
                                  }});
  }
  return out;
}

std::vector<LaunchCandidate> ProcessLauncher::RemoteCandidates(const std::string& locator,
                                                               RemoteMode mode,
                                                               int volume) const {
  const std::string& fetch_command =
      mode == RemoteMode::kAudio ? options_.audio_fetch_command : options_.video_fetch_command;
  const auto& decoders =
      mode == RemoteMode::kAudio ? options_.audio_decoders : options_.video_decoders;

  std::vector<LaunchCandidate> out;
  if (!BinaryAvailable(fetch_command)) {
    Logger::Warn("[ProcessLauncher] Fetcher '" + process::CommandBinary(fetch_command) +
                 "' not installed");
    return out;
  }

  process::ProcessSpec fetcher;
  fetcher.argv = process::ExpandCommand(fetch_command, {{"locator", locator}});
  fetcher.label = process::CommandBinary(fetch_command);

  process::TemplateVars vars;
  process::AddVolumeVars(volume, vars);
  process::PipelineOptions pipeline_options;
  pipeline_options.stall_timeout = options_.stall_timeout;
  pipeline_options.fetcher_grace = options_.fetcher_grace;

  for (const auto& decoder : decoders) {
    if (!BinaryAvailable(decoder.command)) {
      Logger::Debug("[ProcessLauncher] Decoder " + decoder.name + " not installed, skipping");
      continue;
    }
    process::ProcessSpec decoder_spec;
    decoder_spec.argv = process::ExpandCommand(decoder.command, vars);
    decoder_spec.label = decoder.name;
    out.push_back(LaunchCandidate{
        fetcher.label + "|" + decoder.name,
        [fetcher, decoder_spec, pipeline_options]() -> std::unique_ptr<process::ISession> {
          return std::make_unique<process::StreamPipeline>(fetcher, decoder_spec,
                                                           pipeline_options);
        }});
  }
  return out;
}

std::vector<std::pair<std::string, bool>> ProcessLauncher::ProbeDecoders() const {
  std::vector<std::pair<std::string, bool>> out;
  for (const auto& decoder : options_.local_decoders) {
    out.emplace_back(decoder.name, BinaryAvailable(decoder.command));
  }
  out.emplace_back("fetcher:" + process::CommandBinary(options_.audio_fetch_command),
                   BinaryAvailable(options_.audio_fetch_command));
  for (const auto& decoder : options_.audio_decoders) {
    out.emplace_back("remote-audio:" + decoder.name, BinaryAvailable(decoder.command));
  }
  for (const auto& decoder : options_.video_decoders) {
    out.emplace_back("remote-video:" + decoder.name, BinaryAvailable(decoder.command));
  }
  return out;
}

}  // namespace mediahub::playback
