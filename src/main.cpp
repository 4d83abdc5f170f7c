// Repository: MediaHub
// Component: mediahubd
// Purpose: Daemon entry point. Loads configuration, wires the playback,
//          speech and remote components together and serves MediaHubControl.
// Copyright (c) 2026 MediaHub

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "mediahub/config/ConfigLoader.h"
#include "mediahub/library/LocalTrackResolver.h"
#include "mediahub/playback/PlaybackController.h"
#include "mediahub/playback/SessionLauncher.h"
#include "mediahub/remote/RemoteCatalog.h"
#include "mediahub/tts/SpeechService.h"
#include "mediahub/tts/TtsCache.h"
#include "mediahub/tts/TtsSynthesisChain.h"
#include "mediahub/util/Logger.hpp"
#include "mediahub_service.h"

namespace {

using mediahub::util::Logger;

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

struct CliArgs {
  std::string config_path = "config.json";
  std::string listen_address;  // Empty: use server.listen_address
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Local media hub: music playback, remote streams and speech announcements,\n"
            << "controlled over gRPC (MediaHubControl).\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --config PATH   Configuration file (default: config.json; created if missing)\n"
            << "  --listen ADDR   Listen address, overrides server.listen_address\n"
            << "  --help          Show this help message\n"
            << "\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--listen" && i + 1 < argc) {
      args.listen_address = argv[++i];
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  args.valid = true;
  return args;
}

void ConfigureLogging(const mediahub::config::MediaHubConfig& config) {
  Logger::SetLevel(Logger::ParseLevel(config.logging().level()));
  if (!config.logging().file().empty() && !Logger::SetMirrorFile(config.logging().file())) {
    Logger::Warn("[mediahubd] Cannot open log file " + config.logging().file() +
                 ", logging to console only");
  }
}

void LogAvailability(const std::string& what,
                     const std::vector<std::pair<std::string, bool>>& probed) {
  std::string line = "[mediahubd] " + what + ":";
  for (const auto& [name, available] : probed) {
    line += " " + name + (available ? "(ok)" : "(missing)");
  }
  Logger::Info(line);
}

int Run(const CliArgs& args) {
  namespace config = mediahub::config;
  namespace playback = mediahub::playback;

  config::MediaHubConfig cfg = config::LoadConfig(args.config_path);
  if (!args.listen_address.empty()) {
    cfg.mutable_server()->set_listen_address(args.listen_address);
  }
  if (!config::CreateDirectories(cfg)) {
    Logger::Warn("[mediahubd] Some directories could not be created");
  }
  ConfigureLogging(cfg);

  auto resolver = std::make_shared<mediahub::library::LocalTrackResolver>(
      cfg.audio().music_dir(), cfg.audio().playlists_dir(),
      std::vector<std::string>(cfg.audio().supported_formats().begin(),
                               cfg.audio().supported_formats().end()));
  auto catalog = std::make_shared<mediahub::remote::RemoteCatalog>(config::ToCatalogOptions(cfg));
  auto launcher = std::make_shared<playback::ProcessLauncher>(config::ToLauncherOptions(cfg));
  auto controller = std::make_shared<playback::PlaybackController>(
      resolver, catalog, launcher, config::ToControllerOptions(cfg));

  auto cache = std::make_shared<mediahub::tts::TtsCache>(cfg.audio().tts_cache_dir(),
                                                         cfg.tts().max_cache_entries());
  auto chain = std::make_shared<mediahub::tts::TtsSynthesisChain>(
      config::MakeSynthesisBackends(cfg), config::ToChainOptions(cfg));
  auto speech = std::make_shared<mediahub::tts::SpeechService>(cache, chain,
                                                               config::ToSpeechOptions(cfg));

  LogAvailability("Decoders", launcher->ProbeDecoders());
  LogAvailability("Synthesis backends", speech->ProbeBackends());
  LogAvailability("Speech players", speech->ProbePlayers());

  mediahub::server::MediaHubControlImpl service(
      mediahub::server::ServiceComponents{controller, speech, catalog, launcher});

  const std::string listen_address = cfg.server().listen_address();
  grpc::ServerBuilder builder;
  builder.AddListeningPort(listen_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server) {
    Logger::Error("[mediahubd] Failed to listen on " + listen_address);
    controller->Shutdown();
    return 1;
  }
  Logger::Info("[mediahubd] Listening on " + listen_address);

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  std::thread shutdown_watcher([&server, &catalog, &speech] {
    while (!g_termination_requested.load(std::memory_order_acquire)) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    Logger::Info("[mediahubd] Termination requested, shutting down");
    // Server::Shutdown waits for in-flight handlers, so their fetcher calls
    // and announcements are cancelled first.
    catalog->Shutdown();
    speech->Shutdown();
    server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
  });

  server->Wait();
  shutdown_watcher.join();

  controller->Shutdown();
  Logger::Info("[mediahubd] Stopped");
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  try {
    return Run(args);
  } catch (const std::exception& e) {
    Logger::Error(std::string("[mediahubd] Fatal: ") + e.what());
    return 1;
  }
}
