// Repository: MediaHub
// Component: MediaHubControl gRPC Service
// Purpose: Implements the MediaHubControl service interface on top of the
//          playback controller, the speech service and the remote catalog.
// Copyright (c) 2026 MediaHub

#ifndef MEDIAHUB_SERVICE_H_
#define MEDIAHUB_SERVICE_H_

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "mediahub.grpc.pb.h"
#include "mediahub.pb.h"
#include "mediahub/playback/Command.h"
#include "mediahub/playback/PlaybackController.h"
#include "mediahub/playback/SessionLauncher.h"
#include "mediahub/remote/RemoteCatalog.h"
#include "mediahub/tts/SpeechService.h"

namespace mediahub {
namespace server {

struct ServiceComponents {
  std::shared_ptr<playback::PlaybackController> controller;
  std::shared_ptr<tts::SpeechService> speech;
  std::shared_ptr<remote::IRemoteCatalog> catalog;
  // Only used for decoder availability in GetServiceInfo; may be null.
  std::shared_ptr<playback::ProcessLauncher> launcher;
};

// MediaHubControlImpl implements the gRPC service defined in mediahub.proto.
// This is a thin adapter: every RPC converts its request, delegates, and maps
// the outcome onto the response and a grpc::Status.
class MediaHubControlImpl final : public MediaHubControl::Service {
 public:
  explicit MediaHubControlImpl(ServiceComponents components);
  ~MediaHubControlImpl() override;

  // Disable copy and move
  MediaHubControlImpl(const MediaHubControlImpl&) = delete;
  MediaHubControlImpl& operator=(const MediaHubControlImpl&) = delete;

  // RPC implementations
  grpc::Status Dispatch(grpc::ServerContext* context,
                        const CommandEnvelope* request,
                        DispatchResponse* response) override;

  grpc::Status Speak(grpc::ServerContext* context,
                     const SpeakRequest* request,
                     SpeakResponse* response) override;

  grpc::Status Transport(grpc::ServerContext* context,
                         const TransportRequest* request,
                         TransportResponse* response) override;

  grpc::Status GetStatus(grpc::ServerContext* context,
                         const StatusRequest* request,
                         ::mediahub::PlaybackStatus* response) override;

  grpc::Status GetCacheInfo(grpc::ServerContext* context,
                            const CacheRequest* request,
                            ::mediahub::CacheInfo* response) override;

  grpc::Status ClearCache(grpc::ServerContext* context,
                          const CacheRequest* request,
                          ClearCacheResponse* response) override;

  grpc::Status Health(grpc::ServerContext* context,
                      const HealthRequest* request,
                      HealthResponse* response) override;

  grpc::Status GetServiceInfo(grpc::ServerContext* context,
                              const ServiceInfoRequest* request,
                              ServiceInfo* response) override;

 private:
  ServiceComponents components_;
};

// Decodes a JSON command body (as home-automation controllers send it) into a
// CommandEnvelope. Unknown fields are ignored.
bool ParseCommandJson(const std::string& json, CommandEnvelope* out, std::string* error);

// Wire envelope → untyped command consumed by playback::ParseCommand.
playback::RawCommand ToRawCommand(const CommandEnvelope& envelope);

// Maps a failed controller message onto a status code.
grpc::StatusCode StatusCodeForMessage(const std::string& message);

// Maps a failed speech result onto a status code.
grpc::StatusCode SpeechStatusCode(tts::SpeechError error);

}  // namespace server
}  // namespace mediahub

#endif  // MEDIAHUB_SERVICE_H_
