// Repository: MediaHub
// Component: MediaHubControl gRPC Service Implementation
// Purpose: Implements the MediaHubControl service interface.
// Copyright (c) 2026 MediaHub

#include "mediahub_service.h"

#include <string>
#include <utility>
#include <vector>

#include <google/protobuf/descriptor.h>
#include <google/protobuf/util/json_util.h>

#include "mediahub/util/Logger.hpp"

namespace mediahub
{
  namespace server
  {

    using mediahub::util::Logger;

    namespace
    {
      constexpr char kApiVersion[] = "1.0.0";
      constexpr char kServiceName[] = "mediahub";

      bool Contains(const std::string &haystack, const char *needle)
      {
        return haystack.find(needle) != std::string::npos;
      }

      void FillCacheInfo(CacheTarget target, const util::DirectoryUsage &usage,
                         ::mediahub::CacheInfo *response)
      {
        response->set_target(target);
        response->set_entry_count(static_cast<uint32_t>(usage.entry_count));
        response->set_total_bytes(usage.total_bytes);
        response->set_directory(usage.directory);
      }

      void AddAvailability(const std::vector<std::pair<std::string, bool>> &probed,
                           google::protobuf::RepeatedPtrField<ComponentAvailability> *out)
      {
        for (const auto &[name, available] : probed)
        {
          ComponentAvailability *entry = out->Add();
          entry->set_name(name);
          entry->set_available(available);
        }
      }
    } // namespace

    grpc::StatusCode StatusCodeForMessage(const std::string &message)
    {
      if (Contains(message, "not found"))
      {
        return grpc::StatusCode::NOT_FOUND;
      }
      if (Contains(message, "Invalid") || Contains(message, "required"))
      {
        return grpc::StatusCode::INVALID_ARGUMENT;
      }
      if (Contains(message, "Nothing is playing") || Contains(message, "Queue is empty") ||
          Contains(message, "cannot be"))
      {
        return grpc::StatusCode::FAILED_PRECONDITION;
      }
      return grpc::StatusCode::INTERNAL;
    }

    grpc::StatusCode SpeechStatusCode(tts::SpeechError error)
    {
      switch (error)
      {
      case tts::SpeechError::kInvalidArgument:
        return grpc::StatusCode::INVALID_ARGUMENT;
      case tts::SpeechError::kStopped:
        return grpc::StatusCode::CANCELLED;
      default:
        return grpc::StatusCode::INTERNAL;
      }
    }

    bool ParseCommandJson(const std::string &json, CommandEnvelope *out, std::string *error)
    {
      google::protobuf::util::JsonParseOptions options;
      options.ignore_unknown_fields = true;
      CommandEnvelope parsed;
      const auto status = google::protobuf::util::JsonStringToMessage(json, &parsed, options);
      if (!status.ok())
      {
        if (error)
          *error = status.ToString();
        return false;
      }
      *out = std::move(parsed);
      return true;
    }

    playback::RawCommand ToRawCommand(const CommandEnvelope &envelope)
    {
      playback::RawCommand raw;
      raw.type = envelope.type();
      if (envelope.has_song_name())
        raw.song_name = envelope.song_name();
      if (envelope.has_playlist_name())
        raw.playlist_name = envelope.playlist_name();
      if (envelope.has_query())
        raw.query = envelope.query();
      if (envelope.has_url())
        raw.url = envelope.url();
      if (envelope.has_playlist_url())
        raw.playlist_url = envelope.playlist_url();
      if (envelope.has_audio_only())
        raw.audio_only = envelope.audio_only();
      if (envelope.has_shuffle())
        raw.shuffle = envelope.shuffle();
      if (envelope.has_volume())
        raw.volume = envelope.volume();
      return raw;
    }

    MediaHubControlImpl::MediaHubControlImpl(ServiceComponents components)
        : components_(std::move(components))
    {
      Logger::Info("[MediaHubControl] Service initialized (API version: " +
                   std::string(kApiVersion) + ")");
    }

    MediaHubControlImpl::~MediaHubControlImpl() = default;

    grpc::Status MediaHubControlImpl::Dispatch(grpc::ServerContext *context,
                                               const CommandEnvelope *request,
                                               DispatchResponse *response)
    {
      Logger::Info("[Dispatch] Request received: type=" + request->type());

      const auto command = playback::ParseCommand(ToRawCommand(*request));
      if (!command)
      {
        // Not an RPC error: the collaborator sent something we do not act on.
        response->set_accepted(false);
        response->set_success(false);
        response->set_message("Ignored command: " + request->type());
        return grpc::Status::OK;
      }

      const auto result = playback::Dispatch(*components_.controller, *command);
      response->set_accepted(true);
      response->set_success(result.success);
      response->set_message(result.message);

      if (!result.success)
      {
        Logger::Warn("[Dispatch] " + std::string(playback::CommandTypeName(*command)) +
                     " failed: " + result.message);
        return grpc::Status(StatusCodeForMessage(result.message), result.message);
      }
      return grpc::Status::OK;
    }

    grpc::Status MediaHubControlImpl::Speak(grpc::ServerContext *context,
                                            const SpeakRequest *request,
                                            SpeakResponse *response)
    {
      Logger::Info("[Speak] Request received (" + std::to_string(request->text().size()) +
                   " chars)");

      tts::SpeechRequest speech;
      speech.text = request->text();
      if (request->has_voice())
        speech.voice = request->voice();
      if (request->has_speed())
        speech.speed = request->speed();
      if (request->has_volume())
        speech.volume = request->volume();

      const tts::SpeechResult result = components_.speech->Speak(speech);
      response->set_success(result.success);
      response->set_message(result.message);
      response->set_cache_hit(result.cache_hit);
      response->set_backend(result.backend);
      response->set_player(result.player);

      if (!result.success)
      {
        return grpc::Status(SpeechStatusCode(result.error), result.message);
      }
      return grpc::Status::OK;
    }

    grpc::Status MediaHubControlImpl::Transport(grpc::ServerContext *context,
                                                const TransportRequest *request,
                                                TransportResponse *response)
    {
      auto &controller = *components_.controller;
      const std::string action = TransportRequest::Action_Name(request->action());
      Logger::Info("[Transport] Request received: action=" + action);

      playback::ControllerResult result(true, "");
      switch (request->action())
      {
      case TransportRequest::PAUSE:
        result = controller.Pause();
        break;
      case TransportRequest::RESUME:
        result = controller.Resume();
        break;
      case TransportRequest::NEXT:
        result = controller.Next();
        break;
      case TransportRequest::PREVIOUS:
        result = controller.Previous();
        break;
      case TransportRequest::STOP:
        result = controller.Stop();
        break;
      case TransportRequest::TOGGLE_SHUFFLE:
      {
        const bool on = controller.ToggleShuffle();
        result = playback::ControllerResult(true, std::string("Shuffle ") + (on ? "on" : "off"));
        break;
      }
      case TransportRequest::TOGGLE_REPEAT:
      {
        const bool on = controller.ToggleRepeat();
        result = playback::ControllerResult(true, std::string("Repeat ") + (on ? "on" : "off"));
        break;
      }
      default:
        response->set_success(false);
        response->set_message("Invalid transport action: " + action);
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, response->message());
      }

      const playback::PlaybackStatus status = controller.GetStatus();
      response->set_success(result.success);
      response->set_message(result.message);
      response->set_shuffle(status.shuffle);
      response->set_repeat(status.repeat);

      if (!result.success)
      {
        return grpc::Status(StatusCodeForMessage(result.message), result.message);
      }
      return grpc::Status::OK;
    }

    grpc::Status MediaHubControlImpl::GetStatus(grpc::ServerContext *context,
                                                const StatusRequest *request,
                                                ::mediahub::PlaybackStatus *response)
    {
      const playback::PlaybackStatus status = components_.controller->GetStatus();
      response->set_playing(status.playing);
      response->set_paused(status.paused);
      if (status.current_track)
        response->set_current_track(*status.current_track);
      response->set_current_title(status.current_title);
      response->set_volume(status.volume);
      response->set_shuffle(status.shuffle);
      response->set_repeat(status.repeat);
      response->set_queue_length(static_cast<uint32_t>(status.queue_length));
      if (status.current_index)
        response->set_current_index(static_cast<uint32_t>(*status.current_index));
      if (status.source_kind)
        response->set_source_kind(playback::SourceKindToString(*status.source_kind));
      response->set_queue_state(playback::QueueStateToString(status.queue_state));
      response->set_session_status(process::SessionStatusToString(status.session_status));
      response->set_session_generation(status.session_generation);
      return grpc::Status::OK;
    }

    grpc::Status MediaHubControlImpl::GetCacheInfo(grpc::ServerContext *context,
                                                   const CacheRequest *request,
                                                   ::mediahub::CacheInfo *response)
    {
      switch (request->target())
      {
      case SPEECH:
        FillCacheInfo(SPEECH, components_.speech->CacheInfo(), response);
        return grpc::Status::OK;
      case REMOTE:
        FillCacheInfo(REMOTE, components_.catalog->CacheInfo(), response);
        return grpc::Status::OK;
      default:
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Invalid cache target");
      }
    }

    grpc::Status MediaHubControlImpl::ClearCache(grpc::ServerContext *context,
                                                 const CacheRequest *request,
                                                 ClearCacheResponse *response)
    {
      int removed = 0;
      switch (request->target())
      {
      case SPEECH:
        removed = components_.speech->ClearCache();
        break;
      case REMOTE:
        removed = components_.catalog->ClearCache();
        break;
      default:
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Invalid cache target");
      }
      Logger::Info("[ClearCache] " + CacheTarget_Name(request->target()) + ": removed " +
                   std::to_string(removed) + " file(s)");
      response->set_target(request->target());
      response->set_removed(static_cast<uint32_t>(removed));
      return grpc::Status::OK;
    }

    grpc::Status MediaHubControlImpl::Health(grpc::ServerContext *context,
                                             const HealthRequest *request,
                                             HealthResponse *response)
    {
      response->set_status("healthy");
      response->set_service(kServiceName);
      return grpc::Status::OK;
    }

    grpc::Status MediaHubControlImpl::GetServiceInfo(grpc::ServerContext *context,
                                                     const ServiceInfoRequest *request,
                                                     ServiceInfo *response)
    {
      response->set_service(kServiceName);
      response->set_version(kApiVersion);

      const google::protobuf::ServiceDescriptor *descriptor =
          CommandEnvelope::descriptor()->file()->FindServiceByName("MediaHubControl");
      if (descriptor != nullptr)
      {
        for (int i = 0; i < descriptor->method_count(); ++i)
        {
          response->add_rpcs(descriptor->method(i)->name());
        }
      }

      if (components_.launcher)
      {
        AddAvailability(components_.launcher->ProbeDecoders(), response->mutable_decoders());
      }
      AddAvailability(components_.speech->ProbeBackends(), response->mutable_synthesis_backends());
      AddAvailability(components_.speech->ProbePlayers(), response->mutable_players());
      return grpc::Status::OK;
    }

  } // namespace server
} // namespace mediahub
