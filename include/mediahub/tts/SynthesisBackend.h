// Repository: MediaHub
// Component: Synthesis Backends
// Purpose: Capability contract for speech synthesizers and the command-line
//          implementation used for espeak, text2wave and friends.
// Copyright (c) 2026 MediaHub

#ifndef MEDIAHUB_TTS_SYNTHESIS_BACKEND_H_
#define MEDIAHUB_TTS_SYNTHESIS_BACKEND_H_

#include <chrono>
#include <string>

namespace mediahub::tts {

// kUnavailable: the backend is not present or not usable (nothing was tried).
// kFailed: the backend ran and did not produce an artifact.
enum class SynthesisStatus {
  kSuccess,
  kUnavailable,
  kFailed,
};

const char* SynthesisStatusToString(SynthesisStatus status);

struct SynthesisRequest {
  std::string text;
  std::string voice;
  double speed = 1.0;
  std::string output_path;  // WAV file to create
};

class ISynthesisBackend {
 public:
  virtual ~ISynthesisBackend() = default;

  virtual std::string name() const = 0;

  // Cheap capability probe: is the backend usable right now.
  virtual bool Probe() = 0;

  virtual SynthesisStatus Synthesize(const SynthesisRequest& request) = 0;
};

// Words per minute passed as {wpm}: 175 at speed 1.0.
int SpeedToWordsPerMinute(double speed);

// CommandSynthesisBackend runs a command template such as
//   "espeak -s {wpm} -a 100 -v {voice} -w {output} {text}"
// Placeholders: {text}, {text_file} (the text written to a scratch file next
// to the output), {output}, {voice}, {speed}, {wpm}.
class CommandSynthesisBackend : public ISynthesisBackend {
 public:
  CommandSynthesisBackend(std::string name,
                          std::string command_template,
                          std::chrono::milliseconds timeout);

  std::string name() const override { return name_; }
  bool Probe() override;
  SynthesisStatus Synthesize(const SynthesisRequest& request) override;

 private:
  std::string name_;
  std::string command_template_;
  std::chrono::milliseconds timeout_;
};

}  // namespace mediahub::tts

#endif  // MEDIAHUB_TTS_SYNTHESIS_BACKEND_H_
