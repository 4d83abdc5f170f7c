#include "fixtures/FakeSynthesisBackend.h"

#include <thread>

#include "mediahub/tts/AudioAssembler.h"

namespace mediahub::tests::fixtures {

tts::SynthesisStatus FakeSynthesisBackend::Synthesize(const tts::SynthesisRequest& request) {
  calls_++;
  tts::SynthesisStatus outcome;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);
    outcome = outcome_;
  }
  const int64_t delay_ms = render_delay_ms_.load();
  if (delay_ms > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
  }
  if (outcome != tts::SynthesisStatus::kSuccess) {
    return outcome;
  }
  tts::AudioAssembler assembler;
  assembler.AppendSilence(rendered_ms_.load());
  return assembler.WriteWav(request.output_path) ? tts::SynthesisStatus::kSuccess
                                                 : tts::SynthesisStatus::kFailed;
}

void FakeSynthesisBackend::set_outcome(tts::SynthesisStatus outcome) {
  std::lock_guard<std::mutex> lock(mutex_);
  outcome_ = outcome;
}

std::vector<tts::SynthesisRequest> FakeSynthesisBackend::requests() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_;
}

}  // namespace mediahub::tests::fixtures
