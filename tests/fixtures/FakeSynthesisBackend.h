// Fake speech synthesis backend. Counts invocations and, on success, writes a
// short silent WAV to the requested output path.

#ifndef MEDIAHUB_TESTS_FIXTURES_FAKE_SYNTHESIS_BACKEND_H_
#define MEDIAHUB_TESTS_FIXTURES_FAKE_SYNTHESIS_BACKEND_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "mediahub/tts/SynthesisBackend.h"

namespace mediahub::tests::fixtures {

class FakeSynthesisBackend : public tts::ISynthesisBackend {
 public:
  FakeSynthesisBackend(std::string name, tts::SynthesisStatus outcome)
      : name_(std::move(name)), outcome_(outcome) {}

  std::string name() const override { return name_; }
  bool Probe() override { return probe_result_.load(); }
  tts::SynthesisStatus Synthesize(const tts::SynthesisRequest& request) override;

  void set_outcome(tts::SynthesisStatus outcome);
  void set_probe_result(bool available) { probe_result_.store(available); }
  // Milliseconds of silence written per successful render.
  void set_rendered_ms(int ms) { rendered_ms_.store(ms); }
  // Wall-clock time each Synthesize() call takes.
  void set_render_delay(std::chrono::milliseconds delay) { render_delay_ms_.store(delay.count()); }

  int calls() const { return calls_.load(); }
  std::vector<tts::SynthesisRequest> requests() const;

 private:
  std::string name_;
  mutable std::mutex mutex_;
  tts::SynthesisStatus outcome_;
  std::vector<tts::SynthesisRequest> requests_;
  std::atomic<bool> probe_result_{true};
  std::atomic<int> rendered_ms_{100};
  std::atomic<int64_t> render_delay_ms_{0};
  std::atomic<int> calls_{0};
};

}  // namespace mediahub::tests::fixtures

#endif  // MEDIAHUB_TESTS_FIXTURES_FAKE_SYNTHESIS_BACKEND_H_
