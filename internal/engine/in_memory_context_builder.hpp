#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include "context_builder.hpp"

namespace kag::engine {

// What the in-memory engine "primes": the prompt it would have run.
class InMemoryPrimedContext final : public PrimedContext {
 public:
  InMemoryPrimedContext(std::string prompt, std::string model, BuildParams params)
      : prompt_(std::move(prompt)), model_(std::move(model)), params_(params) {
  }

  const std::string& Prompt() const {
    return prompt_;
  }
  const std::string& Model() const {
    return model_;
  }
  const BuildParams& Params() const {
    return params_;
  }

 private:
  std::string prompt_;
  std::string model_;
  BuildParams params_;
};

/*
  Reference engine used by the daemon when no accelerator backend is linked,
  and by tests.

  Wraps the reference text in the system prompt, counts calls and can be told
  to fail or to stall.
*/
class InMemoryContextBuilder final : public ContextBuilder {
 public:
  explicit InMemoryContextBuilder(std::string model = "in-memory");

  ContextHandle Build(const std::string& text, const BuildParams& params) override;

  static std::string SystemPrompt(const std::string& text);

  uint64_t BuildCount() const {
    return builds_.load();
  }

  std::vector<std::string> Texts() const;

  void FailNextBuilds(uint32_t count);
  void SetLatency(std::chrono::milliseconds latency);

 private:
  std::string model_;

  std::atomic<uint64_t>                  builds_{0};
  std::atomic<uint32_t>                  failures_pending_{0};
  std::atomic<int64_t>  latency_ms_{0};

  mutable std::mutex       mutex_;
  std::vector<std::string> texts_;
};

} // namespace kag::engine
