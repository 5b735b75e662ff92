#include "in_memory_context_builder.hpp"

#include <thread>

#include "internal/util/errors.hpp"

namespace kag::engine {

InMemoryContextBuilder::InMemoryContextBuilder(std::string model) : model_(std::move(model)) {
}

std::string InMemoryContextBuilder::SystemPrompt(const std::string& text) {
  return "<system>\nThe following are important documents to reference: " + text + "\n</system>";
}

ContextHandle InMemoryContextBuilder::Build(const std::string& text, const BuildParams& params) {
  builds_.fetch_add(1);
  {
    std::lock_guard lock(mutex_);
    texts_.push_back(text);
  }

  if (const auto latency_ms = latency_ms_.load(); latency_ms > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(latency_ms));
  }

  // decrement only while pending > 0
  uint32_t pending = failures_pending_.load();
  while (pending > 0) {
    if (failures_pending_.compare_exchange_weak(pending, pending - 1)) {
      throw util::BuildError("engine failed to prime context");
    }
  }

  return std::make_shared<InMemoryPrimedContext>(SystemPrompt(text), model_, params);
}

std::vector<std::string> InMemoryContextBuilder::Texts() const {
  std::lock_guard lock(mutex_);
  return texts_;
}

void InMemoryContextBuilder::FailNextBuilds(uint32_t count) {
  failures_pending_.store(count);
}

void InMemoryContextBuilder::SetLatency(std::chrono::milliseconds latency) {
  latency_ms_.store(latency.count());
}

} // namespace kag::engine
