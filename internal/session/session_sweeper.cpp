#include "session_sweeper.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "session_registry.hpp"

namespace kag::session {

using kag::observability::IntField;
using kag::observability::StringField;

SessionSweeper::SessionSweeper(std::shared_ptr<SessionRegistry> registry, std::chrono::seconds timeout, std::chrono::milliseconds interval)
    : registry_(std::move(registry)), timeout_(timeout), interval_(interval) {
}

SessionSweeper::~SessionSweeper() {
  Stop();
}

void SessionSweeper::Start() {
  {
    std::lock_guard lock(mutex_);
    if (thread_.joinable()) return;
    stopping_ = false;
  }
  thread_ = std::thread(&SessionSweeper::Run, this);
}

void SessionSweeper::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

std::size_t SessionSweeper::SweepOnce() {
  const auto evicted = registry_->EvictIdle(util::Now(), timeout_);
  if (!evicted.empty()) {
    KAG_LOG_INFO("Session sweep evicted idle sessions",
                 {IntField("evicted", static_cast<int64_t>(evicted.size())), IntField("timeout_seconds", timeout_.count())});
  } else {
    KAG_LOG_DEBUG("Session sweep found nothing to evict");
  }
  return evicted.size();
}

void SessionSweeper::Run() {
  std::unique_lock lock(mutex_);
  while (!stopping_) {
    if (cv_.wait_for(lock, interval_, [&] { return stopping_; })) break;

    lock.unlock();
    try {
      SweepOnce();
    } catch (const std::exception& e) {
      KAG_LOG_ERROR("Session sweep failed", {StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace kag::session
