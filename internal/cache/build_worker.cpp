#include "build_worker.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace kag::cache {

BuildWorker::BuildWorker(std::shared_ptr<BuildScheduler> scheduler) : scheduler_(std::move(scheduler)) {
}

BuildWorker::~BuildWorker() {
  Stop();
}

void BuildWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&BuildWorker::Run, this);
}

void BuildWorker::Stop() {
  scheduler_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void BuildWorker::Run() {
  // drain queued tasks after shutdown so no waiter is left without an outcome
  while (true) {
    auto task = scheduler_->Dequeue();
    if (!task) break;

    try {
      task->run();
    } catch (const std::exception& e) {
      KAG_LOG_ERROR("Build task failed",
                    {kag::observability::StringField("session_id", task->session_id), kag::observability::StringField("error", e.what())});
    }
  }
}

} // namespace kag::cache
