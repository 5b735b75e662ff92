#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "build_scheduler.hpp"

namespace kag::cache {

/*
  Background worker that executes context rebuilds.

  Several workers may share one scheduler; each owns one thread.
*/
class BuildWorker {
 public:
  explicit BuildWorker(std::shared_ptr<BuildScheduler> scheduler);
  ~BuildWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<BuildScheduler> scheduler_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace kag::cache
