#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

#include "build_task.hpp"

namespace kag::cache {

/*
  Thread-safe blocking queue for build workers.
*/
class BuildScheduler {
 public:
  // false once Shutdown() has been called
  bool Enqueue(BuildTask task);

  // blocking wait; nullopt after shutdown once the queue is drained
  std::optional<BuildTask> Dequeue();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<BuildTask>   queue_;
  bool                    shutdown_ = false;
};

} // namespace kag::cache
