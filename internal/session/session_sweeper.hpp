#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace kag::session {

class SessionRegistry;

/*
  Periodic idle-session eviction.

  Every interval, sessions idle past timeout are removed from the registry;
  the registry's removal listeners drop their cached contexts.
*/
class SessionSweeper {
 public:
  SessionSweeper(std::shared_ptr<SessionRegistry> registry, std::chrono::seconds timeout, std::chrono::milliseconds interval);
  ~SessionSweeper();

  void Start();
  void Stop();

  // One pass at the current time; returns the number of evicted sessions.
  std::size_t SweepOnce();

 private:
  void Run();

  std::shared_ptr<SessionRegistry> registry_;
  std::chrono::seconds             timeout_;
  std::chrono::milliseconds        interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stopping_ = false;
  std::thread             thread_;
};

} // namespace kag::session
