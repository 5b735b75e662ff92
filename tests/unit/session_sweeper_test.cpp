#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/session/session_registry.hpp"
#include "internal/session/session_sweeper.hpp"

namespace {

using kag::session::SessionRegistry;
using kag::session::SessionSweeper;

void TestSweepOnceEvictsIdleSessions() {
  auto registry = std::make_shared<SessionRegistry>();
  registry->GetOrCreate("s1", "u1");
  registry->GetOrCreate("s2", "u2");

  SessionSweeper sweeper(registry, std::chrono::seconds(0), std::chrono::hours(1));
  std::this_thread::sleep_for(std::chrono::milliseconds(10));

  assert(sweeper.SweepOnce() == 2);
  assert(registry->Stats().total_sessions == 0);
  assert(sweeper.SweepOnce() == 0);
}

void TestSweepKeepsActiveSessions() {
  auto registry = std::make_shared<SessionRegistry>();
  registry->GetOrCreate("s1", "u1");

  SessionSweeper sweeper(registry, std::chrono::seconds(3600), std::chrono::hours(1));
  assert(sweeper.SweepOnce() == 0);
  assert(registry->Get("s1").has_value());
}

void TestBackgroundLoopEvictsAndStops() {
  auto registry = std::make_shared<SessionRegistry>();
  registry->GetOrCreate("idle", "u1");

  SessionSweeper sweeper(registry, std::chrono::seconds(1), std::chrono::milliseconds(50));
  sweeper.Start();

  // touched throughout: must survive
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(1500);
  while (std::chrono::steady_clock::now() < deadline) {
    registry->GetOrCreate("busy", "u1");
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  const auto stop_started = std::chrono::steady_clock::now();
  sweeper.Stop();
  assert(std::chrono::steady_clock::now() - stop_started < std::chrono::seconds(1));

  assert(!registry->Get("idle").has_value());
  assert(registry->Get("busy").has_value());
}

} // namespace

int main() {
  TestSweepOnceEvictsIdleSessions();
  TestSweepKeepsActiveSessions();
  TestBackgroundLoopEvictsAndStops();

  std::cout << "kag_unit_session_sweeper: pass\n";
  return 0;
}
