#pragma once

#include <functional>
#include <string>

namespace kag::cache {

/*
  A queued context rebuild.

  run resolves segments, calls the engine and installs the result; it must
  not throw.
*/
struct BuildTask {
  std::string           session_id;
  std::function<void()> run;
};

} // namespace kag::cache
