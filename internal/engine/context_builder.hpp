#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace kag::engine {

/*
  Engine-side result of priming a model with reference text.

  Opaque to the cache: handles are compared by identity and never inspected.
*/
class PrimedContext {
 public:
  virtual ~PrimedContext() = default;
};

using ContextHandle = std::shared_ptr<const PrimedContext>;

struct BuildParams {
  bool     deterministic  = true;
  uint32_t max_new_tokens = 1;
};

/*
  Inference engine boundary.

  Build is expensive and may fail; failures are reported as util::BuildError.
  Implementations must be safe to call from several build workers at once.
*/
class ContextBuilder {
 public:
  virtual ~ContextBuilder() = default;

  virtual ContextHandle Build(const std::string& text, const BuildParams& params) = 0;
};

} // namespace kag::engine
