#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/engine/context_builder.hpp"
#include "internal/util/time.hpp"

namespace kag::documents {
class SegmentStore;
}
namespace kag::session {
class SessionRegistry;
}

namespace kag::cache {

class BuildScheduler;

struct CacheEntry {
  engine::ContextHandle handle;

  // Document ids the handle was built from.
  std::set<std::string> fingerprint;

  util::TimePoint           built_at;
  std::chrono::milliseconds build_duration{0};
  uint64_t                  segment_count    = 0;
  uint64_t                  estimated_tokens = 0;
};

struct CacheStats {
  uint64_t                        active_entries          = 0;
  uint64_t                        total_document_bindings = 0;
  std::map<std::string, uint64_t> per_session_document_counts;

  uint64_t in_flight_builds = 0;
  uint64_t hits             = 0;
  uint64_t misses           = 0;
  uint64_t builds           = 0;
  uint64_t build_failures   = 0;
};

struct ContextCacheOptions {
  // 0 = no budget
  uint32_t max_context_tokens = 8192;

  // 0 = wait for the engine indefinitely
  std::chrono::milliseconds build_timeout{0};

  engine::BuildParams params;
};

/*
  Per-session primed context with single-flight rebuilds.

  State lives under the registry's mutex so entry swaps, fingerprint updates
  and session removal are one critical section. Segment lookups and engine
  calls run on build workers with no lock held.

  For each session at most one rebuild is in flight. Callers asking for the
  same document set wait for it and observe its outcome; callers asking for a
  different set wait for it to settle and then re-evaluate. A caller whose
  build timeout expires while another set's build still holds the session
  gets util::BuildTimeout without its own set having been tried.

  A document change invalidates in-flight builds that include the document:
  their results are discarded and their callers build again.

  Must be owned by a std::shared_ptr: queued builds hold a weak reference.
*/
class ContextCache : public std::enable_shared_from_this<ContextCache> {
 public:
  ContextCache(std::shared_ptr<session::SessionRegistry> registry, std::shared_ptr<documents::SegmentStore> segments,
               std::shared_ptr<engine::ContextBuilder> builder, std::shared_ptr<BuildScheduler> scheduler, ContextCacheOptions options);
  ~ContextCache();

  ContextCache(const ContextCache&)            = delete;
  ContextCache& operator=(const ContextCache&) = delete;

  // Throws util::NoContent, util::BuildError or util::BuildTimeout.
  void EnsureReady(const std::string& session_id, const std::vector<std::string>& document_ids, const std::string& user_id);

  // nullptr when the session has no cached context.
  engine::ContextHandle     Get(const std::string& session_id) const;
  std::optional<CacheEntry> Entry(const std::string& session_id) const;

  void Clear(const std::string& session_id);

  // Drops every entry built from document_id; returns how many.
  std::size_t InvalidateDocument(const std::string& document_id);

  CacheStats Stats() const;

 private:
  struct Flight {
    std::set<std::string>    fingerprint;
    std::promise<void>       done;
    std::shared_future<void> outcome;

    // set under the registry mutex when a document change discards this build
    bool invalidated = false;
  };

  struct BuiltContext {
    engine::ContextHandle handle;
    uint64_t              segment_count    = 0;
    uint64_t              estimated_tokens = 0;
  };

  void Launch(const std::string& session_id, const std::shared_ptr<Flight>& flight, const std::vector<std::string>& ordered_ids,
              const std::string& user_id);
  bool WaitFor(const std::shared_ptr<Flight>& flight) const;
  // false when a document change discarded the build and the caller should start over
  bool Await(const std::string& session_id, const std::shared_ptr<Flight>& flight);
  void AwaitOther(const std::string& session_id, const std::shared_ptr<Flight>& flight);

  void         RunBuild(const std::string& session_id, const std::shared_ptr<Flight>& flight, const std::vector<std::string>& ordered_ids,
                        const std::string& user_id);
  BuiltContext Build(const std::string& session_id, const std::vector<std::string>& ordered_ids, const std::string& user_id) const;
  bool         Install(const std::string& session_id, const std::shared_ptr<Flight>& flight, BuiltContext built,
                       std::chrono::milliseconds duration);
  void         Abandon(const std::string& session_id, const std::shared_ptr<Flight>& flight, bool failed);

  // registry lock held
  void OnSessionRemovedLocked(const std::string& session_id);

  std::shared_ptr<session::SessionRegistry> registry_;
  std::shared_ptr<documents::SegmentStore>  segments_;
  std::shared_ptr<engine::ContextBuilder>   builder_;
  std::shared_ptr<BuildScheduler>           scheduler_;
  ContextCacheOptions                       options_;
  uint64_t                                  listener_id_ = 0;

  // guarded by the registry mutex
  std::unordered_map<std::string, CacheEntry>              entries_;
  std::unordered_map<std::string, std::shared_ptr<Flight>> flights_;
  uint64_t                                                 hits_           = 0;
  uint64_t                                                 misses_         = 0;
  uint64_t                                                 builds_         = 0;
  uint64_t                                                 build_failures_ = 0;
};

} // namespace kag::cache
