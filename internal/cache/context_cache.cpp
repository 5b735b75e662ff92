#include "context_cache.hpp"

#include <exception>
#include <stdexcept>
#include <unordered_set>

#include "build_scheduler.hpp"
#include "internal/documents/segment_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/session/session_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/tokens.hpp"

namespace kag::cache {

using kag::observability::IntField;
using kag::observability::StringField;

namespace {

constexpr std::string_view kSegmentSeparator = "\n\n";

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

// First occurrence wins; order is the order segments are concatenated in.
std::vector<std::string> Dedup(const std::vector<std::string>& ids) {
  std::vector<std::string>        out;
  std::unordered_set<std::string> seen;
  for (const auto& id : ids) {
    if (seen.insert(id).second) out.push_back(id);
  }
  return out;
}

} // namespace

ContextCache::ContextCache(std::shared_ptr<session::SessionRegistry> registry, std::shared_ptr<documents::SegmentStore> segments,
                           std::shared_ptr<engine::ContextBuilder> builder, std::shared_ptr<BuildScheduler> scheduler,
                           ContextCacheOptions options)
    : registry_(std::move(registry)),
      segments_(std::move(segments)),
      builder_(std::move(builder)),
      scheduler_(std::move(scheduler)),
      options_(options) {
  if (!registry_ || !segments_ || !builder_ || !scheduler_) {
    throw std::invalid_argument("ContextCache: registry, segment store, builder and scheduler are required");
  }
  listener_id_ = registry_->AddRemovalListener([this](const std::string& session_id) { OnSessionRemovedLocked(session_id); });
}

ContextCache::~ContextCache() {
  registry_->RemoveRemovalListener(listener_id_);
}

// ------------------------------------------------------------------
// Orchestration
// ------------------------------------------------------------------

void ContextCache::EnsureReady(const std::string& session_id, const std::vector<std::string>& document_ids, const std::string& user_id) {
  if (session_id.empty()) {
    throw util::InvalidArgument("session id is required");
  }

  const auto                  ordered = Dedup(document_ids);
  const std::set<std::string> fingerprint(ordered.begin(), ordered.end());

  while (true) {
    auto lock = registry_->Lock();
    registry_->GetOrCreateLocked(session_id, user_id);

    if (auto it = entries_.find(session_id); it != entries_.end() && it->second.fingerprint == fingerprint) {
      ++hits_;
      lock.unlock();
      observability::Metrics::Instance().RecordCacheLookup(true);
      KAG_LOG_DEBUG("Context cache hit", {StringField("session_id", session_id), IntField("documents", static_cast<int64_t>(fingerprint.size()))});
      return;
    }

    if (auto it = flights_.find(session_id); it != flights_.end()) {
      auto       flight = it->second;
      const bool same   = flight->fingerprint == fingerprint;
      lock.unlock();

      if (!same) {
        // a different set is being built; let it settle, then compare again
        AwaitOther(session_id, flight);
        continue;
      }
      if (Await(session_id, flight)) return;
      continue;
    }

    ++misses_;
    auto flight         = std::make_shared<Flight>();
    flight->fingerprint = fingerprint;
    flight->outcome     = flight->done.get_future().share();
    flights_.emplace(session_id, flight);
    lock.unlock();

    observability::Metrics::Instance().RecordCacheLookup(false);
    Launch(session_id, flight, ordered, user_id);
    if (Await(session_id, flight)) return;
  }
}

void ContextCache::Launch(const std::string& session_id, const std::shared_ptr<Flight>& flight, const std::vector<std::string>& ordered_ids,
                          const std::string& user_id) {
  std::weak_ptr<ContextCache> weak = weak_from_this();

  BuildTask task;
  task.session_id = session_id;
  task.run        = [weak, session_id, flight, ordered_ids, user_id]() {
    auto self = weak.lock();
    if (!self) {
      flight->done.set_exception(std::make_exception_ptr(util::BuildError("context cache is shutting down")));
      return;
    }
    self->RunBuild(session_id, flight, ordered_ids, user_id);
  };

  if (!scheduler_->Enqueue(std::move(task))) {
    Abandon(session_id, flight, true);
    flight->done.set_exception(std::make_exception_ptr(util::BuildError("build workers are not running")));
  }
}

bool ContextCache::WaitFor(const std::shared_ptr<Flight>& flight) const {
  if (options_.build_timeout.count() <= 0) {
    flight->outcome.wait();
    return true;
  }
  return flight->outcome.wait_for(options_.build_timeout) != std::future_status::timeout;
}

bool ContextCache::Await(const std::string& session_id, const std::shared_ptr<Flight>& flight) {
  if (!WaitFor(flight)) {
    bool cleared = false;
    {
      auto lock = registry_->Lock();
      if (auto it = flights_.find(session_id); it != flights_.end() && it->second == flight) {
        flights_.erase(it);
        ++build_failures_;
        cleared = true;
      }
    }
    if (cleared) {
      observability::Metrics::Instance().ObserveContextBuildMs("timeout", static_cast<double>(options_.build_timeout.count()));
      KAG_LOG_WARN("Context build timed out", {StringField("session_id", session_id), IntField("timeout_ms", options_.build_timeout.count())});
    }
    throw util::BuildTimeout("context build for session " + session_id + " exceeded " + std::to_string(options_.build_timeout.count()) +
                             "ms");
  }

  try {
    flight->outcome.get();
    return true;
  } catch (const std::exception&) {
    auto lock = registry_->Lock();
    if (!flight->invalidated) throw;
  }

  KAG_LOG_INFO("Restarting context build after document change", {StringField("session_id", session_id)});
  return false;
}

void ContextCache::AwaitOther(const std::string& session_id, const std::shared_ptr<Flight>& flight) {
  if (WaitFor(flight)) return;

  // that build belongs to another caller and its deadline; never clear it from here
  auto lock = registry_->Lock();
  if (auto it = flights_.find(session_id); it != flights_.end() && it->second == flight) {
    throw util::BuildTimeout("session " + session_id + " is still building another document set after " +
                             std::to_string(options_.build_timeout.count()) + "ms");
  }
}

// ------------------------------------------------------------------
// Build (worker thread)
// ------------------------------------------------------------------

void ContextCache::RunBuild(const std::string& session_id, const std::shared_ptr<Flight>& flight, const std::vector<std::string>& ordered_ids,
                            const std::string& user_id) {
  observability::SpanScope span("kag.context.build");
  span.SetAttribute("session.id", session_id);
  span.SetAttribute("documents", static_cast<std::int64_t>(ordered_ids.size()));

  const auto started_at = std::chrono::steady_clock::now();
  KAG_LOG_INFO("Context rebuild started", {StringField("session_id", session_id), IntField("documents", static_cast<int64_t>(ordered_ids.size()))});

  std::exception_ptr failure;
  try {
    auto       built    = Build(session_id, ordered_ids, user_id);
    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at);
    if (!Install(session_id, flight, std::move(built), duration)) {
      failure = std::make_exception_ptr(util::BuildError("context build for session " + session_id + " was superseded"));
    }
  } catch (const util::NoContent& e) {
    Abandon(session_id, flight, false);
    observability::Metrics::Instance().ObserveContextBuildMs("no_content", ElapsedMs(started_at));
    KAG_LOG_WARN("Context rebuild aborted: no content", {StringField("session_id", session_id), StringField("error", e.what())});
    failure = std::current_exception();
  } catch (const util::BuildError& e) {
    span.RecordException(e.what());
    Abandon(session_id, flight, true);
    observability::Metrics::Instance().ObserveContextBuildMs("failed", ElapsedMs(started_at));
    KAG_LOG_ERROR("Context build failed", {StringField("session_id", session_id), StringField("error", e.what())});
    failure = std::current_exception();
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    Abandon(session_id, flight, true);
    observability::Metrics::Instance().ObserveContextBuildMs("failed", ElapsedMs(started_at));
    KAG_LOG_ERROR("Context build failed", {StringField("session_id", session_id), StringField("error", e.what())});
    failure = std::make_exception_ptr(util::BuildError(e.what()));
  }

  if (failure) {
    flight->done.set_exception(failure);
  } else {
    flight->done.set_value();
  }
}

ContextCache::BuiltContext ContextCache::Build(const std::string& session_id, const std::vector<std::string>& ordered_ids,
                                               const std::string& user_id) const {
  std::vector<std::string> segments;
  for (const auto& document_id : ordered_ids) {
    std::vector<std::string> found;
    try {
      found = user_id.empty() ? segments_->GetSegments(document_id) : segments_->GetSegmentsForUser(document_id, user_id);
    } catch (const std::exception& e) {
      KAG_LOG_WARN("Document skipped: segment lookup failed",
                   {StringField("session_id", session_id), StringField("document_id", document_id), StringField("error", e.what())});
      continue;
    }

    if (found.empty()) {
      KAG_LOG_WARN("Document skipped: no segments", {StringField("session_id", session_id), StringField("document_id", document_id)});
      continue;
    }
    segments.insert(segments.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
  }

  if (segments.empty()) {
    throw util::NoContent("no usable segments for session " + session_id);
  }

  // segment i ends at ends[i] in the joined text
  std::string              text;
  std::vector<std::size_t> ends;
  ends.reserve(segments.size());
  for (const auto& segment : segments) {
    if (!text.empty()) text.append(kSegmentSeparator);
    text.append(segment);
    ends.push_back(text.size());
  }

  std::size_t kept = segments.size();
  if (options_.max_context_tokens > 0) {
    while (kept > 1 && util::EstimateTokens(std::string_view(text).substr(0, ends[kept - 1])) > options_.max_context_tokens) {
      --kept;
    }
    if (kept < segments.size()) {
      KAG_LOG_WARN("Context exceeds token budget; trailing segments dropped",
                   {StringField("session_id", session_id), IntField("dropped", static_cast<int64_t>(segments.size() - kept)),
                    IntField("max_context_tokens", options_.max_context_tokens)});
      text.resize(ends[kept - 1]);
    }
  }

  auto handle = builder_->Build(text, options_.params);
  if (!handle) {
    throw util::BuildError("engine returned no context");
  }
  return {std::move(handle), kept, util::EstimateTokens(text)};
}

bool ContextCache::Install(const std::string& session_id, const std::shared_ptr<Flight>& flight, BuiltContext built,
                           std::chrono::milliseconds duration) {
  uint64_t active = 0;
  {
    auto       lock    = registry_->Lock();
    auto       it      = flights_.find(session_id);
    const bool current = it != flights_.end() && it->second == flight;

    if (!current || !registry_->ExistsLocked(session_id)) {
      if (current) flights_.erase(it);
      lock.unlock();
      KAG_LOG_WARN("Discarding late context build", {StringField("session_id", session_id), IntField("duration_ms", duration.count())});
      return false;
    }
    flights_.erase(it);

    CacheEntry entry;
    entry.handle           = std::move(built.handle);
    entry.fingerprint      = flight->fingerprint;
    entry.built_at         = util::Now();
    entry.build_duration   = duration;
    entry.segment_count    = built.segment_count;
    entry.estimated_tokens = built.estimated_tokens;
    entries_[session_id]   = std::move(entry);

    registry_->ReplaceDocumentsLocked(session_id, flight->fingerprint);
    ++builds_;
    active = entries_.size();
  }

  observability::Metrics::Instance().SetActiveContexts(active);
  observability::Metrics::Instance().ObserveContextBuildMs("built", static_cast<double>(duration.count()));
  KAG_LOG_INFO("Context rebuild finished",
               {StringField("session_id", session_id), IntField("duration_ms", duration.count()),
                IntField("segments", static_cast<int64_t>(built.segment_count)), IntField("estimated_tokens", static_cast<int64_t>(built.estimated_tokens))});
  return true;
}

void ContextCache::Abandon(const std::string& session_id, const std::shared_ptr<Flight>& flight, bool failed) {
  auto lock = registry_->Lock();
  // a timed-out flight was already counted when its marker was cleared
  if (auto it = flights_.find(session_id); it != flights_.end() && it->second == flight) {
    flights_.erase(it);
    if (failed) ++build_failures_;
  }
}

// ------------------------------------------------------------------
// Reads / invalidation
// ------------------------------------------------------------------

engine::ContextHandle ContextCache::Get(const std::string& session_id) const {
  auto lock = registry_->Lock();
  auto it   = entries_.find(session_id);
  return it == entries_.end() ? nullptr : it->second.handle;
}

std::optional<CacheEntry> ContextCache::Entry(const std::string& session_id) const {
  auto lock = registry_->Lock();
  auto it   = entries_.find(session_id);
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

void ContextCache::Clear(const std::string& session_id) {
  uint64_t active = 0;
  bool     erased = false;
  {
    auto lock = registry_->Lock();
    erased    = entries_.erase(session_id) > 0;
    active    = entries_.size();
  }
  if (erased) {
    observability::Metrics::Instance().SetActiveContexts(active);
    KAG_LOG_INFO("Context cleared", {StringField("session_id", session_id)});
  }
}

std::size_t ContextCache::InvalidateDocument(const std::string& document_id) {
  std::size_t dropped   = 0;
  std::size_t restarted = 0;
  uint64_t    active    = 0;
  {
    auto lock = registry_->Lock();
    for (auto it = entries_.begin(); it != entries_.end();) {
      if (it->second.fingerprint.contains(document_id)) {
        it = entries_.erase(it);
        ++dropped;
      } else {
        ++it;
      }
    }
    // builds that may have read the old segments are discarded on completion and restarted by their callers
    for (auto it = flights_.begin(); it != flights_.end();) {
      if (it->second->fingerprint.contains(document_id)) {
        it->second->invalidated = true;
        it                      = flights_.erase(it);
        ++restarted;
      } else {
        ++it;
      }
    }
    active = entries_.size();
  }

  if (restarted > 0) {
    KAG_LOG_INFO("In-flight context builds invalidated by document change",
                 {StringField("document_id", document_id), IntField("builds", static_cast<int64_t>(restarted))});
  }
  if (dropped > 0) {
    observability::Metrics::Instance().SetActiveContexts(active);
    KAG_LOG_INFO("Contexts invalidated by document removal", {StringField("document_id", document_id), IntField("entries", static_cast<int64_t>(dropped))});
  }
  return dropped;
}

void ContextCache::OnSessionRemovedLocked(const std::string& session_id) {
  entries_.erase(session_id);
  // a build still running for this session is discarded on completion
  flights_.erase(session_id);
  observability::Metrics::Instance().SetActiveContexts(entries_.size());
}

CacheStats ContextCache::Stats() const {
  auto lock = registry_->Lock();

  CacheStats stats;
  stats.active_entries = entries_.size();
  for (const auto& [session_id, entry] : entries_) {
    stats.per_session_document_counts[session_id] = entry.fingerprint.size();
    stats.total_document_bindings += entry.fingerprint.size();
  }
  stats.in_flight_builds = flights_.size();
  stats.hits             = hits_;
  stats.misses           = misses_;
  stats.builds           = builds_;
  stats.build_failures   = build_failures_;
  return stats;
}

} // namespace kag::cache
