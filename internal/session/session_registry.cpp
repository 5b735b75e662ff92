#include "session_registry.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace kag::session {

using kag::observability::IntField;
using kag::observability::StringField;

std::unique_lock<std::mutex> SessionRegistry::Lock() const {
  return std::unique_lock<std::mutex>(mutex_);
}

SessionSummary SessionRegistry::Summarize(const Session& session) {
  SessionSummary summary;
  summary.id               = session.id;
  summary.user_id          = session.user_id;
  summary.created_at       = session.created_at;
  summary.last_accessed_at = session.last_accessed_at;
  summary.message_count    = session.turns.size();
  summary.document_count   = session.document_ids.size();
  return summary;
}

// ------------------------------------------------------------------
// Lookup / lifecycle
// ------------------------------------------------------------------

Session SessionRegistry::GetOrCreate(const std::string& session_id, const std::string& user_id) {
  std::lock_guard lock(mutex_);
  return GetOrCreateLocked(session_id, user_id);
}

Session& SessionRegistry::GetOrCreateLocked(const std::string& session_id, const std::string& user_id) {
  const auto now = util::Now();

  if (auto it = sessions_.find(session_id); it != sessions_.end()) {
    it->second.last_accessed_at = now;
    return it->second;
  }

  Session session;
  session.id               = session_id;
  session.user_id          = user_id;
  session.created_at       = now;
  session.last_accessed_at = now;

  by_user_[user_id].insert(session_id);
  auto [it, inserted] = sessions_.emplace(session_id, std::move(session));

  KAG_LOG_INFO("Session created", {StringField("session_id", session_id), StringField("user_id", user_id)});
  return it->second;
}

std::optional<Session> SessionRegistry::Get(const std::string& session_id) {
  std::lock_guard lock(mutex_);

  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) return std::nullopt;

  it->second.last_accessed_at = util::Now();
  return it->second;
}

bool SessionRegistry::ExistsLocked(const std::string& session_id) const {
  return sessions_.contains(session_id);
}

bool SessionRegistry::Delete(const std::string& session_id) {
  std::lock_guard lock(mutex_);
  return RemoveLocked(session_id, "deleted");
}

bool SessionRegistry::RemoveLocked(const std::string& session_id, const char* reason) {
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) return false;

  const auto user_id = it->second.user_id;
  if (auto owner = by_user_.find(user_id); owner != by_user_.end()) {
    owner->second.erase(session_id);
    if (owner->second.empty()) by_user_.erase(owner);
  }
  sessions_.erase(it);

  for (const auto& [_, listener] : listeners_) {
    listener(session_id);
  }

  KAG_LOG_INFO("Session removed", {StringField("session_id", session_id), StringField("user_id", user_id), StringField("reason", reason)});
  return true;
}

// ------------------------------------------------------------------
// Mutation
// ------------------------------------------------------------------

void SessionRegistry::RecordTurn(const std::string& session_id, const std::vector<ChatMessage>& input_messages, const ChatMessage& output_message) {
  std::lock_guard lock(mutex_);

  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    KAG_LOG_WARN("RecordTurn on missing session", {StringField("session_id", session_id)});
    return;
  }

  auto& session = it->second;
  session.turns.insert(session.turns.end(), input_messages.begin(), input_messages.end());
  session.turns.push_back(output_message);
  session.last_accessed_at = util::Now();
}

void SessionRegistry::BindDocuments(const std::string& session_id, const std::vector<std::string>& document_ids) {
  std::lock_guard lock(mutex_);

  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    KAG_LOG_WARN("BindDocuments on missing session", {StringField("session_id", session_id)});
    return;
  }
  it->second.document_ids.insert(document_ids.begin(), document_ids.end());
}

void SessionRegistry::ReplaceDocumentsLocked(const std::string& session_id, std::set<std::string> document_ids) {
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) return;
  it->second.document_ids = std::move(document_ids);
}

// ------------------------------------------------------------------
// Listing / stats
// ------------------------------------------------------------------

std::vector<SessionSummary> SessionRegistry::ListForUser(const std::string& user_id) const {
  std::lock_guard lock(mutex_);

  std::vector<SessionSummary> out;
  auto                        owner = by_user_.find(user_id);
  if (owner == by_user_.end()) return out;

  for (const auto& session_id : owner->second) {
    if (auto it = sessions_.find(session_id); it != sessions_.end()) {
      out.push_back(Summarize(it->second));
    }
  }

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.last_accessed_at > b.last_accessed_at; });
  return out;
}

RegistryStats SessionRegistry::Stats() const {
  std::lock_guard lock(mutex_);

  RegistryStats stats;
  stats.total_sessions = sessions_.size();
  stats.total_users    = by_user_.size();
  for (const auto& [user_id, ids] : by_user_) {
    stats.sessions_per_user[user_id] = ids.size();
  }
  return stats;
}

// ------------------------------------------------------------------
// Eviction
// ------------------------------------------------------------------

std::vector<std::string> SessionRegistry::EvictIdle(util::TimePoint now, std::chrono::seconds timeout) {
  std::lock_guard lock(mutex_);

  std::vector<std::string> expired;
  for (const auto& [id, session] : sessions_) {
    if (now - session.last_accessed_at > timeout) {
      expired.push_back(id);
    }
  }

  for (const auto& id : expired) {
    RemoveLocked(id, "idle");
  }
  return expired;
}

uint64_t SessionRegistry::AddRemovalListener(RemovalListener listener) {
  std::lock_guard lock(mutex_);
  const auto      id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void SessionRegistry::RemoveRemovalListener(uint64_t id) {
  std::lock_guard lock(mutex_);
  listeners_.erase(id);
}

} // namespace kag::session
