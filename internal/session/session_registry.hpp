#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "session.hpp"

namespace kag::session {

/*
  Session bookkeeping.

  Two tables behind one mutex: sessions by id and session ids by owning user.
  The context cache shares this mutex (Lock() plus the *Locked methods) so a
  cache entry swap and a session delete can never interleave.

  The registry never starts a rebuild.
*/
class SessionRegistry {
 public:
  // Invoked with the registry lock held, once per removed session.
  using RemovalListener = std::function<void(const std::string& session_id)>;

  SessionRegistry() = default;

  SessionRegistry(const SessionRegistry&)            = delete;
  SessionRegistry& operator=(const SessionRegistry&) = delete;

  std::unique_lock<std::mutex> Lock() const;

  Session                GetOrCreate(const std::string& session_id, const std::string& user_id);
  std::optional<Session> Get(const std::string& session_id);

  // Missing sessions are logged and ignored.
  void RecordTurn(const std::string& session_id, const std::vector<ChatMessage>& input_messages, const ChatMessage& output_message);

  void BindDocuments(const std::string& session_id, const std::vector<std::string>& document_ids);

  bool Delete(const std::string& session_id);

  std::vector<SessionSummary> ListForUser(const std::string& user_id) const;
  RegistryStats               Stats() const;

  // Removes every session idle for longer than timeout; returns their ids.
  std::vector<std::string> EvictIdle(util::TimePoint now, std::chrono::seconds timeout);

  uint64_t AddRemovalListener(RemovalListener listener);
  void     RemoveRemovalListener(uint64_t id);

  // ------------------------------------------------------------------
  // Caller holds Lock()
  // ------------------------------------------------------------------

  Session&              GetOrCreateLocked(const std::string& session_id, const std::string& user_id);
  bool                  ExistsLocked(const std::string& session_id) const;
  void                  ReplaceDocumentsLocked(const std::string& session_id, std::set<std::string> document_ids);

 private:
  bool RemoveLocked(const std::string& session_id, const char* reason);

  static SessionSummary Summarize(const Session& session);

  mutable std::mutex mutex_;

  std::unordered_map<std::string, Session>               sessions_;
  std::unordered_map<std::string, std::set<std::string>> by_user_;

  std::map<uint64_t, RemovalListener> listeners_;
  uint64_t                            next_listener_id_ = 1;
};

} // namespace kag::session
