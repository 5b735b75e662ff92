#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace kag::session {

struct ChatMessage {
  std::string role;
  std::string content;
  std::string name;
};

/*
  One conversation.

  document_ids is the bound set; after a successful rebuild it equals the
  fingerprint of the session's cached context.
*/
struct Session {
  std::string id;
  std::string user_id;

  util::TimePoint created_at;
  util::TimePoint last_accessed_at;

  std::vector<ChatMessage> turns;
  std::set<std::string>    document_ids;
};

struct SessionSummary {
  std::string     id;
  std::string     user_id;
  util::TimePoint created_at;
  util::TimePoint last_accessed_at;
  uint64_t        message_count  = 0;
  uint64_t        document_count = 0;
};

struct RegistryStats {
  uint64_t                        total_sessions = 0;
  uint64_t                        total_users    = 0;
  std::map<std::string, uint64_t> sessions_per_user;
};

} // namespace kag::session
