#ifndef CHUNKD_SESSION_REGISTRY_HPP
#define CHUNKD_SESSION_REGISTRY_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include "engine/engine_error.hpp"
#include "store/chunk_store.hpp"

namespace chunkd {
namespace session {

using Clock = std::chrono::steady_clock;

enum class SessionState : uint8_t {
    OPEN = 0,
    MERGING,
    EXPIRING
};

const char* session_state_to_string(SessionState state);

// Copy of a session's metadata at one instant
struct SessionSnapshot {
  std::string session_key;
  SessionState state{SessionState::OPEN};
  std::set<int64_t> received;
  std::size_t uploads_in_flight{0};
  Clock::duration idle{};
};

// In-memory metadata of upload sessions. The chunk store stays the source of
// truth: rebuild() reconstructs this state from it after a restart.
class SessionRegistry {
public:
  // ---- CONSTRUCTOR ----
  SessionRegistry() = default;

  SessionRegistry(const SessionRegistry&) = delete;
  SessionRegistry& operator=(const SessionRegistry&) = delete;


  // ---- UPLOAD TRACKING ----
  // Admits an upload unless the session is merging or being collected
  engine::EngineError begin_upload(const std::string& session_key);
  // Marks an index received, creating the session if needed
  void record_chunk(const std::string& session_key, int64_t index);
  void end_upload(const std::string& session_key);


  // ---- MERGE CONTROL ----
  // Closes the session to uploads and waits for in-flight uploads to drain
  engine::EngineError begin_merge(const std::string& session_key);
  // Returns a merging or expiring session to OPEN
  void reopen(const std::string& session_key);
  // Drops all metadata for the session
  void forget(const std::string& session_key);


  // ---- QUERY OPERATIONS ----
  std::set<int64_t> received_indices(const std::string& session_key) const;
  std::optional<SessionSnapshot> status(const std::string& session_key) const;
  std::vector<std::string> sessions() const;
  std::size_t size() const;


  // ---- EXPIRY AND RECOVERY ----
  // Moves idle OPEN sessions to EXPIRING and returns their keys; ttl of zero disables expiry
  std::vector<std::string> claim_expired(std::chrono::seconds ttl, Clock::time_point now = Clock::now());
  // Loads sessions persisted in the store; returns the number of sessions loaded
  std::size_t rebuild(const store::ChunkStore& chunk_store);

private:
  struct Session {
    std::mutex mutex;
    std::condition_variable drained;
    SessionState state{SessionState::OPEN};
    std::set<int64_t> received;
    std::size_t uploads_in_flight{0};
    Clock::time_point last_activity{Clock::now()};
    // Set once the entry has been erased from the map
    bool retired{false};
  };

  // ---- PARAMETERS ----
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;


  // ---- LOOKUP ----
  std::shared_ptr<Session> find(const std::string& session_key) const;
  std::shared_ptr<Session> find_or_create(const std::string& session_key);
};

} // namespace session
} // namespace chunkd

#endif // CHUNKD_SESSION_REGISTRY_HPP
