#include "session/session_registry.hpp"
#include "store/store_error.hpp"
#include <boost/log/trivial.hpp>
#include <filesystem>

namespace chunkd {
namespace session {

using engine::EngineError;

const char* session_state_to_string(SessionState state) {
  switch (state) {
    case SessionState::OPEN: return "OPEN";
    case SessionState::MERGING: return "MERGING";
    case SessionState::EXPIRING: return "EXPIRING";
    default: return "UNKNOWN";
  }
}


//==============================================
// UPLOAD TRACKING
//==============================================

EngineError SessionRegistry::begin_upload(const std::string& session_key) {
  for (;;) {
    auto session = find_or_create(session_key);
    std::lock_guard<std::mutex> lock(session->mutex);

    // Entry was erased between lookup and lock; look it up again
    if (session->retired) {
      continue;
    }

    if (session->state != SessionState::OPEN) {
      BOOST_LOG_TRIVIAL(warning) << "Session registry: Rejecting upload to " << session_key
                                 << " in state " << session_state_to_string(session->state);
      return EngineError::SESSION_CLOSED;
    }

    ++session->uploads_in_flight;
    session->last_activity = Clock::now();
    return EngineError::SUCCESS;
  }
}

void SessionRegistry::record_chunk(const std::string& session_key, int64_t index) {
  for (;;) {
    auto session = find_or_create(session_key);
    std::lock_guard<std::mutex> lock(session->mutex);
    if (session->retired) {
      continue;
    }

    session->received.insert(index);
    session->last_activity = Clock::now();
    BOOST_LOG_TRIVIAL(debug) << "Session registry: Recorded chunk " << index << " for " << session_key
                             << " (" << session->received.size() << " received)";
    return;
  }
}

void SessionRegistry::end_upload(const std::string& session_key) {
  auto session = find(session_key);
  if (!session) {
    return;
  }

  std::lock_guard<std::mutex> lock(session->mutex);
  if (session->uploads_in_flight > 0) {
    --session->uploads_in_flight;
  }
  session->last_activity = Clock::now();

  if (session->uploads_in_flight == 0) {
    session->drained.notify_all();
  }
}


//==============================================
// MERGE CONTROL
//==============================================

EngineError SessionRegistry::begin_merge(const std::string& session_key) {
  for (;;) {
    auto session = find_or_create(session_key);
    std::unique_lock<std::mutex> lock(session->mutex);
    if (session->retired) {
      continue;
    }

    if (session->state == SessionState::MERGING) {
      return EngineError::MERGE_IN_PROGRESS;
    }
    if (session->state == SessionState::EXPIRING) {
      return EngineError::SESSION_CLOSED;
    }

    // New uploads are refused from here on; wait for admitted ones to land
    session->state = SessionState::MERGING;
    if (session->uploads_in_flight > 0) {
      BOOST_LOG_TRIVIAL(debug) << "Session registry: Merge of " << session_key << " waiting for "
                               << session->uploads_in_flight << " uploads";
    }
    session->drained.wait(lock, [&session] { return session->uploads_in_flight == 0; });

    BOOST_LOG_TRIVIAL(debug) << "Session registry: Session " << session_key << " closed for merge";
    return EngineError::SUCCESS;
  }
}

void SessionRegistry::reopen(const std::string& session_key) {
  auto session = find(session_key);
  if (!session) {
    return;
  }

  std::lock_guard<std::mutex> lock(session->mutex);
  session->state = SessionState::OPEN;
  session->last_activity = Clock::now();
  BOOST_LOG_TRIVIAL(debug) << "Session registry: Session " << session_key << " reopened";
}

void SessionRegistry::forget(const std::string& session_key) {
  std::shared_ptr<Session> session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_key);
    if (it == sessions_.end()) {
      return;
    }
    session = it->second;
    sessions_.erase(it);
  }

  std::lock_guard<std::mutex> lock(session->mutex);
  session->retired = true;
  BOOST_LOG_TRIVIAL(debug) << "Session registry: Forgot session " << session_key;
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::set<int64_t> SessionRegistry::received_indices(const std::string& session_key) const {
  auto session = find(session_key);
  if (!session) {
    return {};
  }

  std::lock_guard<std::mutex> lock(session->mutex);
  return session->received;
}

std::optional<SessionSnapshot> SessionRegistry::status(const std::string& session_key) const {
  auto session = find(session_key);
  if (!session) {
    return std::nullopt;
  }

  std::lock_guard<std::mutex> lock(session->mutex);
  SessionSnapshot snapshot;
  snapshot.session_key = session_key;
  snapshot.state = session->state;
  snapshot.received = session->received;
  snapshot.uploads_in_flight = session->uploads_in_flight;
  snapshot.idle = Clock::now() - session->last_activity;
  return snapshot;
}

std::vector<std::string> SessionRegistry::sessions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> keys;
  keys.reserve(sessions_.size());
  for (const auto& entry : sessions_) {
    keys.push_back(entry.first);
  }
  return keys;
}

std::size_t SessionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}


//==============================================
// EXPIRY AND RECOVERY
//==============================================

std::vector<std::string> SessionRegistry::claim_expired(std::chrono::seconds ttl, Clock::time_point now) {
  std::vector<std::string> claimed;
  if (ttl.count() <= 0) {
    return claimed;
  }

  std::vector<std::pair<std::string, std::shared_ptr<Session>>> candidates;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    candidates.assign(sessions_.begin(), sessions_.end());
  }

  for (auto& candidate : candidates) {
    std::lock_guard<std::mutex> lock(candidate.second->mutex);
    Session& session = *candidate.second;

    // Merging sessions and sessions with uploads in progress are never collected
    if (session.retired || session.state != SessionState::OPEN || session.uploads_in_flight > 0) {
      continue;
    }
    if (now - session.last_activity <= ttl) {
      continue;
    }

    session.state = SessionState::EXPIRING;
    claimed.push_back(candidate.first);
  }

  if (!claimed.empty()) {
    BOOST_LOG_TRIVIAL(info) << "Session registry: Claimed " << claimed.size() << " expired sessions";
  }
  return claimed;
}

std::size_t SessionRegistry::rebuild(const store::ChunkStore& chunk_store) {
  BOOST_LOG_TRIVIAL(info) << "Session registry: Rebuilding from chunk store at " << chunk_store.base_path().string();

  std::size_t loaded = 0;
  for (const auto& key : chunk_store.list_sessions()) {
    try {
      auto indices = chunk_store.list_indices(key);

      auto session = find_or_create(key);
      std::lock_guard<std::mutex> lock(session->mutex);
      session->received.insert(indices.begin(), indices.end());

      // Carry the on-disk age over so restarts do not extend a session's lifetime
      if (auto written = chunk_store.last_write_time(key)) {
        auto age = std::filesystem::file_time_type::clock::now() - *written;
        if (age.count() > 0) {
          session->last_activity = Clock::now() - std::chrono::duration_cast<Clock::duration>(age);
        }
      }
      ++loaded;
    }
    catch (const store::StoreError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Session registry: Skipping session " << key << " during rebuild: " << e.what();
    }
    catch (const std::filesystem::filesystem_error& e) {
      BOOST_LOG_TRIVIAL(warning) << "Session registry: Skipping session " << key << " during rebuild: " << e.what();
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Session registry: Rebuilt " << loaded << " sessions";
  return loaded;
}


//==============================================
// LOOKUP
//==============================================

std::shared_ptr<SessionRegistry::Session> SessionRegistry::find(const std::string& session_key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_key);
  return it == sessions_.end() ? nullptr : it->second;
}

std::shared_ptr<SessionRegistry::Session> SessionRegistry::find_or_create(const std::string& session_key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& slot = sessions_[session_key];
  if (!slot) {
    slot = std::make_shared<Session>();
    BOOST_LOG_TRIVIAL(debug) << "Session registry: Created session " << session_key;
  }
  return slot;
}

} // namespace session
} // namespace chunkd
