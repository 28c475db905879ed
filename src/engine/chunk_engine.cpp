#include "engine/chunk_engine.hpp"
#include "store/namespace_guard.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace chunkd {
namespace engine {

//==============================================
// CONSTRUCTOR
//==============================================

ChunkEngine::ChunkEngine(const config::EngineConfig& config)
  : config_(checked(config))
  , chunk_store_(config_.storage_root / "chunks")
  , artifact_store_(config_.storage_root / "artifacts", config_.storage_root / "staging")
  , merge_engine_(chunk_store_, artifact_store_, registry_, config_.merge_buffer_size)
  , retrieval_(artifact_store_) {
  BOOST_LOG_TRIVIAL(info) << "Chunk engine: Storage root: " << config_.storage_root.string();
  recover();
}

const config::EngineConfig& ChunkEngine::checked(const config::EngineConfig& config) {
  if (config.storage_root.empty()) {
    throw std::invalid_argument("Chunk engine: storage root must be set");
  }
  if (config.merge_buffer_size == 0) {
    throw std::invalid_argument("Chunk engine: merge buffer size must be positive");
  }
  return config;
}


//==============================================
// CORE OPERATIONS
//==============================================

UploadResult ChunkEngine::upload_chunk(const std::string& session_key, int64_t index, std::istream& data) {
  UploadResult result;

  if (!store::is_safe_component(session_key)) {
    BOOST_LOG_TRIVIAL(warning) << "Chunk engine: Rejecting upload with unsafe session key";
    result.error = EngineError::INVALID_INPUT;
    result.message = "Invalid session key";
    return result;
  }
  if (index < 0) {
    BOOST_LOG_TRIVIAL(warning) << "Chunk engine: Rejecting negative chunk index " << index;
    result.error = EngineError::INVALID_INPUT;
    result.message = "Invalid chunk index";
    return result;
  }

  EngineError admitted = registry_.begin_upload(session_key);
  if (admitted != EngineError::SUCCESS) {
    result.error = admitted;
    result.message = engine_error_to_string(admitted);
    return result;
  }

  try {
    result.bytes_stored = chunk_store_.put(session_key, index, data);
    registry_.record_chunk(session_key, index);
    result.message = "Chunk received";
  }
  catch (const store::InvalidKeyError& e) {
    result.error = EngineError::INVALID_INPUT;
    result.message = e.what();
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Chunk engine: Upload of chunk " << index << " to " << session_key
                             << " failed: " << e.what();
    result.error = EngineError::STORAGE_FAILURE;
    result.message = e.what();
  }

  registry_.end_upload(session_key);
  return result;
}

MergeResult ChunkEngine::merge(const std::string& session_key, int64_t total_chunks,
                               const std::string& original_filename) {
  return merge_engine_.merge(session_key, total_chunks, original_filename);
}

FetchResult ChunkEngine::fetch(const std::string& artifact_name) const {
  return retrieval_.fetch(artifact_name);
}


//==============================================
// SESSION MANAGEMENT
//==============================================

std::optional<session::SessionSnapshot> ChunkEngine::session_status(const std::string& session_key) const {
  return registry_.status(session_key);
}

std::vector<std::string> ChunkEngine::sessions() const {
  return registry_.sessions();
}

std::vector<std::string> ChunkEngine::artifacts() const {
  try {
    return artifact_store_.list();
  }
  catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Chunk engine: Failed to list artifacts: " << e.what();
    return {};
  }
}

std::optional<std::uintmax_t> ChunkEngine::artifact_size(const std::string& artifact_name) const {
  return retrieval_.stat(artifact_name);
}

std::size_t ChunkEngine::collect_expired_sessions(std::chrono::seconds ttl, session::Clock::time_point now) {
  std::size_t collected = 0;

  for (const auto& key : registry_.claim_expired(ttl, now)) {
    try {
      chunk_store_.remove(key);
      registry_.forget(key);
      ++collected;
      BOOST_LOG_TRIVIAL(info) << "Chunk engine: Collected expired session " << key;
    }
    catch (const store::StoreError& e) {
      BOOST_LOG_TRIVIAL(error) << "Chunk engine: Failed to collect session " << key << ": " << e.what();
      registry_.reopen(key);
    }
  }
  return collected;
}


//==============================================
// GETTERS AND SETTERS
//==============================================

void ChunkEngine::set_merge_observer(std::shared_ptr<MergeObserver> observer) {
  merge_engine_.set_observer(std::move(observer));
}


//==============================================
// RECOVERY
//==============================================

void ChunkEngine::recover() {
  std::size_t temporaries = chunk_store_.purge_temporaries();
  std::size_t staged = artifact_store_.purge_staging();
  std::size_t sessions = registry_.rebuild(chunk_store_);

  BOOST_LOG_TRIVIAL(info) << "Chunk engine: Recovered " << sessions << " sessions (purged "
                          << temporaries << " chunk temporaries, " << staged << " staged artifacts)";
}

} // namespace engine
} // namespace chunkd
