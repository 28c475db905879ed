#ifndef CHUNKD_ENGINE_CHUNK_ENGINE_HPP
#define CHUNKD_ENGINE_CHUNK_ENGINE_HPP

#include <chrono>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "config/config.hpp"
#include "engine/engine_types.hpp"
#include "engine/merge_engine.hpp"
#include "engine/retrieval_service.hpp"
#include "session/session_registry.hpp"
#include "store/artifact_store.hpp"
#include "store/chunk_store.hpp"

namespace chunkd {
namespace engine {

// Entry point for request handlers. Owns the storage areas under the
// configured root and never throws from its operations: every outcome is
// reported through a result struct.
class ChunkEngine {
public:
  // ---- CONSTRUCTOR ----
  // Creates the storage areas and recovers sessions persisted by a previous run
  explicit ChunkEngine(const config::EngineConfig& config);

  ChunkEngine(const ChunkEngine&) = delete;
  ChunkEngine& operator=(const ChunkEngine&) = delete;


  // ---- CORE OPERATIONS ----
  UploadResult upload_chunk(const std::string& session_key, int64_t index, std::istream& data);
  MergeResult merge(const std::string& session_key, int64_t total_chunks, const std::string& original_filename);
  FetchResult fetch(const std::string& artifact_name) const;


  // ---- SESSION MANAGEMENT ----
  std::optional<session::SessionSnapshot> session_status(const std::string& session_key) const;
  std::vector<std::string> sessions() const;
  std::vector<std::string> artifacts() const;
  std::optional<std::uintmax_t> artifact_size(const std::string& artifact_name) const;
  // Deletes chunks and metadata of sessions idle for longer than ttl; returns the count
  std::size_t collect_expired_sessions(std::chrono::seconds ttl,
                                       session::Clock::time_point now = session::Clock::now());


  // ---- GETTERS AND SETTERS ----
  void set_merge_observer(std::shared_ptr<MergeObserver> observer);
  const config::EngineConfig& get_config() const { return config_; }
  MergeEngine& get_merge_engine() { return merge_engine_; }
  session::SessionRegistry& get_registry() { return registry_; }
  store::ChunkStore& get_chunk_store() { return chunk_store_; }
  store::ArtifactStore& get_artifact_store() { return artifact_store_; }

private:
  // ---- PARAMETERS ----
  config::EngineConfig config_;

  // Components, in dependency order
  store::ChunkStore chunk_store_;
  store::ArtifactStore artifact_store_;
  session::SessionRegistry registry_;
  MergeEngine merge_engine_;
  RetrievalService retrieval_;


  // ---- RECOVERY ----
  void recover();
  static const config::EngineConfig& checked(const config::EngineConfig& config);
};

} // namespace engine
} // namespace chunkd

#endif // CHUNKD_ENGINE_CHUNK_ENGINE_HPP
