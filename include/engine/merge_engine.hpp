#ifndef CHUNKD_ENGINE_MERGE_ENGINE_HPP
#define CHUNKD_ENGINE_MERGE_ENGINE_HPP

#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "engine/engine_types.hpp"
#include "session/session_registry.hpp"
#include "store/artifact_store.hpp"
#include "store/chunk_store.hpp"

namespace chunkd {
namespace engine {

// Reassembles a session's chunks 0..total-1 into one artifact.
// At most one merge runs per session. A concurrent request with the same
// total and filename joins the running merge and receives its result; one
// with different parameters gets MERGE_IN_PROGRESS.
class MergeEngine {
public:
  // ---- CONSTRUCTOR ----
  MergeEngine(store::ChunkStore& chunk_store,
              store::ArtifactStore& artifact_store,
              session::SessionRegistry& registry,
              std::size_t buffer_size = 64 * 1024);

  MergeEngine(const MergeEngine&) = delete;
  MergeEngine& operator=(const MergeEngine&) = delete;


  // ---- MERGE OPERATIONS ----
  MergeResult merge(const std::string& session_key, int64_t total_chunks, const std::string& original_filename);


  // ---- GETTERS AND SETTERS ----
  void set_observer(std::shared_ptr<MergeObserver> observer);
  bool is_merging(const std::string& session_key) const;
  // Number of callers waiting on the running merge of a session
  std::size_t joined_count(const std::string& session_key) const;
  std::size_t get_buffer_size() const { return buffer_size_; }

private:
  struct InFlight {
    int64_t total_chunks;
    std::string original_filename;
    std::shared_future<MergeResult> result;
    std::size_t joined{0};
  };

  // ---- PARAMETERS ----
  store::ChunkStore& chunk_store_;
  store::ArtifactStore& artifact_store_;
  session::SessionRegistry& registry_;
  std::size_t buffer_size_;

  mutable std::mutex observer_mutex_;
  std::shared_ptr<MergeObserver> observer_;

  mutable std::mutex in_flight_mutex_;
  std::unordered_map<std::string, InFlight> in_flight_;


  // ---- MERGE STAGES ----
  std::optional<MergeResult> validate(const std::string& session_key, int64_t total_chunks,
                                      const std::string& original_filename) const;
  // Runs with the session held in MERGING; never throws
  MergeResult run_merge(const std::string& session_key, int64_t total_chunks, const std::string& original_filename);
  MergeResult stream_chunks(const std::string& session_key, int64_t total_chunks, const std::string& artifact_name);
  void notify_chunk_merged(int64_t index, std::uintmax_t bytes);
  void cleanup_session(const std::string& session_key);
  // Returns a session to OPEN after a failed merge, or drops it when it holds no chunks
  void release_session(const std::string& session_key);

  static MergeResult failure(EngineError error, const std::string& message);
};

} // namespace engine
} // namespace chunkd

#endif // CHUNKD_ENGINE_MERGE_ENGINE_HPP
