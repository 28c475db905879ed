#include "engine/merge_engine.hpp"
#include "crypto/digest.hpp"
#include "store/namespace_guard.hpp"
#include "utils/pipeliner.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>
#include <vector>

namespace chunkd {
namespace engine {

//==============================================
// CONSTRUCTOR
//==============================================

MergeEngine::MergeEngine(store::ChunkStore& chunk_store,
                         store::ArtifactStore& artifact_store,
                         session::SessionRegistry& registry,
                         std::size_t buffer_size)
  : chunk_store_(chunk_store)
  , artifact_store_(artifact_store)
  , registry_(registry)
  , buffer_size_(buffer_size) {
  if (buffer_size_ == 0) {
    throw std::invalid_argument("Merge engine: buffer size must be positive");
  }
}


//==============================================
// MERGE OPERATIONS
//==============================================

MergeResult MergeEngine::merge(const std::string& session_key, int64_t total_chunks,
                               const std::string& original_filename) {
  BOOST_LOG_TRIVIAL(info) << "Merge engine: Merge requested for session " << session_key
                          << " (" << total_chunks << " chunks, filename: " << original_filename << ")";

  if (auto invalid = validate(session_key, total_chunks, original_filename)) {
    return *invalid;
  }

  std::promise<MergeResult> promise;
  std::shared_future<MergeResult> running;
  {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    auto it = in_flight_.find(session_key);
    if (it != in_flight_.end()) {
      if (it->second.total_chunks != total_chunks || it->second.original_filename != original_filename) {
        BOOST_LOG_TRIVIAL(warning) << "Merge engine: Conflicting merge for session " << session_key
                                   << " while another is in progress";
        return failure(EngineError::MERGE_IN_PROGRESS, "Merge in progress");
      }
      ++it->second.joined;
      running = it->second.result;
    } else {
      in_flight_.emplace(session_key,
                         InFlight{total_chunks, original_filename, promise.get_future().share(), 0});
    }
  }

  // Join the merge already running for this session
  if (running.valid()) {
    BOOST_LOG_TRIVIAL(debug) << "Merge engine: Joining running merge of session " << session_key;
    return running.get();
  }

  MergeResult result = run_merge(session_key, total_chunks, original_filename);
  {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    in_flight_.erase(session_key);
  }
  promise.set_value(result);
  return result;
}


//==============================================
// GETTERS AND SETTERS
//==============================================

void MergeEngine::set_observer(std::shared_ptr<MergeObserver> observer) {
  std::lock_guard<std::mutex> lock(observer_mutex_);
  observer_ = std::move(observer);
}

bool MergeEngine::is_merging(const std::string& session_key) const {
  std::lock_guard<std::mutex> lock(in_flight_mutex_);
  return in_flight_.count(session_key) > 0;
}

std::size_t MergeEngine::joined_count(const std::string& session_key) const {
  std::lock_guard<std::mutex> lock(in_flight_mutex_);
  auto it = in_flight_.find(session_key);
  return it == in_flight_.end() ? 0 : it->second.joined;
}


//==============================================
// MERGE STAGES
//==============================================

std::optional<MergeResult> MergeEngine::validate(const std::string& session_key, int64_t total_chunks,
                                                 const std::string& original_filename) const {
  if (!store::is_safe_component(session_key)) {
    BOOST_LOG_TRIVIAL(warning) << "Merge engine: Rejecting unsafe session key";
    return failure(EngineError::INVALID_INPUT, "Invalid session key");
  }
  if (!store::is_safe_component(original_filename)) {
    BOOST_LOG_TRIVIAL(warning) << "Merge engine: Rejecting unsafe filename for session " << session_key;
    return failure(EngineError::INVALID_INPUT, "Invalid filename");
  }
  if (total_chunks < 0) {
    BOOST_LOG_TRIVIAL(warning) << "Merge engine: Rejecting negative chunk count " << total_chunks;
    return failure(EngineError::INVALID_INPUT, "Invalid chunk count");
  }
  if (!store::is_safe_component(store::ArtifactStore::artifact_name_for(session_key, original_filename))) {
    BOOST_LOG_TRIVIAL(warning) << "Merge engine: Artifact name too long for session " << session_key;
    return failure(EngineError::INVALID_INPUT, "Artifact name too long");
  }
  return std::nullopt;
}

MergeResult MergeEngine::run_merge(const std::string& session_key, int64_t total_chunks,
                                   const std::string& original_filename) {
  EngineError admitted = registry_.begin_merge(session_key);
  if (admitted != EngineError::SUCCESS) {
    BOOST_LOG_TRIVIAL(warning) << "Merge engine: Session " << session_key << " not mergeable: "
                               << engine_error_to_string(admitted);
    return failure(admitted, engine_error_to_string(admitted));
  }

  try {
    // Completeness gate: nothing is written unless every index is present
    for (int64_t index = 0; index < total_chunks; ++index) {
      if (!chunk_store_.exists(session_key, index)) {
        BOOST_LOG_TRIVIAL(warning) << "Merge engine: Session " << session_key << " is missing chunk " << index;
        release_session(session_key);
        MergeResult missing = failure(EngineError::MISSING_CHUNK, "Missing chunk: " + std::to_string(index));
        missing.missing_index = index;
        return missing;
      }
    }

    const std::string artifact_name = store::ArtifactStore::artifact_name_for(session_key, original_filename);
    MergeResult result = stream_chunks(session_key, total_chunks, artifact_name);
    if (!result.ok()) {
      release_session(session_key);
      return result;
    }

    cleanup_session(session_key);

    BOOST_LOG_TRIVIAL(info) << "Merge engine: Merged " << total_chunks << " chunks of session " << session_key
                            << " into " << artifact_name << " (" << result.size << " bytes, sha256 "
                            << result.sha256 << ")";
    return result;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Merge engine: Merge of session " << session_key << " failed: " << e.what();
    release_session(session_key);
    return failure(EngineError::STORAGE_FAILURE, e.what());
  }
}

MergeResult MergeEngine::stream_chunks(const std::string& session_key, int64_t total_chunks,
                                       const std::string& artifact_name) {
  std::unique_ptr<store::StagedArtifact> staged = artifact_store_.stage();
  crypto::Sha256 hasher;

  int64_t next_index = 0;
  std::unique_ptr<std::istream> current;
  std::uintmax_t chunk_bytes = 0;
  std::vector<char> block(buffer_size_);

  // Lazy producer: one bounded block per call, chunk files opened in index order
  auto producer = [&](std::stringstream& out) -> bool {
    for (;;) {
      if (!current) {
        if (next_index >= total_chunks) {
          return false;
        }
        current = chunk_store_.open(session_key, next_index);
        chunk_bytes = 0;
      }

      current->read(block.data(), static_cast<std::streamsize>(block.size()));
      const std::streamsize got = current->gcount();
      if (got > 0) {
        out.write(block.data(), got);
        chunk_bytes += static_cast<std::uintmax_t>(got);
        return true;
      }
      if (current->bad()) {
        throw store::StoreError("Merge engine: Failed to read chunk " + std::to_string(next_index));
      }

      current.reset();
      notify_chunk_merged(next_index, chunk_bytes);
      ++next_index;
    }
  };

  auto pipeline = utils::Pipeliner::create(producer)
    ->transform([&hasher](std::stringstream& in, std::stringstream& out) {
      const std::string data = in.str();
      hasher.update(data.data(), data.size());
      out.write(data.data(), static_cast<std::streamsize>(data.size()));
      return static_cast<bool>(out);
    });
  pipeline->set_buffer_size(buffer_size_);

  bool drained = pipeline->drain([&staged](const char* data, std::size_t size) {
    staged->write(data, size);
  });

  if (!drained) {
    BOOST_LOG_TRIVIAL(error) << "Merge engine: Streaming session " << session_key << " failed: "
                             << pipeline->last_error();
    staged->discard();
    return failure(EngineError::STORAGE_FAILURE, "Merge failed: " + pipeline->last_error());
  }

  staged->publish(artifact_name);

  MergeResult result;
  result.artifact_name = artifact_name;
  result.size = staged->bytes_written();
  result.sha256 = hasher.finalize_hex();
  result.message = "File merged";
  return result;
}

void MergeEngine::notify_chunk_merged(int64_t index, std::uintmax_t bytes) {
  std::shared_ptr<MergeObserver> observer;
  {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observer = observer_;
  }

  BOOST_LOG_TRIVIAL(debug) << "Merge engine: Appended chunk " << index << " (" << bytes << " bytes)";
  if (observer) {
    observer->on_chunk_merged(index, bytes);
  }
}

void MergeEngine::release_session(const std::string& session_key) {
  // A key that never received a chunk must not stay registered after a failed merge
  bool has_chunks = !registry_.received_indices(session_key).empty();
  if (!has_chunks) {
    try {
      has_chunks = !chunk_store_.list_indices(session_key).empty();
    }
    catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(warning) << "Merge engine: Could not list chunks of " << session_key << ": " << e.what();
      has_chunks = true;
    }
  }

  if (has_chunks) {
    registry_.reopen(session_key);
  } else {
    BOOST_LOG_TRIVIAL(debug) << "Merge engine: Dropping empty session " << session_key;
    registry_.forget(session_key);
  }
}

void MergeEngine::cleanup_session(const std::string& session_key) {
  // The artifact is already published; a leftover chunk area is only logged
  try {
    chunk_store_.remove(session_key);
  }
  catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Merge engine: Cleanup of session " << session_key << " failed: " << e.what();
  }
  registry_.forget(session_key);
}

MergeResult MergeEngine::failure(EngineError error, const std::string& message) {
  MergeResult result;
  result.error = error;
  result.message = message;
  return result;
}

} // namespace engine
} // namespace chunkd
