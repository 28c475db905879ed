#ifndef CHUNKD_ENGINE_TYPES_HPP
#define CHUNKD_ENGINE_TYPES_HPP

#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include "engine/engine_error.hpp"

namespace chunkd {
namespace engine {

struct UploadResult {
  EngineError error{EngineError::SUCCESS};
  std::uintmax_t bytes_stored{0};
  std::string message;

  bool ok() const { return error == EngineError::SUCCESS; }
};

struct MergeResult {
  EngineError error{EngineError::SUCCESS};
  std::string artifact_name;
  std::uintmax_t size{0};
  // Lower-case hex SHA-256 of the artifact bytes
  std::string sha256;
  // Smallest absent index when error is MISSING_CHUNK, -1 otherwise
  int64_t missing_index{-1};
  std::string message;

  bool ok() const { return error == EngineError::SUCCESS; }
};

struct FetchResult {
  EngineError error{EngineError::SUCCESS};
  std::uintmax_t size{0};
  std::unique_ptr<std::istream> data;
  std::string message;

  bool ok() const { return error == EngineError::SUCCESS; }
};

// Notified as each chunk is appended to an artifact during a merge.
// An exception thrown from the callback aborts the merge.
class MergeObserver {
public:
  virtual ~MergeObserver() = default;
  virtual void on_chunk_merged(int64_t index, std::uintmax_t bytes) = 0;
};

} // namespace engine
} // namespace chunkd

#endif // CHUNKD_ENGINE_TYPES_HPP
