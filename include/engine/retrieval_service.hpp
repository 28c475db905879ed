#ifndef CHUNKD_ENGINE_RETRIEVAL_SERVICE_HPP
#define CHUNKD_ENGINE_RETRIEVAL_SERVICE_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include "engine/engine_types.hpp"
#include "store/artifact_store.hpp"

namespace chunkd {
namespace engine {

// Read access to finalized artifacts. Any name that is unsafe, escapes the
// artifact area or does not name a regular file is reported as NOT_FOUND.
class RetrievalService {
public:
  explicit RetrievalService(const store::ArtifactStore& artifact_store);

  FetchResult fetch(const std::string& artifact_name) const;
  std::optional<std::uintmax_t> stat(const std::string& artifact_name) const;
  // Streams the artifact into output; returns bytes copied or nullopt if absent
  std::optional<std::uintmax_t> copy_to(const std::string& artifact_name, std::ostream& output) const;

private:
  const store::ArtifactStore& artifact_store_;
};

} // namespace engine
} // namespace chunkd

#endif // CHUNKD_ENGINE_RETRIEVAL_SERVICE_HPP
