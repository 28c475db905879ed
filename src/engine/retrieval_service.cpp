#include "engine/retrieval_service.hpp"
#include <boost/log/trivial.hpp>
#include <ios>

namespace chunkd {
namespace engine {

RetrievalService::RetrievalService(const store::ArtifactStore& artifact_store)
  : artifact_store_(artifact_store) {}

FetchResult RetrievalService::fetch(const std::string& artifact_name) const {
  FetchResult result;
  try {
    // Size comes from the opened file so a concurrent replace cannot split the two
    result.data = artifact_store_.open(artifact_name);
    result.data->seekg(0, std::ios::end);
    const std::streamoff end = result.data->tellg();
    result.data->seekg(0, std::ios::beg);
    if (end < 0 || !*result.data) {
      throw store::StoreError("Retrieval: Failed to size " + artifact_name);
    }
    result.size = static_cast<std::uintmax_t>(end);
    result.message = "OK";
    BOOST_LOG_TRIVIAL(info) << "Retrieval: Serving " << artifact_name << " (" << result.size << " bytes)";
  }
  catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(info) << "Retrieval: " << artifact_name << " unavailable: " << e.what();
    result.error = EngineError::NOT_FOUND;
    result.size = 0;
    result.data.reset();
    result.message = "File not found";
  }
  return result;
}

std::optional<std::uintmax_t> RetrievalService::stat(const std::string& artifact_name) const {
  try {
    return artifact_store_.size(artifact_name);
  }
  catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(debug) << "Retrieval: Stat of " << artifact_name << " failed: " << e.what();
    return std::nullopt;
  }
}

std::optional<std::uintmax_t> RetrievalService::copy_to(const std::string& artifact_name, std::ostream& output) const {
  FetchResult fetched = fetch(artifact_name);
  if (!fetched.ok()) {
    return std::nullopt;
  }

  char buffer[4096];
  std::uintmax_t total_bytes = 0;

  while (fetched.data->read(buffer, sizeof(buffer))) {
    output.write(buffer, fetched.data->gcount());
    total_bytes += fetched.data->gcount();
  }

  if (fetched.data->gcount() > 0) {
    output.write(buffer, fetched.data->gcount());
    total_bytes += fetched.data->gcount();
  }

  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Retrieval: Failed to write " << artifact_name << " to output";
    return std::nullopt;
  }
  return total_bytes;
}

} // namespace engine
} // namespace chunkd
