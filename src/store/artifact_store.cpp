#include "store/artifact_store.hpp"
#include "store/namespace_guard.hpp"
#include "crypto/digest.hpp"
#include <boost/log/trivial.hpp>
#include <system_error>

namespace chunkd {
namespace store {

//==============================================
// STAGED ARTIFACT
//==============================================

StagedArtifact::StagedArtifact(Token, const ArtifactStore& owner, std::filesystem::path path)
  : owner_(owner)
  , path_(std::move(path))
  , file_(path_, std::ios::binary | std::ios::trunc) {
  if (!file_) {
    BOOST_LOG_TRIVIAL(error) << "Artifact store: Failed to create staging file: " << path_.string();
    throw StoreError("Artifact store: Failed to create staging file: " + path_.string());
  }
  BOOST_LOG_TRIVIAL(debug) << "Artifact store: Staging artifact at: " << path_.string();
}

StagedArtifact::~StagedArtifact() {
  if (!published_) {
    discard();
  }
}

void StagedArtifact::write(const char* data, std::size_t size) {
  if (published_) {
    throw StoreError("Artifact store: Write to an already published artifact");
  }
  if (!file_.write(data, static_cast<std::streamsize>(size))) {
    BOOST_LOG_TRIVIAL(error) << "Artifact store: Failed to write " << size << " bytes to " << path_.string();
    throw StoreError("Artifact store: Failed to write staging file");
  }
  bytes_written_ += size;
}

void StagedArtifact::publish(const std::string& artifact_name) {
  std::filesystem::path final_path = owner_.resolve(artifact_name);

  file_.flush();
  if (!file_) {
    throw StoreError("Artifact store: Failed to flush staging file");
  }
  file_.close();

  std::error_code ec;
  std::filesystem::rename(path_, final_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Artifact store: Failed to publish " << artifact_name << ": " << ec.message();
    throw StoreError("Artifact store: Failed to publish artifact: " + ec.message());
  }

  published_ = true;
  BOOST_LOG_TRIVIAL(info) << "Artifact store: Published artifact " << artifact_name
                          << " (" << bytes_written_ << " bytes)";
}

void StagedArtifact::discard() {
  if (file_.is_open()) {
    file_.close();
  }
  std::error_code ec;
  if (std::filesystem::remove(path_, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "Artifact store: Discarded staging file: " << path_.string();
  } else if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Artifact store: Failed to discard staging file " << path_.string()
                               << ": " << ec.message();
  }
}


//==============================================
// CONSTRUCTOR
//==============================================

ArtifactStore::ArtifactStore(const std::filesystem::path& artifact_path, const std::filesystem::path& staging_path)
  : artifact_path_(artifact_path)
  , staging_path_(staging_path) {
  BOOST_LOG_TRIVIAL(info) << "Artifact store: Initializing with artifact path: " << artifact_path_.string()
                          << ", staging path: " << staging_path_.string();
  check_directory_exists(artifact_path_);
  check_directory_exists(staging_path_);
}


//==============================================
// NAMING
//==============================================

std::string ArtifactStore::artifact_name_for(const std::string& session_key, const std::string& original_filename) {
  return session_key + "_merged_" + original_filename;
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::unique_ptr<StagedArtifact> ArtifactStore::stage() const {
  std::filesystem::path path = staging_path_ / (crypto::random_hex(12) + ".part");
  return std::make_unique<StagedArtifact>(StagedArtifact::Token(), *this, path);
}

std::unique_ptr<std::istream> ArtifactStore::open(const std::string& artifact_name) const {
  std::filesystem::path path = resolve(artifact_name);

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw NotFoundError(artifact_name);
  }

  auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
  if (!*file) {
    throw NotFoundError(artifact_name);
  }
  return file;
}

bool ArtifactStore::remove(const std::string& artifact_name) {
  std::filesystem::path path = resolve(artifact_name);

  std::error_code ec;
  bool removed = std::filesystem::remove(path, ec);
  if (ec) {
    throw StoreError("Artifact store: Failed to remove artifact: " + ec.message());
  }
  if (removed) {
    BOOST_LOG_TRIVIAL(info) << "Artifact store: Removed artifact: " << artifact_name;
  }
  return removed;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool ArtifactStore::exists(const std::string& artifact_name) const {
  std::error_code ec;
  return std::filesystem::is_regular_file(resolve(artifact_name), ec);
}

std::uintmax_t ArtifactStore::size(const std::string& artifact_name) const {
  std::filesystem::path path = resolve(artifact_name);

  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    throw NotFoundError(artifact_name);
  }
  return size;
}

std::vector<std::string> ArtifactStore::list() const {
  std::vector<std::string> names;
  for (const auto& entry : std::filesystem::directory_iterator(artifact_path_)) {
    const std::string name = entry.path().filename().string();
    if (entry.is_regular_file() && is_safe_component(name)) {
      names.push_back(name);
    }
  }
  return names;
}

std::filesystem::path ArtifactStore::resolve(const std::string& artifact_name) const {
  require_safe_component(artifact_name, "artifact name");

  std::filesystem::path path = artifact_path_ / artifact_name;
  if (!is_within(artifact_path_, path)) {
    BOOST_LOG_TRIVIAL(warning) << "Artifact store: Name resolves outside artifact area: " << artifact_name;
    throw InvalidKeyError("artifact name resolves outside the artifact area");
  }
  return path;
}


//==============================================
// MAINTENANCE
//==============================================

std::size_t ArtifactStore::purge_staging() {
  std::size_t purged = 0;
  for (const auto& entry : std::filesystem::directory_iterator(staging_path_)) {
    std::error_code ec;
    if (entry.is_regular_file() && std::filesystem::remove(entry.path(), ec)) {
      ++purged;
    }
  }

  if (purged > 0) {
    BOOST_LOG_TRIVIAL(warning) << "Artifact store: Purged " << purged << " interrupted merges from staging";
  }
  return purged;
}


//==============================================
// UTILITY METHODS
//==============================================

void ArtifactStore::check_directory_exists(const std::filesystem::path& path) const {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (!std::filesystem::is_directory(path)) {
    BOOST_LOG_TRIVIAL(error) << "Artifact store: Failed to create directory " << path.string() << ": " << ec.message();
    throw StoreError("Artifact store: Failed to create directory: " + path.string());
  }
}

} // namespace store
} // namespace chunkd
