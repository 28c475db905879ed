#ifndef CHUNKD_STORE_ARTIFACT_STORE_HPP
#define CHUNKD_STORE_ARTIFACT_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <string>
#include <vector>
#include "store/store_error.hpp"

namespace chunkd {
namespace store {

class ArtifactStore;

// Artifact being written in the staging area. Nothing is visible under the
// artifact name until publish() renames it; destruction without publish()
// deletes the staged file.
class StagedArtifact {
public:
  // Only an ArtifactStore can mint one, so only it can create staged files
  class Token {
    friend class ArtifactStore;
    Token() {}
  };

  StagedArtifact(Token, const ArtifactStore& owner, std::filesystem::path path);
  ~StagedArtifact();

  StagedArtifact(const StagedArtifact&) = delete;
  StagedArtifact& operator=(const StagedArtifact&) = delete;

  // ---- WRITE OPERATIONS ----
  void write(const char* data, std::size_t size);
  // Flushes, closes and atomically renames onto the artifact name
  void publish(const std::string& artifact_name);
  // Deletes the staged file; safe to call more than once
  void discard();

  // ---- GETTERS ----
  std::uintmax_t bytes_written() const { return bytes_written_; }
  const std::filesystem::path& path() const { return path_; }
  bool published() const { return published_; }

private:
  const ArtifactStore& owner_;
  std::filesystem::path path_;
  std::ofstream file_;
  std::uintmax_t bytes_written_{0};
  bool published_{false};
};

// Finalized artifacts under {artifact_path}/{name}; staged writes under
// {staging_path}, which must be on the same filesystem for rename to be atomic.
class ArtifactStore {
public:
  // ---- CONSTRUCTOR ----
  ArtifactStore(const std::filesystem::path& artifact_path, const std::filesystem::path& staging_path);


  // ---- NAMING ----
  // Deterministic artifact name for a merged session
  static std::string artifact_name_for(const std::string& session_key, const std::string& original_filename);


  // ---- CORE STORAGE OPERATIONS ----
  // Opens a fresh staged file
  std::unique_ptr<StagedArtifact> stage() const;
  // Opens a published artifact for reading; throws NotFoundError
  std::unique_ptr<std::istream> open(const std::string& artifact_name) const;
  // Returns true if an artifact was deleted
  bool remove(const std::string& artifact_name);


  // ---- QUERY OPERATIONS ----
  bool exists(const std::string& artifact_name) const;
  std::uintmax_t size(const std::string& artifact_name) const;
  std::vector<std::string> list() const;
  // Validates the name and confirms it stays inside the artifact area
  std::filesystem::path resolve(const std::string& artifact_name) const;


  // ---- MAINTENANCE ----
  // Deletes staged files left behind by interrupted merges; returns the count
  std::size_t purge_staging();

  const std::filesystem::path& artifact_path() const { return artifact_path_; }
  const std::filesystem::path& staging_path() const { return staging_path_; }

private:
  std::filesystem::path artifact_path_;
  std::filesystem::path staging_path_;

  void check_directory_exists(const std::filesystem::path& path) const;
};

} // namespace store
} // namespace chunkd

#endif // CHUNKD_STORE_ARTIFACT_STORE_HPP
