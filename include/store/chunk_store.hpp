#ifndef CHUNKD_STORE_CHUNK_STORE_HPP
#define CHUNKD_STORE_CHUNK_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>
#include "store/store_error.hpp"

namespace chunkd {
namespace store {

// Durable mapping (session key, chunk index) -> bytes.
// Layout: {base_path}/{session_key}/{index}; writes land in a hidden
// temporary beside the slot and are renamed over it.
class ChunkStore {
public:

  // ---- CONSTRUCTOR ----
  explicit ChunkStore(const std::filesystem::path& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  // Stores data at the slot, replacing previous bytes; returns bytes written
  std::uintmax_t put(const std::string& session_key, int64_t index, std::istream& data);
  // Streams slot bytes into output; returns bytes copied
  std::uintmax_t get(const std::string& session_key, int64_t index, std::ostream& output) const;
  // Opens the slot for sequential reading
  std::unique_ptr<std::istream> open(const std::string& session_key, int64_t index) const;
  // Removes all chunks of a session; removing an unknown session is not an error
  void remove(const std::string& session_key);


  // ---- QUERY OPERATIONS ----
  bool exists(const std::string& session_key, int64_t index) const;
  std::uintmax_t size(const std::string& session_key, int64_t index) const;
  // Indices currently persisted for a session, ignoring temporaries
  std::set<int64_t> list_indices(const std::string& session_key) const;
  // Session keys that have a storage area
  std::vector<std::string> list_sessions() const;
  // Newest write time among the session's chunks, or of the area itself when empty
  std::optional<std::filesystem::file_time_type> last_write_time(const std::string& session_key) const;


  // ---- MAINTENANCE ----
  // Deletes temporaries left behind by interrupted writes; returns the count
  std::size_t purge_temporaries();

  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Root path for all session areas
  std::filesystem::path base_path_;


  // ---- PATH RESOLUTION ----
  // Validates the key and returns its storage area
  std::filesystem::path session_path(const std::string& session_key) const;
  // Validates key and index and returns the slot path
  std::filesystem::path chunk_path(const std::string& session_key, int64_t index) const;
  std::filesystem::path temp_path_for(const std::filesystem::path& chunk_file) const;


  // ---- UTILITY METHODS ----
  void check_directory_exists(const std::filesystem::path& path) const;
  void verify_file_exists(const std::filesystem::path& file_path) const;
  static bool is_temporary(const std::filesystem::path& file_path);
  static std::optional<int64_t> parse_index(const std::string& name);
};

} // namespace store
} // namespace chunkd

#endif // CHUNKD_STORE_CHUNK_STORE_HPP
