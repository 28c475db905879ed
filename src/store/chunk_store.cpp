#include "store/chunk_store.hpp"
#include "store/namespace_guard.hpp"
#include "crypto/digest.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <fstream>
#include <limits>
#include <system_error>

namespace chunkd {
namespace store {

//==============================================
// CONSTRUCTOR
//==============================================

ChunkStore::ChunkStore(const std::filesystem::path& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Chunk store: Initializing ChunkStore with base path: " << base_path_.string();
  check_directory_exists(base_path_);
  BOOST_LOG_TRIVIAL(debug) << "Chunk store: Store directory created/verified at: " << base_path_.string();
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::uintmax_t ChunkStore::put(const std::string& session_key, int64_t index, std::istream& data) {
  BOOST_LOG_TRIVIAL(info) << "Chunk store: Storing chunk " << index << " for session: " << session_key;

  std::filesystem::path file_path = chunk_path(session_key, index);

  if (!data.good()) {
    BOOST_LOG_TRIVIAL(error) << "Chunk store: Invalid input stream for chunk " << index
                             << " of session: " << session_key;
    throw StoreError("Chunk store: Invalid input stream");
  }

  check_directory_exists(file_path.parent_path());

  // Every writer gets its own temporary so concurrent puts to one slot never interleave
  std::filesystem::path temp_path = temp_path_for(file_path);
  BOOST_LOG_TRIVIAL(debug) << "Chunk store: Writing through temporary: " << temp_path.string();

  std::uintmax_t bytes_written = 0;
  try {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw StoreError("Chunk store: Failed to create file: " + temp_path.string());
    }

    char buffer[4096];

    // Read input stream in blocks and write to file
    while (data.read(buffer, sizeof(buffer))) {
      file.write(buffer, data.gcount());
      bytes_written += data.gcount();
    }

    // Handle final partial block if present
    if (data.gcount() > 0) {
      file.write(buffer, data.gcount());
      bytes_written += data.gcount();
    }

    if (data.bad()) {
      throw StoreError("Chunk store: Input stream failed while reading chunk data");
    }

    file.flush();
    if (!file) {
      throw StoreError("Chunk store: Failed to write file: " + temp_path.string());
    }
    file.close();

    std::filesystem::rename(temp_path, file_path);
  }
  catch (const std::filesystem::filesystem_error& e) {
    std::error_code ec;
    std::filesystem::remove(temp_path, ec);
    BOOST_LOG_TRIVIAL(error) << "Chunk store: Failed to publish chunk " << index << ": " << e.what();
    throw StoreError(std::string("Chunk store: Failed to publish chunk: ") + e.what());
  }
  catch (...) {
    std::error_code ec;
    std::filesystem::remove(temp_path, ec);
    throw;
  }

  BOOST_LOG_TRIVIAL(info) << "Chunk store: Successfully stored " << bytes_written << " bytes for chunk "
                          << index << " of session: " << session_key;
  return bytes_written;
}

std::uintmax_t ChunkStore::get(const std::string& session_key, int64_t index, std::ostream& output) const {
  BOOST_LOG_TRIVIAL(info) << "Chunk store: Retrieving chunk " << index << " for session: " << session_key;

  auto file = open(session_key, index);

  char buffer[4096];
  std::uintmax_t total_bytes = 0;

  // Read file in blocks to handle large chunks efficiently
  while (file->read(buffer, sizeof(buffer))) {
    output.write(buffer, file->gcount());
    total_bytes += file->gcount();
  }

  // Handle final partial block if any
  if (file->gcount() > 0) {
    output.write(buffer, file->gcount());
    total_bytes += file->gcount();
  }

  if (!output.good()) {
    throw StoreError("Chunk store: Failed to write to output stream");
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunk store: Streamed " << total_bytes << " bytes for chunk " << index;
  return total_bytes;
}

std::unique_ptr<std::istream> ChunkStore::open(const std::string& session_key, int64_t index) const {
  std::filesystem::path file_path = chunk_path(session_key, index);
  verify_file_exists(file_path);

  // Open file in binary mode; a rename that lands afterwards does not affect this handle
  auto file = std::make_unique<std::ifstream>(file_path, std::ios::binary);
  if (!*file) {
    throw StoreError("Chunk store: Failed to open file: " + file_path.string());
  }
  return file;
}

void ChunkStore::remove(const std::string& session_key) {
  BOOST_LOG_TRIVIAL(info) << "Chunk store: Removing chunks of session: " << session_key;

  std::filesystem::path area = session_path(session_key);

  std::error_code ec;
  std::uintmax_t removed = std::filesystem::remove_all(area, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Chunk store: Failed to remove session " << session_key << ": " << ec.message();
    throw StoreError("Chunk store: Failed to remove session: " + ec.message());
  }

  BOOST_LOG_TRIVIAL(info) << "Chunk store: Removed " << removed << " entries for session: " << session_key;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool ChunkStore::exists(const std::string& session_key, int64_t index) const {
  std::filesystem::path file_path = chunk_path(session_key, index);

  std::error_code ec;
  bool exists = std::filesystem::is_regular_file(file_path, ec);

  BOOST_LOG_TRIVIAL(debug) << "Chunk store: Chunk " << index << " of " << session_key
                           << (exists ? " exists" : " not found");
  return exists;
}

std::uintmax_t ChunkStore::size(const std::string& session_key, int64_t index) const {
  std::filesystem::path file_path = chunk_path(session_key, index);
  verify_file_exists(file_path);
  return std::filesystem::file_size(file_path);
}

std::set<int64_t> ChunkStore::list_indices(const std::string& session_key) const {
  std::set<int64_t> indices;
  std::filesystem::path area = session_path(session_key);

  std::error_code ec;
  if (!std::filesystem::is_directory(area, ec)) {
    return indices;
  }

  for (const auto& entry : std::filesystem::directory_iterator(area)) {
    if (!entry.is_regular_file() || is_temporary(entry.path())) {
      continue;
    }
    if (auto index = parse_index(entry.path().filename().string())) {
      indices.insert(*index);
    }
  }
  return indices;
}

std::vector<std::string> ChunkStore::list_sessions() const {
  std::vector<std::string> sessions;
  for (const auto& entry : std::filesystem::directory_iterator(base_path_)) {
    const std::string name = entry.path().filename().string();
    if (entry.is_directory() && is_safe_component(name)) {
      sessions.push_back(name);
    }
  }
  return sessions;
}

std::optional<std::filesystem::file_time_type> ChunkStore::last_write_time(const std::string& session_key) const {
  std::filesystem::path area = session_path(session_key);

  std::error_code ec;
  if (!std::filesystem::is_directory(area, ec)) {
    return std::nullopt;
  }

  auto newest = std::filesystem::last_write_time(area, ec);
  if (ec) {
    return std::nullopt;
  }
  for (const auto& entry : std::filesystem::directory_iterator(area)) {
    if (entry.is_regular_file() && !is_temporary(entry.path())) {
      newest = std::max(newest, entry.last_write_time());
    }
  }
  return newest;
}


//==============================================
// MAINTENANCE
//==============================================

std::size_t ChunkStore::purge_temporaries() {
  std::size_t purged = 0;
  for (const auto& session : std::filesystem::directory_iterator(base_path_)) {
    if (!session.is_directory()) {
      continue;
    }
    for (const auto& entry : std::filesystem::directory_iterator(session.path())) {
      if (entry.is_regular_file() && is_temporary(entry.path())) {
        std::error_code ec;
        if (std::filesystem::remove(entry.path(), ec)) {
          ++purged;
        }
      }
    }
  }

  if (purged > 0) {
    BOOST_LOG_TRIVIAL(warning) << "Chunk store: Purged " << purged << " interrupted chunk writes";
  }
  return purged;
}


//==============================================
// PATH RESOLUTION
//==============================================

std::filesystem::path ChunkStore::session_path(const std::string& session_key) const {
  require_safe_component(session_key, "session key");
  return base_path_ / session_key;
}

std::filesystem::path ChunkStore::chunk_path(const std::string& session_key, int64_t index) const {
  if (index < 0) {
    throw InvalidKeyError("chunk index must be non-negative, got " + std::to_string(index));
  }
  return session_path(session_key) / std::to_string(index);
}

std::filesystem::path ChunkStore::temp_path_for(const std::filesystem::path& chunk_file) const {
  std::string name = "." + chunk_file.filename().string() + "." + crypto::random_hex(8) + ".tmp";
  return chunk_file.parent_path() / name;
}


//==============================================
// UTILITY METHODS
//==============================================

void ChunkStore::check_directory_exists(const std::filesystem::path& path) const {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  // Another writer may have created it concurrently
  if (!std::filesystem::is_directory(path)) {
    BOOST_LOG_TRIVIAL(error) << "Chunk store: Failed to create directory " << path.string() << ": " << ec.message();
    throw StoreError("Chunk store: Failed to create directory: " + path.string());
  }
}

void ChunkStore::verify_file_exists(const std::filesystem::path& file_path) const {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file_path, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "Chunk store: File not found: " << file_path.string();
    throw NotFoundError(file_path.filename().string());
  }
}

bool ChunkStore::is_temporary(const std::filesystem::path& file_path) {
  const std::string name = file_path.filename().string();
  return !name.empty() && name.front() == '.' && file_path.extension() == ".tmp";
}

std::optional<int64_t> ChunkStore::parse_index(const std::string& name) {
  // Canonical decimal only: no sign, no leading zeros
  if (name.empty() || name.size() > 19 || (name.size() > 1 && name.front() == '0')) {
    return std::nullopt;
  }

  int64_t value = 0;
  for (char c : name) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    const int digit = c - '0';
    if (value > (std::numeric_limits<int64_t>::max() - digit) / 10) {
      return std::nullopt;
    }
    value = value * 10 + digit;
  }
  return value;
}

} // namespace store
} // namespace chunkd
