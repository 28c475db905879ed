#include "store/namespace_guard.hpp"
#include "store/store_error.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <system_error>

namespace chunkd {
namespace store {

bool is_safe_component(const std::string& name) {
  if (name.empty() || name.size() > MAX_COMPONENT_LENGTH) {
    return false;
  }

  // Hidden names are reserved for temporaries inside the storage areas
  if (name.front() == '.') {
    return false;
  }

  if (name.find("..") != std::string::npos) {
    return false;
  }

  return std::none_of(name.begin(), name.end(), [](char c) {
    const auto byte = static_cast<unsigned char>(c);
    return c == '/' || c == '\\' || byte < 0x20 || byte == 0x7f;
  });
}

void require_safe_component(const std::string& name, const std::string& what) {
  if (!is_safe_component(name)) {
    BOOST_LOG_TRIVIAL(warning) << "Namespace guard: Rejected " << what << " (" << name.size() << " bytes)";
    throw InvalidKeyError(what + " is not a safe storage name");
  }
}

bool is_within(const std::filesystem::path& root, const std::filesystem::path& candidate) {
  std::error_code ec;
  auto canonical_root = std::filesystem::weakly_canonical(root, ec);
  if (ec) {
    return false;
  }
  auto canonical_candidate = std::filesystem::weakly_canonical(candidate, ec);
  if (ec) {
    return false;
  }

  // Component-wise, so "/a/bc" is not treated as inside "/a/b"
  auto relative = canonical_candidate.lexically_relative(canonical_root);
  if (relative.empty() || relative == ".") {
    return false;
  }
  return *relative.begin() != "..";
}

} // namespace store
} // namespace chunkd
