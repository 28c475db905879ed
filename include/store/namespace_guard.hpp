#ifndef CHUNKD_STORE_NAMESPACE_GUARD_HPP
#define CHUNKD_STORE_NAMESPACE_GUARD_HPP

#include <cstddef>
#include <filesystem>
#include <string>

namespace chunkd {
namespace store {

// Longest identifier accepted as a single path component
constexpr std::size_t MAX_COMPONENT_LENGTH = 255;

// True if name can be used as one path component without leaving its parent:
// non-empty, at most MAX_COMPONENT_LENGTH bytes, no leading '.', no '..',
// no '/' or '\\', no NUL or other control characters.
bool is_safe_component(const std::string& name);

// Throws InvalidKeyError naming `what` if name fails is_safe_component
void require_safe_component(const std::string& name, const std::string& what);

// True if candidate resolves to a location strictly below root
bool is_within(const std::filesystem::path& root, const std::filesystem::path& candidate);

} // namespace store
} // namespace chunkd

#endif // CHUNKD_STORE_NAMESPACE_GUARD_HPP
