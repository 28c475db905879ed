#ifndef CHUNKD_ENGINE_ERROR_HPP
#define CHUNKD_ENGINE_ERROR_HPP

#include <cstdint>

namespace chunkd {
namespace engine {

enum class EngineError : uint8_t {
    SUCCESS = 0,
    INVALID_INPUT,
    MISSING_CHUNK,
    NOT_FOUND,
    STORAGE_FAILURE,
    MERGE_IN_PROGRESS,
    SESSION_CLOSED,
    BAD_REQUEST
};

inline const char* engine_error_to_string(EngineError error) {
    switch (error) {
        case EngineError::SUCCESS: return "Success";
        case EngineError::INVALID_INPUT: return "Invalid input";
        case EngineError::MISSING_CHUNK: return "Missing chunk";
        case EngineError::NOT_FOUND: return "Not found";
        case EngineError::STORAGE_FAILURE: return "Storage failure";
        case EngineError::MERGE_IN_PROGRESS: return "Merge in progress";
        case EngineError::SESSION_CLOSED: return "Session closed";
        case EngineError::BAD_REQUEST: return "Bad request";
        default: return "Undefined error";
    }
}

// Client faults are the caller's to fix; everything else is a server fault
inline bool is_client_error(EngineError error) {
    return error == EngineError::INVALID_INPUT || error == EngineError::MISSING_CHUNK ||
           error == EngineError::NOT_FOUND || error == EngineError::BAD_REQUEST;
}

} // namespace engine
} // namespace chunkd

#endif // CHUNKD_ENGINE_ERROR_HPP
