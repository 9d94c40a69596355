/**
 * @file resume_data.h
 * @brief Encoding of resume data produced by cancelled downloads
 */

#ifndef KCENON_TASK_SESSION_CORE_RESUME_DATA_H
#define KCENON_TASK_SESSION_CORE_RESUME_DATA_H

#include <cstdint>
#include <filesystem>
#include <string>

#include "kcenon/task_session/core/types.h"

namespace kcenon::task_session {

/**
 * @brief Decoded content of resume data
 *
 * Callers treat resume data as opaque bytes; only transports look inside.
 */
struct resume_state {
    std::string url;
    uint64_t bytes_received = 0;
    std::filesystem::path partial_path;
};

/**
 * @brief Encode a resume state as JSON bytes
 *
 * Format:
 * @code
 * {"url": "...", "bytes_received": 1024, "partial_path": "..."}
 * @endcode
 */
[[nodiscard]] auto encode_resume_data(const resume_state& state) -> resume_data;

/**
 * @brief Decode resume data
 * @return Decoded state, or invalid_resume_data when the bytes are not a
 *         resume state with a valid URL
 */
[[nodiscard]] auto decode_resume_data(const resume_data& data) -> result<resume_state>;

}  // namespace kcenon::task_session

#endif  // KCENON_TASK_SESSION_CORE_RESUME_DATA_H
