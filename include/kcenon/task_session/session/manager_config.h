/**
 * @file manager_config.h
 * @brief Configuration of a task manager
 */

#ifndef KCENON_TASK_SESSION_SESSION_MANAGER_CONFIG_H
#define KCENON_TASK_SESSION_SESSION_MANAGER_CONFIG_H

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>

#include "kcenon/task_session/core/callback_executor.h"
#include "kcenon/task_session/core/request.h"
#include "kcenon/task_session/core/types.h"
#include "kcenon/task_session/transport/session_configuration.h"
#include "kcenon/task_session/transport/transport_session.h"

namespace kcenon::task_session {

/**
 * @brief Task manager configuration
 */
struct manager_config {
    /// Configuration handed to the transport session
    session_configuration session;

    /// Where user callbacks run; the main serial queue when null
    std::shared_ptr<callback_executor> executor;

    /// Answers challenges nobody else answers
    std::optional<credential> default_credential;

    /// Operation slots; 0 means the worker pool size
    std::size_t max_concurrent_operations = 0;

    /// Where finished downloads are moved; a "task_session_downloads"
    /// directory under the session's temporary directory when empty
    std::filesystem::path download_directory;

    /// Builds the transport session; the HTTP transport when empty
    transport_factory transport;

    /// Worker threads of the operation pool; 0 auto-detects
    std::size_t worker_count = 0;

    [[nodiscard]] auto effective_download_directory() const -> std::filesystem::path {
        if (!download_directory.empty()) {
            return download_directory;
        }
        return session.effective_temporary_directory() / "task_session_downloads";
    }

    [[nodiscard]] auto validate() const -> result<void> {
        auto session_ok = session.validate();
        if (!session_ok) {
            return session_ok;
        }
        if (default_credential && default_credential->user.empty()) {
            return unexpected{error{error_code::invalid_argument,
                "default credential needs a user name"}};
        }
        if (worker_count > 1024) {
            return unexpected{error{error_code::invalid_argument,
                "worker count must not exceed 1024"}};
        }
        return {};
    }
};

}  // namespace kcenon::task_session

#endif  // KCENON_TASK_SESSION_SESSION_MANAGER_CONFIG_H
