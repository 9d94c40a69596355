/**
 * @file session_configuration.h
 * @brief Configuration of one transport session
 */

#ifndef KCENON_TASK_SESSION_TRANSPORT_SESSION_CONFIGURATION_H
#define KCENON_TASK_SESSION_TRANSPORT_SESSION_CONFIGURATION_H

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "kcenon/task_session/core/types.h"

namespace kcenon::task_session {

/**
 * @brief Transport session configuration
 */
struct session_configuration {
    /// Set for background sessions; unique per process
    std::optional<std::string> background_identifier;

    /// Timeout applied to requests that do not carry one
    std::chrono::milliseconds request_timeout{60000};

    /// Maximum simultaneous connections to one host
    std::size_t max_connections_per_host = 6;

    /// Headers added to every request unless the request sets them
    std::map<std::string, std::string> additional_headers;

    /// Directory for transient download files; system temp dir when empty
    std::filesystem::path temporary_directory;

    [[nodiscard]] static auto default_configuration() -> session_configuration {
        return {};
    }

    [[nodiscard]] static auto background(std::string identifier) -> session_configuration {
        session_configuration config;
        config.background_identifier = std::move(identifier);
        return config;
    }

    [[nodiscard]] auto is_background() const noexcept -> bool {
        return background_identifier.has_value();
    }

    /**
     * @brief Directory transient downloads go to
     */
    [[nodiscard]] auto effective_temporary_directory() const -> std::filesystem::path {
        if (!temporary_directory.empty()) {
            return temporary_directory;
        }
        std::error_code ec;
        auto dir = std::filesystem::temp_directory_path(ec);
        return ec ? std::filesystem::path{"."} : dir;
    }

    [[nodiscard]] auto validate() const -> result<void> {
        if (background_identifier && background_identifier->empty()) {
            return unexpected{error{error_code::invalid_argument,
                "background identifier must not be empty"}};
        }
        if (request_timeout.count() <= 0) {
            return unexpected{error{error_code::invalid_argument,
                "request timeout must be positive"}};
        }
        if (max_connections_per_host == 0) {
            return unexpected{error{error_code::invalid_argument,
                "max connections per host must be positive"}};
        }
        return {};
    }
};

}  // namespace kcenon::task_session

#endif  // KCENON_TASK_SESSION_TRANSPORT_SESSION_CONFIGURATION_H
