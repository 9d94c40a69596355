/**
 * @file request.h
 * @brief Request, credential and authentication challenge types
 */

#ifndef KCENON_TASK_SESSION_CORE_REQUEST_H
#define KCENON_TASK_SESSION_CORE_REQUEST_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::task_session {

/**
 * @brief Size reported when the transport does not know a total
 */
inline constexpr int64_t transfer_size_unknown = -1;

/**
 * @brief A request handed to the transport
 *
 * Only the fields the routing layer and the bundled HTTP transport look
 * at are modelled; everything else is the transport's business.
 */
struct url_request {
    std::string url;
    std::string method = "GET";
    std::map<std::string, std::string> headers;
    std::optional<std::chrono::milliseconds> timeout;

    url_request() = default;
    explicit url_request(std::string u, std::string m = "GET")
        : url(std::move(u)), method(std::move(m)) {}

    /**
     * @brief Set a header, replacing any previous value
     * @return Reference to this request for chaining
     */
    auto with_header(const std::string& name, const std::string& value) -> url_request& {
        headers[name] = value;
        return *this;
    }

    /**
     * @brief Scheme of the URL ("https" for "https://host/")
     * @return Lower-case scheme or empty string if the URL has none
     */
    [[nodiscard]] auto scheme() const -> std::string;

    /**
     * @brief Host part of the URL without user info and port
     */
    [[nodiscard]] auto host() const -> std::string;
};

/**
 * @brief Check if a URL is usable for a request
 *
 * A URL is valid when it has a scheme of letters, digits, '+', '-' or '.'
 * starting with a letter, followed by "://" and a non-empty remainder.
 * "file" URLs need a path, every other scheme needs a host.
 */
[[nodiscard]] auto is_valid_url(const std::string& url) -> bool;

/**
 * @brief How long a credential should be remembered
 */
enum class credential_persistence {
    none,
    for_session,
    permanent
};

/**
 * @brief User name and password pair
 */
struct credential {
    std::string user;
    std::string password;
    credential_persistence persistence = credential_persistence::for_session;

    [[nodiscard]] auto is_empty() const noexcept -> bool {
        return user.empty() && password.empty();
    }
};

/**
 * @brief Server or proxy area a challenge applies to
 */
struct protection_space {
    std::string host;
    uint16_t port = 0;
    std::string protocol;
    std::string realm;
    std::string authentication_method;
};

/**
 * @brief Authentication challenge raised by the transport
 */
struct auth_challenge {
    protection_space space;
    uint32_t previous_failure_count = 0;
    std::optional<credential> proposed_credential;
};

/**
 * @brief Answer to an authentication challenge
 */
enum class challenge_disposition {
    use_credential,
    perform_default_handling,
    cancel_challenge,
    reject_protection_space
};

[[nodiscard]] constexpr auto to_string(challenge_disposition d) -> const char* {
    switch (d) {
        case challenge_disposition::use_credential:
            return "use_credential";
        case challenge_disposition::perform_default_handling:
            return "perform_default_handling";
        case challenge_disposition::cancel_challenge:
            return "cancel_challenge";
        case challenge_disposition::reject_protection_space:
            return "reject_protection_space";
        default:
            return "unknown";
    }
}

/**
 * @brief Reply callback for a challenge; must be invoked exactly once
 */
using challenge_reply =
    std::function<void(challenge_disposition, std::optional<credential>)>;

}  // namespace kcenon::task_session

#endif  // KCENON_TASK_SESSION_CORE_REQUEST_H
