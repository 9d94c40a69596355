/**
 * @file request.cpp
 * @brief URL helpers for url_request
 */

#include "kcenon/task_session/core/request.h"

#include <algorithm>
#include <cctype>

namespace kcenon::task_session {

namespace {

struct url_parts {
    std::string scheme;
    std::string rest;
};

auto split_scheme(const std::string& url) -> std::optional<url_parts> {
    auto pos = url.find("://");
    if (pos == std::string::npos || pos == 0) {
        return std::nullopt;
    }

    auto scheme = url.substr(0, pos);
    if (!std::isalpha(static_cast<unsigned char>(scheme.front()))) {
        return std::nullopt;
    }
    auto valid_char = [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
    };
    if (!std::all_of(scheme.begin(), scheme.end(), valid_char)) {
        return std::nullopt;
    }

    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return url_parts{scheme, url.substr(pos + 3)};
}

auto extract_host(const std::string& rest) -> std::string {
    auto authority = rest.substr(0, rest.find_first_of("/?#"));
    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    // IPv6 literal
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        return close == std::string::npos ? std::string{} : authority.substr(1, close - 1);
    }
    return authority.substr(0, authority.find(':'));
}

}  // namespace

auto url_request::scheme() const -> std::string {
    auto parts = split_scheme(url);
    return parts ? parts->scheme : std::string{};
}

auto url_request::host() const -> std::string {
    auto parts = split_scheme(url);
    return parts ? extract_host(parts->rest) : std::string{};
}

auto is_valid_url(const std::string& url) -> bool {
    if (url.empty()) {
        return false;
    }
    if (std::any_of(url.begin(), url.end(),
                    [](unsigned char c) { return std::isspace(c) != 0; })) {
        return false;
    }

    auto parts = split_scheme(url);
    if (!parts || parts->rest.empty()) {
        return false;
    }
    if (parts->scheme == "file") {
        return parts->rest.find('/') != std::string::npos;
    }
    return !extract_host(parts->rest).empty();
}

}  // namespace kcenon::task_session
