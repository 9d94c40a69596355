/**
 * @file download_relocator.cpp
 * @brief Download relocation implementation
 */

#include "kcenon/task_session/core/download_relocator.h"

#include <kcenon/task_session/core/logging.h>

#include <system_error>

namespace kcenon::task_session {

download_relocator::download_relocator(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

auto download_relocator::relocate(const std::filesystem::path& transient,
                                  const std::string& suggested_name) const
    -> result<std::filesystem::path> {
    std::error_code ec;
    if (!std::filesystem::exists(transient, ec)) {
        return unexpected{error{error_code::file_not_found,
            "transient download missing: " + transient.string()}};
    }

    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return unexpected{error{error_code::file_write_error,
            "cannot create download directory: " + ec.message()}};
    }

    auto name = suggested_name.empty() ? transient.filename().string() : suggested_name;
    return move_file(transient, unique_destination(name));
}

auto download_relocator::move_file(const std::filesystem::path& from,
                                   const std::filesystem::path& to)
    -> result<std::filesystem::path> {
    std::error_code ec;
    if (!std::filesystem::exists(from, ec)) {
        return unexpected{error{error_code::file_not_found,
            "transient download missing: " + from.string()}};
    }

    if (to.has_parent_path()) {
        std::filesystem::create_directories(to.parent_path(), ec);
        if (ec) {
            return unexpected{error{error_code::file_write_error,
                "cannot create destination directory: " + ec.message()}};
        }
    }

    std::filesystem::rename(from, to, ec);
    if (!ec) {
        return to;
    }

    // Cross-device move
    TS_LOG_DEBUG(log_category::operation,
                 "Rename failed (" + ec.message() + "), copying instead");
    ec.clear();
    std::filesystem::copy_file(from, to,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return unexpected{error{error_code::file_write_error,
            "cannot copy download to " + to.string() + ": " + ec.message()}};
    }

    std::filesystem::remove(from, ec);
    if (ec) {
        TS_LOG_WARN(log_category::operation,
                    "Transient download not removed: " + ec.message());
    }
    return to;
}

auto download_relocator::file_name_for_url(const std::string& url) -> std::string {
    auto end = url.find_first_of("?#");
    auto path = url.substr(0, end);

    auto scheme_end = path.find("://");
    if (scheme_end != std::string::npos) {
        auto path_start = path.find('/', scheme_end + 3);
        path = path_start == std::string::npos ? std::string{} : path.substr(path_start);
    }

    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    auto slash = path.rfind('/');
    auto name = slash == std::string::npos ? path : path.substr(slash + 1);
    if (name.empty() || name == "." || name == "..") {
        return "download";
    }
    return name;
}

auto download_relocator::directory() const -> const std::filesystem::path& {
    return directory_;
}

auto download_relocator::unique_destination(const std::string& name) const
    -> std::filesystem::path {
    auto candidate = directory_ / name;
    std::error_code ec;
    if (!std::filesystem::exists(candidate, ec)) {
        return candidate;
    }

    auto stem = candidate.stem().string();
    auto extension = candidate.extension().string();
    for (int i = 1;; ++i) {
        candidate = directory_ / (stem + "-" + std::to_string(i) + extension);
        if (!std::filesystem::exists(candidate, ec)) {
            return candidate;
        }
    }
}

}  // namespace kcenon::task_session
