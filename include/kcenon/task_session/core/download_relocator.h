/**
 * @file download_relocator.h
 * @brief Moves transient download files to a permanent location
 */

#ifndef KCENON_TASK_SESSION_CORE_DOWNLOAD_RELOCATOR_H
#define KCENON_TASK_SESSION_CORE_DOWNLOAD_RELOCATOR_H

#include <filesystem>
#include <string>

#include "kcenon/task_session/core/types.h"

namespace kcenon::task_session {

/**
 * @brief Relocates the temporary file a download task finished into
 *
 * The transport deletes the transient file once its did-finish event
 * returns, so relocation always happens synchronously on the delivering
 * thread.
 *
 * @code
 * download_relocator relocator("/var/cache/app/downloads");
 * auto moved = relocator.relocate(transient, "report.pdf");
 * if (moved) {
 *     // moved.value() is "/var/cache/app/downloads/report.pdf" or
 *     // "report-1.pdf" when that name was taken
 * }
 * @endcode
 */
class download_relocator {
public:
    /**
     * @brief Construct a relocator for a directory
     * @param directory Destination directory, created on first use
     */
    explicit download_relocator(std::filesystem::path directory);

    /**
     * @brief Move a transient file into the destination directory
     * @param transient File the transport downloaded to
     * @param suggested_name File name to use; the transient file's name when empty
     * @return Final location or a file error
     */
    [[nodiscard]] auto relocate(const std::filesystem::path& transient,
                                const std::string& suggested_name = {}) const
        -> result<std::filesystem::path>;

    /**
     * @brief Move a file to an exact destination, replacing any existing file
     *
     * Renames when possible and falls back to copy and remove across
     * file systems. Missing parent directories are created.
     */
    [[nodiscard]] static auto move_file(const std::filesystem::path& from,
                                        const std::filesystem::path& to)
        -> result<std::filesystem::path>;

    /**
     * @brief Suggested file name for a URL
     *
     * Last non-empty path segment without query or fragment, or
     * "download" when the URL has none.
     */
    [[nodiscard]] static auto file_name_for_url(const std::string& url) -> std::string;

    [[nodiscard]] auto directory() const -> const std::filesystem::path&;

private:
    [[nodiscard]] auto unique_destination(const std::string& name) const -> std::filesystem::path;

    std::filesystem::path directory_;
};

}  // namespace kcenon::task_session

#endif  // KCENON_TASK_SESSION_CORE_DOWNLOAD_RELOCATOR_H
