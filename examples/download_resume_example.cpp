/**
 * @file download_resume_example.cpp
 * @brief Download a file, pause it with resume data, then continue
 *
 * This example demonstrates:
 * - Download tasks relocated into a download directory
 * - Cancelling with resume data after a byte threshold
 * - Continuing the download from the resume data
 */

#include <kcenon/task_session/task_session.h>

#include <atomic>
#include <filesystem>
#include <future>
#include <iostream>
#include <string>

using namespace kcenon::task_session;

namespace {

struct download_outcome {
    std::optional<std::filesystem::path> location;
    std::optional<error> err;
};

auto run_download(task_manager& manager,
                  result<std::shared_ptr<download_task_operation>> created) -> bool {
    if (!created.has_value()) {
        std::cerr << "Failed to create download: " << created.error().message << std::endl;
        return false;
    }
    auto enqueued = manager.enqueue(created.value());
    if (!enqueued.has_value()) {
        std::cerr << "Failed to enqueue: " << enqueued.error().message << std::endl;
        return false;
    }
    return true;
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Download Resume Example - Task Session" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <url>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -d, --dir <path>        Download directory (default: ./downloads)" << std::endl;
    std::cout << "  --pause-after <bytes>   Pause once this many bytes arrived (default: 65536)" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string url;
    std::filesystem::path directory = "downloads";
    uint64_t pause_after = 65536;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-d" || arg == "--dir") {
            if (++i >= argc) {
                std::cerr << "Error: --dir requires an argument" << std::endl;
                return 1;
            }
            directory = argv[i];
        } else if (arg == "--pause-after") {
            if (++i >= argc) {
                std::cerr << "Error: --pause-after requires an argument" << std::endl;
                return 1;
            }
            pause_after = std::stoull(argv[i]);
        } else if (arg[0] != '-') {
            url = arg;
        }
    }

    if (url.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    auto manager_result = task_manager::builder()
        .with_download_directory(directory)
        .build();
    if (!manager_result.has_value()) {
        std::cerr << "Failed to create manager: " << manager_result.error().message << std::endl;
        return 1;
    }
    auto& manager = manager_result.value();

    auto on_complete = [](std::promise<download_outcome>& promise) {
        return [&promise](download_task_operation&, std::optional<std::filesystem::path> location,
                          std::optional<error> err) {
            promise.set_value(download_outcome{std::move(location), std::move(err)});
        };
    };

    // First attempt, paused after the threshold
    std::promise<download_outcome> first;
    std::atomic<bool> pausing{false};
    auto paused = manager.create_download_task(
        url,
        [&pausing, pause_after](download_task_operation& op, uint64_t, uint64_t total,
                                int64_t expected) {
            std::cout << "\rWritten " << total << " / "
                      << (expected == transfer_size_unknown ? std::string("?")
                                                            : std::to_string(expected))
                      << std::flush;
            if (total >= pause_after && !pausing.exchange(true)) {
                op.cancel_producing_resume_data();
            }
        },
        on_complete(first));
    if (!run_download(manager, std::move(paused))) {
        return 1;
    }

    auto outcome = first.get_future().get();
    std::cout << std::endl;

    if (outcome.location) {
        std::cout << "Finished before the pause: " << outcome.location->string() << std::endl;
        return 0;
    }
    if (!outcome.err || outcome.err->code != error_code::cancelled || !outcome.err->resume_data) {
        std::cerr << "Download failed: "
                  << (outcome.err ? outcome.err->message : std::string("unknown")) << std::endl;
        return 1;
    }

    std::cout << "Paused with " << outcome.err->resume_data->size()
              << " bytes of resume data, continuing" << std::endl;

    // Second attempt from the resume data
    std::promise<download_outcome> second;
    auto resumed = manager.create_download_task(
        *outcome.err->resume_data,
        [](download_task_operation&, uint64_t, uint64_t total, int64_t) {
            std::cout << "\rWritten " << total << std::flush;
        },
        on_complete(second));
    if (!run_download(manager, std::move(resumed))) {
        return 1;
    }

    auto final_outcome = second.get_future().get();
    std::cout << std::endl;
    if (final_outcome.err) {
        std::cerr << "Resumed download failed: " << final_outcome.err->message << std::endl;
        return 1;
    }

    std::cout << "Saved to " << final_outcome.location->string() << std::endl;
    return 0;
}
