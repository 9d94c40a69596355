/**
 * @file data_task_example.cpp
 * @brief Fetch a URL into memory with a data task
 *
 * This example demonstrates:
 * - Building a task_manager with the default HTTP transport
 * - Streaming chunks through a progress handler
 * - Waiting for the completion on the main callback queue
 */

#include <kcenon/task_session/task_session.h>

#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

using namespace kcenon::task_session;

namespace {

auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Data Task Example - Task Session" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <url>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -H, --header <k:v>      Add a request header" << std::endl;
    std::cout << "  -t, --timeout <ms>      Request timeout (default: 60000)" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string url;
    std::chrono::milliseconds timeout{60000};
    url_request request;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-H" || arg == "--header") {
            if (++i >= argc) {
                std::cerr << "Error: --header requires an argument" << std::endl;
                return 1;
            }
            std::string header = argv[i];
            auto colon = header.find(':');
            if (colon == std::string::npos) {
                std::cerr << "Error: header must look like name:value" << std::endl;
                return 1;
            }
            request.headers[header.substr(0, colon)] = header.substr(colon + 1);
        } else if (arg == "-t" || arg == "--timeout") {
            if (++i >= argc) {
                std::cerr << "Error: --timeout requires an argument" << std::endl;
                return 1;
            }
            timeout = std::chrono::milliseconds{std::stoll(argv[i])};
        } else if (arg[0] != '-') {
            url = arg;
        }
    }

    if (url.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    if (!http_transport_session::is_available()) {
        std::cerr << "Error: built without the HTTP transport" << std::endl;
        return 1;
    }

    session_configuration session;
    session.request_timeout = timeout;

    auto manager_result = task_manager::builder()
        .with_session_configuration(session)
        .build();
    if (!manager_result.has_value()) {
        std::cerr << "Failed to create manager: " << manager_result.error().message << std::endl;
        return 1;
    }
    auto& manager = manager_result.value();

    request.url = url;

    std::promise<int> done;
    auto task = manager.create_data_task(
        request,
        [](data_task_operation&, const byte_buffer& chunk, uint64_t received, int64_t expected) {
            std::cout << "\rReceived " << format_bytes(received);
            if (expected != transfer_size_unknown) {
                std::cout << " of " << format_bytes(static_cast<uint64_t>(expected));
            }
            std::cout << " (+" << chunk.size() << ")" << std::flush;
        },
        [&done](data_task_operation& op, std::optional<byte_buffer>, std::optional<error> err) {
            std::cout << std::endl;
            if (err) {
                std::cerr << "Task " << op.name() << " failed: " << err->message << std::endl;
                done.set_value(1);
                return;
            }
            std::cout << "Task " << op.name() << " finished" << std::endl;
            done.set_value(0);
        });

    if (!task.has_value()) {
        std::cerr << "Failed to create task: " << task.error().message << std::endl;
        return 1;
    }

    auto enqueued = manager.enqueue(task.value());
    if (!enqueued.has_value()) {
        std::cerr << "Failed to enqueue: " << enqueued.error().message << std::endl;
        return 1;
    }

    return done.get_future().get();
}
