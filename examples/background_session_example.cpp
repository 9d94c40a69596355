/**
 * @file background_session_example.cpp
 * @brief Background session with manager-level fallbacks
 *
 * This example demonstrates:
 * - Sharing one manager per background identifier
 * - Handling downloads and completions no operation owns
 * - Answering authentication challenges with a default credential
 * - Invoking the host's background completion signal
 */

#include <kcenon/task_session/task_session.h>

#include <chrono>
#include <future>
#include <iostream>
#include <string>
#include <vector>

using namespace kcenon::task_session;

void print_usage(const char* program) {
    std::cout << "Background Session Example - Task Session" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <url>..." << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -i, --identifier <id>   Background session identifier" << std::endl;
    std::cout << "  -u, --user <user>       Default credential user" << std::endl;
    std::cout << "  -p, --password <pass>   Default credential password" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string identifier = "com.example.background";
    std::string user;
    std::string password;
    std::vector<std::string> urls;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-i" || arg == "--identifier") {
            if (++i >= argc) {
                std::cerr << "Error: --identifier requires an argument" << std::endl;
                return 1;
            }
            identifier = argv[i];
        } else if (arg == "-u" || arg == "--user") {
            if (++i >= argc) {
                std::cerr << "Error: --user requires an argument" << std::endl;
                return 1;
            }
            user = argv[i];
        } else if (arg == "-p" || arg == "--password") {
            if (++i >= argc) {
                std::cerr << "Error: --password requires an argument" << std::endl;
                return 1;
            }
            password = argv[i];
        } else if (arg[0] != '-') {
            urls.push_back(arg);
        }
    }

    if (urls.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    manager_config config;
    config.session = session_configuration::background(identifier);
    if (!user.empty()) {
        config.default_credential = credential{user, password};
    }

    auto manager_result = task_manager::background_session(identifier, config);
    if (!manager_result.has_value()) {
        std::cerr << "Failed to open background session: "
                  << manager_result.error().message << std::endl;
        return 1;
    }
    auto manager = manager_result.value();

    // A second lookup hands back the same manager while it is alive
    auto again = task_manager::background_session(identifier);
    if (again.has_value() && again.value() == manager) {
        std::cout << "Background session '" << identifier << "' is shared" << std::endl;
    }

    manager->on_background_download_finished(
        [](task_identifier id, const std::filesystem::path& location) {
            std::cout << "Unowned download " << id.to_string() << " finished at "
                      << location.string() << std::endl;
        });
    manager->on_task_completed_without_operation(
        [](task_identifier id, const std::optional<error>& err) {
            std::cout << "Unowned task " << id.to_string() << " completed"
                      << (err ? ": " + err->message : std::string()) << std::endl;
        });
    manager->on_session_invalidated([](const std::optional<error>& err) {
        std::cout << "Session invalidated" << (err ? ": " + err->message : std::string())
                  << std::endl;
    });

    auto signalled = std::make_shared<std::promise<void>>();
    manager->set_background_events_completion_signal([signalled] { signalled->set_value(); });

    std::vector<std::future<void>> finished;

    for (const auto& url : urls) {
        auto promise = std::make_shared<std::promise<void>>();
        finished.push_back(promise->get_future());

        auto task = manager->create_download_task(
            url, nullptr,
            [promise](download_task_operation& op, std::optional<std::filesystem::path> location,
                      std::optional<error> err) {
                if (err) {
                    std::cerr << op.name() << " failed: " << err->message << std::endl;
                } else {
                    std::cout << op.name() << " saved to " << location->string() << std::endl;
                }
                promise->set_value();
            });
        if (!task.has_value()) {
            std::cerr << "Skipping " << url << ": " << task.error().message << std::endl;
            promise->set_value();
            continue;
        }

        auto enqueued = manager->enqueue(task.value());
        if (!enqueued.has_value()) {
            std::cerr << "Skipping " << url << ": " << enqueued.error().message << std::endl;
            task.value()->cancel();
        }
    }

    for (auto& f : finished) {
        f.wait();
    }

    auto stats = manager->router_stats();
    std::cout << std::endl;
    std::cout << "Routed events:     " << stats.routed << std::endl;
    std::cout << "Unrouted events:   " << stats.unrouted << std::endl;
    std::cout << "Fallbacks invoked: " << stats.fallbacks_invoked << std::endl;
    std::cout << "Dropped events:    " << stats.dropped << std::endl;

    // The host's completion handler runs once on the callback queue
    auto signal_done = signalled->get_future();
    if (manager->signal_background_events_completion()) {
        signal_done.wait_for(std::chrono::seconds(5));
    }

    manager->invalidate();
    return 0;
}
