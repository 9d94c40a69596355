/**
 * @file task_manager.cpp
 * @brief Task manager implementation
 */

#include "kcenon/task_session/session/task_manager.h"

#include <kcenon/task_session/adapters/thread_pool_adapter.h>
#include <kcenon/task_session/core/logging.h>
#include <kcenon/task_session/transport/http_transport_session.h>

#include <mutex>
#include <system_error>
#include <unordered_map>

namespace kcenon::task_session {

namespace {

auto background_registry_mutex() -> std::mutex& {
    static std::mutex mutex;
    return mutex;
}

auto background_registry() -> std::unordered_map<std::string, std::weak_ptr<task_manager>>& {
    static std::unordered_map<std::string, std::weak_ptr<task_manager>> managers;
    return managers;
}

auto validate_url(const std::string& url) -> result<void> {
    if (!is_valid_url(url)) {
        return unexpected{error{error_code::invalid_url, "invalid URL: " + url}};
    }
    return {};
}

}  // namespace

struct task_manager::impl {
    manager_config config;
    std::shared_ptr<adapters::worker_pool_interface> pool;
    std::shared_ptr<task_registry> registry;
    std::shared_ptr<session_context> context;
    std::shared_ptr<session_router> router;
    std::unique_ptr<operation_queue> queue;
    std::unique_ptr<transport_session> transport;

    explicit impl(manager_config cfg) : config(std::move(cfg)) {
        pool = adapters::worker_pool_factory::create(config.worker_count, "task_session_pool");
        registry = std::make_shared<task_registry>();
        context = std::make_shared<session_context>(registry, config.executor);
        context->set_default_credential(config.default_credential);
        router = std::make_shared<session_router>(context);
        queue = std::make_unique<operation_queue>(pool, config.max_concurrent_operations,
                                                  "task_session.queue");
    }

    ~impl() {
        teardown();
    }

    impl(const impl&) = delete;
    auto operator=(const impl&) -> impl& = delete;

    [[nodiscard]] auto executor() const -> std::shared_ptr<callback_executor> {
        return context->executor();
    }

    [[nodiscard]] auto relocator() const -> download_relocator {
        return download_relocator{config.effective_download_directory()};
    }

    [[nodiscard]] auto check_usable() const -> result<void> {
        if (context->is_invalidated()) {
            return unexpected{error{error_code::session_invalidated,
                "task manager session was invalidated"}};
        }
        return {};
    }

    void teardown() {
        auto registered = registry->snapshot();
        if (!registered.empty()) {
            TS_LOG_INFO(log_category::manager,
                        "Tearing down with " + std::to_string(registered.size()) +
                        " operations in flight");
        }
        for (auto& op : registered) {
            op->cancel();
        }

        context->mark_invalidated();
        if (transport) {
            transport->invalidate_and_cancel();
        }

        for (auto& op : registry->snapshot()) {
            op->force_terminate(error{error_code::cancelled, "session invalidated"});
        }

        queue.reset();
        transport.reset();
    }
};

// ============================================================================
// builder
// ============================================================================

task_manager::builder::builder() = default;

auto task_manager::builder::with_config(manager_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto task_manager::builder::with_session_configuration(session_configuration config)
    -> builder& {
    config_.session = std::move(config);
    return *this;
}

auto task_manager::builder::with_callback_executor(std::shared_ptr<callback_executor> executor)
    -> builder& {
    config_.executor = std::move(executor);
    return *this;
}

auto task_manager::builder::with_default_credential(credential cred) -> builder& {
    config_.default_credential = std::move(cred);
    return *this;
}

auto task_manager::builder::with_max_concurrent_operations(std::size_t count) -> builder& {
    config_.max_concurrent_operations = count;
    return *this;
}

auto task_manager::builder::with_download_directory(std::filesystem::path directory)
    -> builder& {
    config_.download_directory = std::move(directory);
    return *this;
}

auto task_manager::builder::with_transport_factory(transport_factory factory) -> builder& {
    config_.transport = std::move(factory);
    return *this;
}

auto task_manager::builder::with_worker_count(std::size_t count) -> builder& {
    config_.worker_count = count;
    return *this;
}

auto task_manager::builder::build() -> result<task_manager> {
    auto valid = config_.validate();
    if (!valid) {
        return unexpected{valid.error()};
    }

    get_logger().initialize();

    auto state = std::make_unique<impl>(std::move(config_));
    auto factory = state->config.transport;
    if (!factory) {
        factory = http_transport_session::factory(state->pool);
    }

    auto created = factory(state->config.session, state->router);
    if (!created) {
        TS_LOG_ERROR(log_category::manager,
                     "Transport session creation failed: " + created.error().message);
        return unexpected{created.error()};
    }
    if (!created.value()) {
        return unexpected{error{error_code::internal_error,
            "transport factory returned no session"}};
    }
    state->transport = std::move(created.value());

    TS_LOG_INFO(log_category::manager,
                std::string("Task manager created") +
                (state->config.session.is_background()
                     ? " for background session " + *state->config.session.background_identifier
                     : std::string{}));
    return task_manager{std::move(state)};
}

// ============================================================================
// task_manager
// ============================================================================

auto task_manager::background_session(const std::string& identifier, manager_config config)
    -> result<std::shared_ptr<task_manager>> {
    if (identifier.empty()) {
        return unexpected{error{error_code::invalid_argument,
            "background identifier must not be empty"}};
    }

    std::lock_guard<std::mutex> lock(background_registry_mutex());
    auto& managers = background_registry();
    auto found = managers.find(identifier);
    if (found != managers.end()) {
        if (auto existing = found->second.lock()) {
            return existing;
        }
        managers.erase(found);
    }

    config.session.background_identifier = identifier;
    auto built = builder().with_config(std::move(config)).build();
    if (!built) {
        return unexpected{built.error()};
    }
    auto manager = std::make_shared<task_manager>(std::move(built.value()));
    managers[identifier] = manager;
    return manager;
}

task_manager::task_manager(std::unique_ptr<impl> impl) : impl_(std::move(impl)) {}

task_manager::task_manager(task_manager&&) noexcept = default;
auto task_manager::operator=(task_manager&&) noexcept -> task_manager& = default;
task_manager::~task_manager() = default;

template <typename Op, typename Make>
auto task_manager::register_operation(result<std::unique_ptr<transport_task>> created, Make make)
    -> result<std::shared_ptr<Op>> {
    if (!created) {
        return unexpected{created.error()};
    }
    if (!created.value()) {
        return unexpected{error{error_code::internal_error, "transport returned no task"}};
    }

    const auto id = created.value()->identifier();
    if (impl_->registry->contains(id)) {
        TS_LOG_FATAL(log_category::manager,
                     "Transport reused task identifier " + id.to_string());
        impl_->registry->discard(id);
        created.value()->cancel();
        return unexpected{error{error_code::duplicate_identifier,
            "task identifier " + id.to_string() + " already registered"}};
    }

    std::shared_ptr<Op> op = make(std::move(created.value()));

    auto inserted = impl_->registry->insert(id, op);
    if (!inserted) {
        // Another creation registered the identifier first
        impl_->registry->discard(id);
        op->cancel();
        return unexpected{inserted.error()};
    }
    op->attach_registry(impl_->registry);

    auto ctx = task_log_context{};
    ctx.task_id = id.to_string();
    ctx.kind = to_string(op->kind());
    ctx.url = op->request().url;
    ctx.session_identifier = impl_->config.session.background_identifier;
    TS_LOG_DEBUG_CTX(log_category::manager, "Created task operation", ctx);
    return op;
}

auto task_manager::create_data_task(const url_request& request,
                                    data_task_operation::progress_handler on_progress,
                                    data_task_operation::completion_handler on_complete)
    -> result<std::shared_ptr<data_task_operation>> {
    auto url_ok = validate_url(request.url);
    if (!url_ok) {
        return unexpected{url_ok.error()};
    }
    auto usable = impl_->check_usable();
    if (!usable) {
        return unexpected{usable.error()};
    }

    auto executor = impl_->executor();
    return register_operation<data_task_operation>(
        impl_->transport->create_data_task(request),
        [&](std::unique_ptr<transport_task> task) {
            return std::make_shared<data_task_operation>(std::move(task), executor,
                                                         std::move(on_progress),
                                                         std::move(on_complete));
        });
}

auto task_manager::create_data_task(const std::string& url,
                                    data_task_operation::progress_handler on_progress,
                                    data_task_operation::completion_handler on_complete)
    -> result<std::shared_ptr<data_task_operation>> {
    return create_data_task(url_request{url}, std::move(on_progress), std::move(on_complete));
}

auto task_manager::create_download_task(
    const url_request& request,
    download_task_operation::write_progress_handler on_progress,
    download_task_operation::completion_handler on_complete)
    -> result<std::shared_ptr<download_task_operation>> {
    auto url_ok = validate_url(request.url);
    if (!url_ok) {
        return unexpected{url_ok.error()};
    }
    auto usable = impl_->check_usable();
    if (!usable) {
        return unexpected{usable.error()};
    }

    auto executor = impl_->executor();
    auto relocator = impl_->relocator();
    return register_operation<download_task_operation>(
        impl_->transport->create_download_task(request),
        [&](std::unique_ptr<transport_task> task) {
            return std::make_shared<download_task_operation>(
                std::move(task), executor, std::move(on_progress), std::move(on_complete),
                relocator);
        });
}

auto task_manager::create_download_task(
    const std::string& url,
    download_task_operation::write_progress_handler on_progress,
    download_task_operation::completion_handler on_complete)
    -> result<std::shared_ptr<download_task_operation>> {
    return create_download_task(url_request{url}, std::move(on_progress),
                                std::move(on_complete));
}

auto task_manager::create_download_task(
    const resume_data& data,
    download_task_operation::write_progress_handler on_progress,
    download_task_operation::completion_handler on_complete)
    -> result<std::shared_ptr<download_task_operation>> {
    if (data.empty()) {
        return unexpected{error{error_code::invalid_resume_data, "resume data is empty"}};
    }
    auto usable = impl_->check_usable();
    if (!usable) {
        return unexpected{usable.error()};
    }

    auto executor = impl_->executor();
    auto relocator = impl_->relocator();
    return register_operation<download_task_operation>(
        impl_->transport->create_download_task(data),
        [&](std::unique_ptr<transport_task> task) {
            return std::make_shared<download_task_operation>(
                std::move(task), executor, std::move(on_progress), std::move(on_complete),
                relocator);
        });
}

auto task_manager::create_upload_task(const url_request& request,
                                      byte_buffer body,
                                      upload_task_operation::send_progress_handler on_progress,
                                      upload_task_operation::completion_handler on_complete)
    -> result<std::shared_ptr<upload_task_operation>> {
    auto url_ok = validate_url(request.url);
    if (!url_ok) {
        return unexpected{url_ok.error()};
    }
    if (body.empty()) {
        return unexpected{error{error_code::invalid_upload_body, "upload body is empty"}};
    }
    auto usable = impl_->check_usable();
    if (!usable) {
        return unexpected{usable.error()};
    }

    auto executor = impl_->executor();
    return register_operation<upload_task_operation>(
        impl_->transport->create_upload_task(request, std::move(body)),
        [&](std::unique_ptr<transport_task> task) {
            return std::make_shared<upload_task_operation>(std::move(task), executor,
                                                           std::move(on_progress),
                                                           std::move(on_complete));
        });
}

auto task_manager::create_upload_task(const url_request& request,
                                      const std::filesystem::path& file,
                                      upload_task_operation::send_progress_handler on_progress,
                                      upload_task_operation::completion_handler on_complete)
    -> result<std::shared_ptr<upload_task_operation>> {
    auto url_ok = validate_url(request.url);
    if (!url_ok) {
        return unexpected{url_ok.error()};
    }
    if (file.empty()) {
        return unexpected{error{error_code::invalid_upload_body, "upload file path is empty"}};
    }
    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        return unexpected{error{error_code::file_not_found,
            "upload file not found: " + file.string()}};
    }
    if (!std::filesystem::is_regular_file(file, ec)) {
        return unexpected{error{error_code::invalid_upload_body,
            "upload body is not a regular file: " + file.string()}};
    }
    auto usable = impl_->check_usable();
    if (!usable) {
        return unexpected{usable.error()};
    }

    auto executor = impl_->executor();
    return register_operation<upload_task_operation>(
        impl_->transport->create_upload_task(request, file),
        [&](std::unique_ptr<transport_task> task) {
            return std::make_shared<upload_task_operation>(std::move(task), executor,
                                                           std::move(on_progress),
                                                           std::move(on_complete));
        });
}

auto task_manager::create_upload_task(const std::string& url,
                                      byte_buffer body,
                                      upload_task_operation::send_progress_handler on_progress,
                                      upload_task_operation::completion_handler on_complete)
    -> result<std::shared_ptr<upload_task_operation>> {
    return create_upload_task(url_request{url, "POST"}, std::move(body), std::move(on_progress),
                              std::move(on_complete));
}

auto task_manager::create_upload_task(const std::string& url,
                                      const std::filesystem::path& file,
                                      upload_task_operation::send_progress_handler on_progress,
                                      upload_task_operation::completion_handler on_complete)
    -> result<std::shared_ptr<upload_task_operation>> {
    return create_upload_task(url_request{url, "POST"}, file, std::move(on_progress),
                              std::move(on_complete));
}

auto task_manager::enqueue(std::shared_ptr<operation> op) -> result<void> {
    return impl_->queue->enqueue(std::move(op));
}

auto task_manager::queue() -> operation_queue& {
    return *impl_->queue;
}

auto task_manager::registry() const -> const task_registry& {
    return *impl_->registry;
}

auto task_manager::router_stats() const -> router_statistics {
    return impl_->router->statistics();
}

auto task_manager::config() const -> const manager_config& {
    return impl_->config;
}

void task_manager::on_authentication_challenge(
    session_fallbacks::authentication_challenge_handler handler) {
    impl_->context->set_authentication_challenge_handler(std::move(handler));
}

void task_manager::on_session_invalidated(session_fallbacks::session_invalidated_handler handler) {
    impl_->context->set_session_invalidated_handler(std::move(handler));
}

void task_manager::on_background_download_finished(
    session_fallbacks::background_download_finished_handler handler) {
    impl_->context->set_background_download_finished_handler(std::move(handler));
}

void task_manager::on_task_completed_without_operation(
    session_fallbacks::task_completed_without_operation_handler handler) {
    impl_->context->set_task_completed_without_operation_handler(std::move(handler));
}

void task_manager::on_background_events_finished(
    session_fallbacks::background_events_finished_handler handler) {
    impl_->context->set_background_events_finished_handler(std::move(handler));
}

void task_manager::set_background_events_completion_signal(std::function<void()> signal) {
    impl_->context->set_background_events_completion_signal(std::move(signal));
}

auto task_manager::signal_background_events_completion() -> bool {
    return impl_->context->signal_background_events_completion();
}

void task_manager::set_default_credential(std::optional<credential> cred) {
    impl_->context->set_default_credential(std::move(cred));
}

void task_manager::invalidate(bool cancel_tasks) {
    if (impl_->context->is_invalidated()) {
        return;
    }
    impl_->context->mark_invalidated();
    TS_LOG_INFO(log_category::manager,
                cancel_tasks ? "Invalidating session and cancelling tasks"
                             : "Invalidating session after running tasks");
    if (cancel_tasks) {
        impl_->transport->invalidate_and_cancel();
    } else {
        impl_->transport->finish_tasks_and_invalidate();
    }
}

auto task_manager::is_invalidated() const -> bool {
    return impl_->context->is_invalidated();
}

}  // namespace kcenon::task_session
