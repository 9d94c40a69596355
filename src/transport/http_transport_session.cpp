/**
 * @file http_transport_session.cpp
 * @brief HTTP transport session implementation
 */

#include "kcenon/task_session/transport/http_transport_session.h"

#include <kcenon/task_session/core/logging.h>
#include <kcenon/task_session/core/resume_data.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <fstream>
#include <future>
#include <mutex>
#include <unordered_map>
#include <variant>
#include <vector>

#if TASK_SESSION_HAS_HTTP_TRANSPORT
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::task_session {

namespace {

constexpr const char* transport_stage = "transport";
constexpr uint32_t max_authentication_attempts = 3;

const char BASE64_CHARS[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

auto base64_encode(const std::string& data) -> std::string {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    for (std::size_t i = 0; i < data.size(); i += 3) {
        uint32_t n = static_cast<uint32_t>(static_cast<uint8_t>(data[i])) << 16;
        if (i + 1 < data.size()) n |= static_cast<uint32_t>(static_cast<uint8_t>(data[i + 1])) << 8;
        if (i + 2 < data.size()) n |= static_cast<uint32_t>(static_cast<uint8_t>(data[i + 2]));

        result += BASE64_CHARS[(n >> 18) & 0x3F];
        result += BASE64_CHARS[(n >> 12) & 0x3F];
        result += (i + 1 < data.size()) ? BASE64_CHARS[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < data.size()) ? BASE64_CHARS[n & 0x3F] : '=';
    }

    return result;
}

auto find_header(const std::map<std::string, std::string>& headers, const std::string& name)
    -> std::string {
    for (const auto& [key, value] : headers) {
        if (key.size() != name.size()) {
            continue;
        }
        bool equal = std::equal(key.begin(), key.end(), name.begin(), [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) ==
                   std::tolower(static_cast<unsigned char>(b));
        });
        if (equal) {
            return value;
        }
    }
    return {};
}

auto parse_realm(const std::string& www_authenticate) -> std::string {
    auto pos = www_authenticate.find("realm=\"");
    if (pos == std::string::npos) {
        return {};
    }
    pos += 7;
    auto end = www_authenticate.find('"', pos);
    if (end == std::string::npos) {
        return {};
    }
    return www_authenticate.substr(pos, end - pos);
}

auto read_file(const std::filesystem::path& path) -> result<byte_buffer> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected{error{error_code::file_read_error,
            "cannot open upload body " + path.string()}};
    }
    file.seekg(0, std::ios::end);
    auto size = file.tellg();
    file.seekg(0, std::ios::beg);
    if (size < 0) {
        return unexpected{error{error_code::file_read_error,
            "cannot size upload body " + path.string()}};
    }
    byte_buffer data(static_cast<std::size_t>(size));
    if (!data.empty() &&
        !file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size))) {
        return unexpected{error{error_code::file_read_error,
            "cannot read upload body " + path.string()}};
    }
    return data;
}

struct http_reply {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    byte_buffer body;
};

enum class http_task_kind {
    data,
    download,
    upload
};

enum class task_phase {
    suspended,
    running,
    done
};

}  // namespace

// ============================================================================
// Session state
// ============================================================================

struct http_task_state;

struct http_transport_session::session_state
    : std::enable_shared_from_this<http_transport_session::session_state> {
    session_configuration config;
    std::shared_ptr<session_delegate> delegate;
    std::shared_ptr<adapters::worker_pool_interface> pool;
#if TASK_SESSION_HAS_HTTP_TRANSPORT
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif

    std::atomic<uint64_t> next_identifier{1};

    std::mutex mutex;
    std::unordered_map<uint64_t, std::weak_ptr<http_task_state>> tasks;
    std::vector<std::future<void>> futures;
    std::size_t active{0};
    bool invalidated{false};
    bool invalidation_reported{false};
    bool closing{false};

    void submit(std::function<void()> job);
    void task_done(uint64_t id);
    void report_invalidation_if_idle();
    auto perform(http_task_state& task, const std::map<std::string, std::string>& headers)
        -> result<http_reply>;
};

struct http_task_state {
    task_identifier id;
    http_task_kind kind;
    url_request request;
    byte_buffer body;
    std::optional<std::filesystem::path> body_file;
    uint64_t resume_offset = 0;
    std::filesystem::path partial_path;

    std::mutex mutex;
    task_phase phase{task_phase::suspended};
    std::atomic<bool> cancelled{false};
    std::atomic<bool> completed{false};
    std::optional<credential> auth;

    std::weak_ptr<http_transport_session::session_state> session;

    void emit(task_event event) {
        if (auto s = session.lock()) {
            s->delegate->on_task_event(std::move(event));
        }
    }

    void emit_completion(std::optional<error> err) {
        if (completed.exchange(true)) {
            return;
        }
        emit(task_completed_event{id, std::move(err)});
        if (auto s = session.lock()) {
            s->task_done(id.value);
        }
    }

    void emit_cancelled() {
        emit_completion(error{error_code::cancelled, "task cancelled"});
    }
};

void http_transport_session::session_state::submit(std::function<void()> job) {
    std::unique_lock<std::mutex> lock(mutex);
    if (closing) {
        // The owning session is gone; nobody would wait for a pool job
        lock.unlock();
        job();
        return;
    }

    futures.erase(std::remove_if(futures.begin(), futures.end(),
                                 [](std::future<void>& f) {
                                     return !f.valid() ||
                                            f.wait_for(std::chrono::seconds(0)) ==
                                                std::future_status::ready;
                                 }),
                  futures.end());
    try {
        futures.push_back(pool->submit_to_stage(std::move(job), transport_stage));
    } catch (const std::exception& e) {
        TS_LOG_ERROR(log_category::transport,
                     std::string("Failed to submit transport job: ") + e.what());
    }
}

void http_transport_session::session_state::task_done(uint64_t id) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        tasks.erase(id);
        if (active > 0) {
            --active;
        }
    }
    report_invalidation_if_idle();
}

void http_transport_session::session_state::report_invalidation_if_idle() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!invalidated || invalidation_reported || active != 0) {
            return;
        }
        invalidation_reported = true;
    }
    TS_LOG_INFO(log_category::transport, "HTTP transport session invalidated");
    delegate->on_session_event(session_invalidated_event{std::nullopt});
}

auto http_transport_session::session_state::perform(
    http_task_state& task, const std::map<std::string, std::string>& headers)
    -> result<http_reply> {
#if TASK_SESSION_HAS_HTTP_TRANSPORT
    if (!client) {
        return unexpected{error{error_code::internal_error, "HTTP client not initialized"}};
    }

    const auto& url = task.request.url;
    const auto& method = task.request.method;
    std::vector<uint8_t> body;
    body.reserve(task.body.size());
    for (auto b : task.body) {
        body.push_back(static_cast<uint8_t>(b));
    }

    auto convert = [](const auto& resp) {
        http_reply reply;
        reply.status_code = resp.status_code;
        reply.headers = resp.headers;
        reply.body.reserve(resp.body.size());
        for (auto c : resp.body) {
            reply.body.push_back(static_cast<std::byte>(c));
        }
        return reply;
    };

    if (method == "POST") {
        auto response = client->post(url, body, headers);
        if (response.is_err()) {
            return unexpected{error{error_code::connection_failed, "HTTP POST request failed"}};
        }
        return convert(response.value());
    }
    if (method == "PUT") {
        auto response = client->put(url, std::string(body.begin(), body.end()), headers);
        if (response.is_err()) {
            return unexpected{error{error_code::connection_failed, "HTTP PUT request failed"}};
        }
        return convert(response.value());
    }
    if (method == "DELETE") {
        auto response = client->del(url, headers);
        if (response.is_err()) {
            return unexpected{error{error_code::connection_failed, "HTTP DELETE request failed"}};
        }
        return convert(response.value());
    }
    if (method == "HEAD") {
        auto response = client->head(url, headers);
        if (response.is_err()) {
            return unexpected{error{error_code::connection_failed, "HTTP HEAD request failed"}};
        }
        return convert(response.value());
    }

    auto response = client->get(url, {}, headers);
    if (response.is_err()) {
        return unexpected{error{error_code::connection_failed, "HTTP GET request failed"}};
    }
    return convert(response.value());
#else
    (void)task;
    (void)headers;
    return unexpected{error{error_code::transport_unavailable,
        "HTTP transport not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
#endif
}

// ============================================================================
// Task
// ============================================================================

namespace {

/**
 * @brief Ask the delegate for a credential and wait for the answer
 */
auto await_challenge(http_task_state& task, const http_reply& reply, uint32_t failures,
                     std::chrono::milliseconds timeout)
    -> std::pair<challenge_disposition, std::optional<credential>> {
    auth_challenge challenge;
    challenge.space.host = task.request.host();
    challenge.space.protocol = task.request.scheme();
    challenge.space.realm = parse_realm(find_header(reply.headers, "WWW-Authenticate"));
    challenge.space.authentication_method = "Basic";
    challenge.previous_failure_count = failures;

    using answer = std::pair<challenge_disposition, std::optional<credential>>;
    auto promise = std::make_shared<std::promise<answer>>();
    auto answered = std::make_shared<std::atomic<bool>>(false);
    auto future = promise->get_future();

    challenge_reply on_reply = [promise, answered](challenge_disposition disposition,
                                                   std::optional<credential> cred) {
        if (!answered->exchange(true)) {
            promise->set_value({disposition, std::move(cred)});
        }
    };
    task.emit(task_challenge_event{task.id, challenge, on_reply});

    if (future.wait_for(timeout) != std::future_status::ready) {
        TS_LOG_WARN(log_category::transport,
                    "Challenge for task " + task.id.to_string() + " not answered in time");
        return {challenge_disposition::cancel_challenge, std::nullopt};
    }
    return future.get();
}

void run_task(const std::shared_ptr<http_task_state>& task) {
    auto session = task->session.lock();
    if (!session) {
        return;
    }
    if (task->cancelled.load()) {
        task->emit_cancelled();
        return;
    }

    if (task->body_file) {
        auto loaded = read_file(*task->body_file);
        if (!loaded) {
            task->emit_completion(loaded.error());
            return;
        }
        task->body = std::move(loaded.value());
    }

    std::map<std::string, std::string> headers = session->config.additional_headers;
    for (const auto& [name, value] : task->request.headers) {
        headers[name] = value;
    }
    if (task->kind == http_task_kind::download && task->resume_offset > 0) {
        headers["Range"] = "bytes=" + std::to_string(task->resume_offset) + "-";
    }

    result<http_reply> response = unexpected{error{error_code::internal_error, "no request sent"}};
    uint32_t failures = 0;
    while (true) {
        if (task->auth) {
            headers["Authorization"] =
                "Basic " + base64_encode(task->auth->user + ":" + task->auth->password);
        }
        response = session->perform(*task, headers);
        if (task->cancelled.load()) {
            task->emit_cancelled();
            return;
        }
        if (!response || response.value().status_code != 401 ||
            failures >= max_authentication_attempts) {
            break;
        }

        auto [disposition, cred] =
            await_challenge(*task, response.value(), failures, session->config.request_timeout);
        if (disposition == challenge_disposition::cancel_challenge) {
            task->emit_cancelled();
            return;
        }
        if (disposition != challenge_disposition::use_credential || !cred) {
            break;
        }
        task->auth = std::move(cred);
        ++failures;
    }

    if (!response) {
        task->emit_completion(response.error());
        return;
    }

    auto& reply = response.value();
    const auto total_sent = static_cast<uint64_t>(task->body.size());
    if (task->kind == http_task_kind::upload) {
        task->emit(upload_progress_event{task->id, total_sent, total_sent,
                                         static_cast<int64_t>(total_sent)});
    }

    if (reply.status_code >= 400) {
        task->emit_completion(error{error_code::bad_server_response,
            "HTTP " + std::to_string(reply.status_code)});
        return;
    }

    if (task->kind != http_task_kind::download) {
        if (!reply.body.empty()) {
            auto length = static_cast<int64_t>(reply.body.size());
            task->emit(data_received_event{task->id, std::move(reply.body), length});
        }
        if (task->cancelled.load()) {
            task->emit_cancelled();
            return;
        }
        task->emit_completion(std::nullopt);
        return;
    }

    // Download: append to the partial file when the server honoured the range
    bool append = task->resume_offset > 0 && reply.status_code == 206;
    std::error_code ec;
    std::filesystem::create_directories(task->partial_path.parent_path(), ec);
    {
        std::ofstream out(task->partial_path,
                          std::ios::binary | (append ? std::ios::app : std::ios::trunc));
        if (!out) {
            task->emit_completion(error{error_code::file_write_error,
                "cannot open " + task->partial_path.string()});
            return;
        }
        out.write(reinterpret_cast<const char*>(reply.body.data()),
                  static_cast<std::streamsize>(reply.body.size()));
        if (!out) {
            task->emit_completion(error{error_code::file_write_error,
                "cannot write " + task->partial_path.string()});
            return;
        }
    }

    const uint64_t written = reply.body.size();
    const uint64_t total = append ? task->resume_offset + written : written;
    task->emit(download_progress_event{task->id, written, total, static_cast<int64_t>(total)});
    if (task->cancelled.load()) {
        task->emit_cancelled();
        return;
    }
    task->emit(download_finished_event{task->id, task->partial_path});

    // The delegate moved the file; anything left is stale
    std::filesystem::remove(task->partial_path, ec);
    task->emit_completion(std::nullopt);
}

class http_task : public transport_task {
public:
    explicit http_task(std::shared_ptr<http_task_state> state) : state_(std::move(state)) {}

    // A task dropped before resume still reports its completion
    ~http_task() override {
        bool was_suspended = false;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->phase == task_phase::suspended && !state_->cancelled.load()) {
                state_->phase = task_phase::done;
                was_suspended = true;
            }
        }
        if (!was_suspended) {
            return;
        }
        state_->cancelled.store(true);
        if (auto session = state_->session.lock()) {
            session->submit([state = state_] { state->emit_cancelled(); });
        }
    }

    http_task(const http_task&) = delete;
    auto operator=(const http_task&) -> http_task& = delete;

    auto identifier() const -> task_identifier override { return state_->id; }

    auto original_request() const -> const url_request& override { return state_->request; }

    void resume() override {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->phase != task_phase::suspended) {
                return;
            }
            state_->phase = task_phase::running;
        }
        auto session = state_->session.lock();
        if (!session) {
            return;
        }
        session->submit([state = state_] { run_task(state); });
    }

    void cancel() override {
        state_->cancelled.store(true);
        bool was_suspended = false;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->phase == task_phase::suspended) {
                state_->phase = task_phase::done;
                was_suspended = true;
            }
        }
        if (!was_suspended) {
            // The running request reports cancellation when it returns
            return;
        }
        auto session = state_->session.lock();
        if (!session) {
            return;
        }
        session->submit([state = state_] { state->emit_cancelled(); });
    }

    void cancel_producing_resume_data(resume_data_callback callback) override {
        if (state_->kind != http_task_kind::download) {
            transport_task::cancel_producing_resume_data(std::move(callback));
            return;
        }

        std::optional<resume_data> data;
        std::error_code ec;
        auto partial = std::filesystem::file_size(state_->partial_path, ec);
        resume_state resume;
        resume.url = state_->request.url;
        resume.bytes_received = ec ? state_->resume_offset : partial;
        resume.partial_path = state_->partial_path;
        data = encode_resume_data(resume);

        if (callback) {
            callback(std::move(data));
        }
        cancel();
    }

private:
    std::shared_ptr<http_task_state> state_;
};

}  // namespace

// ============================================================================
// http_transport_session
// ============================================================================

auto http_transport_session::create(const session_configuration& config,
                                    std::shared_ptr<session_delegate> delegate,
                                    std::shared_ptr<adapters::worker_pool_interface> pool)
    -> result<std::unique_ptr<transport_session>> {
    auto valid = config.validate();
    if (!valid) {
        return unexpected{valid.error()};
    }
    if (!delegate) {
        return unexpected{error{error_code::invalid_argument, "session delegate is required"}};
    }

    auto state = std::make_shared<session_state>();
    state->config = config;
    state->delegate = std::move(delegate);
    state->pool = pool ? std::move(pool)
                       : adapters::worker_pool_factory::create(0, "task_session_transport");
#if TASK_SESSION_HAS_HTTP_TRANSPORT
    state->client = std::make_shared<kcenon::network::core::http_client>(config.request_timeout);
#else
    TS_LOG_WARN(log_category::transport,
                "HTTP transport built without network_system; tasks will fail");
#endif

    std::unique_ptr<transport_session> session(new http_transport_session(std::move(state)));
    return session;
}

auto http_transport_session::factory(std::shared_ptr<adapters::worker_pool_interface> pool)
    -> transport_factory {
    return [pool](const session_configuration& config,
                  std::shared_ptr<session_delegate> delegate)
               -> result<std::unique_ptr<transport_session>> {
        return http_transport_session::create(config, std::move(delegate), pool);
    };
}

http_transport_session::http_transport_session(std::shared_ptr<session_state> state)
    : state_(std::move(state)) {}

http_transport_session::~http_transport_session() {
    std::vector<std::future<void>> futures;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->closing = true;
        futures.swap(state_->futures);
    }
    for (auto& future : futures) {
        if (!future.valid()) {
            continue;
        }
        try {
            future.get();
        } catch (const std::exception& e) {
            TS_LOG_WARN(log_category::transport,
                        std::string("Transport job failed: ") + e.what());
        }
    }
}

namespace {

auto register_task(const std::shared_ptr<http_transport_session::session_state>& session,
                   std::shared_ptr<http_task_state> state)
    -> result<std::unique_ptr<transport_task>> {
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->invalidated) {
            return unexpected{error{error_code::session_invalidated,
                "transport session was invalidated"}};
        }
        state->id = task_identifier{session->next_identifier.fetch_add(1)};
        session->tasks[state->id.value] = state;
        ++session->active;
    }
    state->session = session;
    if (state->partial_path.empty()) {
        state->partial_path = session->config.effective_temporary_directory() /
                              ("task_session-" + state->id.to_string() + ".part");
    }

    TS_LOG_TRACE(log_category::transport,
                 "Created HTTP task " + state->id.to_string() + " for " + state->request.url);
    std::unique_ptr<transport_task> task = std::make_unique<http_task>(std::move(state));
    return task;
}

}  // namespace

auto http_transport_session::create_data_task(const url_request& request)
    -> result<std::unique_ptr<transport_task>> {
    if (!is_valid_url(request.url)) {
        return unexpected{error{error_code::invalid_url, "invalid URL: " + request.url}};
    }
    auto state = std::make_shared<http_task_state>();
    state->kind = http_task_kind::data;
    state->request = request;
    return register_task(state_, std::move(state));
}

auto http_transport_session::create_download_task(const url_request& request)
    -> result<std::unique_ptr<transport_task>> {
    if (!is_valid_url(request.url)) {
        return unexpected{error{error_code::invalid_url, "invalid URL: " + request.url}};
    }
    auto state = std::make_shared<http_task_state>();
    state->kind = http_task_kind::download;
    state->request = request;
    state->request.method = "GET";
    return register_task(state_, std::move(state));
}

auto http_transport_session::create_download_task(const resume_data& data)
    -> result<std::unique_ptr<transport_task>> {
    auto decoded = decode_resume_data(data);
    if (!decoded) {
        return unexpected{decoded.error()};
    }
    auto& resume = decoded.value();

    auto state = std::make_shared<http_task_state>();
    state->kind = http_task_kind::download;
    state->request = url_request{resume.url};
    state->resume_offset = resume.bytes_received;
    state->partial_path = resume.partial_path;
    return register_task(state_, std::move(state));
}

auto http_transport_session::create_upload_task(const url_request& request, byte_buffer body)
    -> result<std::unique_ptr<transport_task>> {
    if (!is_valid_url(request.url)) {
        return unexpected{error{error_code::invalid_url, "invalid URL: " + request.url}};
    }
    auto state = std::make_shared<http_task_state>();
    state->kind = http_task_kind::upload;
    state->request = request;
    if (state->request.method == "GET") {
        state->request.method = "POST";
    }
    state->body = std::move(body);
    return register_task(state_, std::move(state));
}

auto http_transport_session::create_upload_task(const url_request& request,
                                                const std::filesystem::path& file)
    -> result<std::unique_ptr<transport_task>> {
    if (!is_valid_url(request.url)) {
        return unexpected{error{error_code::invalid_url, "invalid URL: " + request.url}};
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        return unexpected{error{error_code::file_not_found,
            "upload body not found: " + file.string()}};
    }
    auto state = std::make_shared<http_task_state>();
    state->kind = http_task_kind::upload;
    state->request = request;
    if (state->request.method == "GET") {
        state->request.method = "POST";
    }
    state->body_file = file;
    return register_task(state_, std::move(state));
}

void http_transport_session::finish_tasks_and_invalidate() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->invalidated = true;
    }
    TS_LOG_DEBUG(log_category::transport, "Invalidating HTTP session after running tasks");
    state_->report_invalidation_if_idle();
}

void http_transport_session::invalidate_and_cancel() {
    std::vector<std::shared_ptr<http_task_state>> live;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->invalidated = true;
        for (auto& [id, weak] : state_->tasks) {
            if (auto task = weak.lock()) {
                live.push_back(std::move(task));
            }
        }
    }
    TS_LOG_DEBUG(log_category::transport,
                 "Cancelling " + std::to_string(live.size()) + " HTTP tasks");
    for (auto& task : live) {
        http_task(task).cancel();
    }
    state_->report_invalidation_if_idle();
}

auto http_transport_session::configuration() const -> const session_configuration& {
    return state_->config;
}

}  // namespace kcenon::task_session
