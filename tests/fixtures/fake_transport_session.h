/**
 * @file fake_transport_session.h
 * @brief Scriptable transport session for tests
 */

#ifndef KCENON_TASK_SESSION_TEST_FAKE_TRANSPORT_SESSION_H
#define KCENON_TASK_SESSION_TEST_FAKE_TRANSPORT_SESSION_H

#include <kcenon/task_session/core/resume_data.h>
#include <kcenon/task_session/transport/transport_events.h>
#include <kcenon/task_session/transport/transport_session.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::task_session::test {

/**
 * @brief What the fake transport knows about one created task
 */
struct fake_task_record {
    task_identifier id;
    std::string kind;
    url_request request;
    byte_buffer body;
    std::optional<std::filesystem::path> body_file;
    std::optional<resume_data> created_from;

    std::atomic<int> resume_calls{0};
    std::atomic<int> cancel_calls{0};
    std::atomic<bool> resume_data_requested{false};
    std::atomic<bool> completed{false};
};

/**
 * @brief Controller shared by a test and the transport session it scripts
 *
 * The manager owns the transport session; the test keeps the controller
 * and injects events through it from any thread.
 */
class fake_transport : public std::enable_shared_from_this<fake_transport> {
public:
    /**
     * @brief Transport factory handing sessions bound to this controller
     */
    auto factory() -> transport_factory;

    // Behaviour switches

    /// Emit a cancelled completion synchronously from cancel()
    std::atomic<bool> complete_on_cancel{true};

    /// Resume data handed out by cancel_producing_resume_data
    void set_resume_data(std::optional<resume_data> data) {
        std::lock_guard<std::mutex> lock(mutex_);
        resume_data_ = std::move(data);
    }

    /// Next created task gets this identifier
    void force_next_identifier(uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex_);
        forced_identifier_ = id;
    }

    /// Next create call fails with this error
    void fail_next_create(error err) {
        std::lock_guard<std::mutex> lock(mutex_);
        create_error_ = std::move(err);
    }

    // Inspection

    [[nodiscard]] auto task(task_identifier id) const -> std::shared_ptr<fake_task_record> {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(id.value);
        return it == tasks_.end() ? nullptr : it->second;
    }

    [[nodiscard]] auto created_count() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

    [[nodiscard]] auto invalidated() const -> bool { return invalidated_.load(); }
    [[nodiscard]] auto cancelled_on_invalidate() const -> bool { return cancel_all_.load(); }

    /**
     * @brief Wait until the task was resumed
     */
    auto wait_until_resumed(task_identifier id,
                            std::chrono::milliseconds timeout = std::chrono::seconds(5)) -> bool {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            auto record = task(id);
            if (record && record->resume_calls.load() > 0) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return false;
    }

    // Event injection

    void emit(task_event event) {
        auto target = delegate();
        if (target) {
            target->on_task_event(std::move(event));
        }
    }

    void emit_session(session_event event) {
        auto target = delegate();
        if (target) {
            target->on_session_event(std::move(event));
        }
    }

    void send_data(task_identifier id, byte_buffer chunk,
                   int64_t expected = transfer_size_unknown) {
        emit(data_received_event{id, std::move(chunk), expected});
    }

    void send_upload_progress(task_identifier id, uint64_t sent, uint64_t total_sent,
                              int64_t expected) {
        emit(upload_progress_event{id, sent, total_sent, expected});
    }

    void send_download_progress(task_identifier id, uint64_t written, uint64_t total_written,
                                int64_t expected) {
        emit(download_progress_event{id, written, total_written, expected});
    }

    void finish_download(task_identifier id, const std::filesystem::path& location) {
        emit(download_finished_event{id, location});
    }

    void complete(task_identifier id, std::optional<error> err = std::nullopt) {
        if (auto record = task(id)) {
            record->completed.store(true);
        }
        emit(task_completed_event{id, std::move(err)});
    }

    void challenge(task_identifier id, auth_challenge ch, challenge_reply reply) {
        emit(task_challenge_event{id, std::move(ch), std::move(reply)});
    }

    // Called by the fake session and tasks

    auto create(std::string kind, url_request request) -> result<std::unique_ptr<transport_task>>;

    void on_cancel(const std::shared_ptr<fake_task_record>& record) {
        record->cancel_calls.fetch_add(1);
        if (record->cancel_calls.load() == 1 && complete_on_cancel.load() &&
            !record->completed.load()) {
            record->completed.store(true);
            emit(task_completed_event{record->id, error{error_code::cancelled, "cancelled"}});
        }
    }

    auto resume_data_for(const std::shared_ptr<fake_task_record>& record)
        -> std::optional<resume_data> {
        std::lock_guard<std::mutex> lock(mutex_);
        if (record->kind != "download") {
            return std::nullopt;
        }
        if (resume_data_) {
            return resume_data_;
        }
        return encode_resume_data({record->request.url, 0, {}});
    }

    void invalidate(bool cancel_tasks) {
        invalidated_.store(true);
        cancel_all_.store(cancel_tasks);
        if (cancel_tasks) {
            std::vector<std::shared_ptr<fake_task_record>> records;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                for (auto& [id, record] : tasks_) {
                    records.push_back(record);
                }
            }
            for (auto& record : records) {
                on_cancel(record);
            }
        }
        emit_session(session_invalidated_event{std::nullopt});
    }

    void bind(std::shared_ptr<session_delegate> target, session_configuration config) {
        std::lock_guard<std::mutex> lock(mutex_);
        delegate_ = std::move(target);
        config_ = std::move(config);
    }

    [[nodiscard]] auto configuration() const -> session_configuration {
        std::lock_guard<std::mutex> lock(mutex_);
        return config_;
    }

    /**
     * @brief Drop the delegate so the manager can be released
     */
    void unbind() {
        std::lock_guard<std::mutex> lock(mutex_);
        delegate_.reset();
    }

private:
    auto delegate() const -> std::shared_ptr<session_delegate> {
        std::lock_guard<std::mutex> lock(mutex_);
        return delegate_;
    }

    mutable std::mutex mutex_;
    std::shared_ptr<session_delegate> delegate_;
    session_configuration config_;
    std::map<uint64_t, std::shared_ptr<fake_task_record>> tasks_;
    uint64_t next_identifier_{1};
    std::optional<uint64_t> forced_identifier_;
    std::optional<error> create_error_;
    std::optional<resume_data> resume_data_;
    std::atomic<bool> invalidated_{false};
    std::atomic<bool> cancel_all_{false};
};

/**
 * @brief Transport task backed by a fake_task_record
 */
class fake_transport_task : public transport_task {
public:
    fake_transport_task(std::shared_ptr<fake_transport> owner,
                        std::shared_ptr<fake_task_record> record)
        : owner_(std::move(owner)), record_(std::move(record)) {}

    auto identifier() const -> task_identifier override { return record_->id; }
    auto original_request() const -> const url_request& override { return record_->request; }

    void resume() override { record_->resume_calls.fetch_add(1); }

    void cancel() override { owner_->on_cancel(record_); }

    void cancel_producing_resume_data(resume_data_callback callback) override {
        record_->resume_data_requested.store(true);
        if (callback) {
            callback(owner_->resume_data_for(record_));
        }
        cancel();
    }

    [[nodiscard]] auto record() const -> const std::shared_ptr<fake_task_record>& {
        return record_;
    }

private:
    std::shared_ptr<fake_transport> owner_;
    std::shared_ptr<fake_task_record> record_;
};

/**
 * @brief Transport session whose behaviour a fake_transport scripts
 */
class fake_transport_session : public transport_session {
public:
    fake_transport_session(std::shared_ptr<fake_transport> owner, session_configuration config)
        : owner_(std::move(owner)), config_(std::move(config)) {}

    auto create_data_task(const url_request& request)
        -> result<std::unique_ptr<transport_task>> override {
        return owner_->create("data", request);
    }

    auto create_download_task(const url_request& request)
        -> result<std::unique_ptr<transport_task>> override {
        return owner_->create("download", request);
    }

    auto create_download_task(const resume_data& data)
        -> result<std::unique_ptr<transport_task>> override {
        auto decoded = decode_resume_data(data);
        if (!decoded) {
            return unexpected{decoded.error()};
        }
        auto created = owner_->create("download", url_request{decoded.value().url});
        if (created) {
            auto* task = static_cast<fake_transport_task*>(created.value().get());
            task->record()->created_from = data;
        }
        return created;
    }

    auto create_upload_task(const url_request& request, byte_buffer body)
        -> result<std::unique_ptr<transport_task>> override {
        auto created = owner_->create("upload", request);
        if (created) {
            auto* task = static_cast<fake_transport_task*>(created.value().get());
            task->record()->body = std::move(body);
        }
        return created;
    }

    auto create_upload_task(const url_request& request, const std::filesystem::path& file)
        -> result<std::unique_ptr<transport_task>> override {
        auto created = owner_->create("upload", request);
        if (created) {
            auto* task = static_cast<fake_transport_task*>(created.value().get());
            task->record()->body_file = file;
        }
        return created;
    }

    void finish_tasks_and_invalidate() override { owner_->invalidate(false); }
    void invalidate_and_cancel() override { owner_->invalidate(true); }

    auto configuration() const -> const session_configuration& override { return config_; }

private:
    std::shared_ptr<fake_transport> owner_;
    session_configuration config_;
};

inline auto fake_transport::create(std::string kind, url_request request)
    -> result<std::unique_ptr<transport_task>> {
    auto record = std::make_shared<fake_task_record>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (create_error_) {
            auto err = *create_error_;
            create_error_.reset();
            return unexpected{err};
        }
        if (forced_identifier_) {
            record->id = task_identifier{*forced_identifier_};
            forced_identifier_.reset();
        } else {
            record->id = task_identifier{next_identifier_++};
        }
        record->kind = std::move(kind);
        record->request = std::move(request);
        // A reused identifier keeps the first task's record
        tasks_.emplace(record->id.value, record);
    }
    std::unique_ptr<transport_task> task = std::make_unique<fake_transport_task>(shared_from_this(), record);
    return task;
}

inline auto fake_transport::factory() -> transport_factory {
    return [this](const session_configuration& config,
                  std::shared_ptr<session_delegate> target)
               -> result<std::unique_ptr<transport_session>> {
        bind(std::move(target), config);
        std::unique_ptr<transport_session> session =
            std::make_unique<fake_transport_session>(shared_from_this(), config);
        return session;
    };
}

}  // namespace kcenon::task_session::test

#endif  // KCENON_TASK_SESSION_TEST_FAKE_TRANSPORT_SESSION_H
