/**
 * @file test_task_manager.cpp
 * @brief Unit tests for task_manager construction, factories and lifecycle
 */

#include <gtest/gtest.h>

#include "test_fixtures.h"

#include <atomic>
#include <fstream>

namespace kcenon::task_session::test {

// =============================================================================
// Builder
// =============================================================================

class TaskManagerBuilderTest : public ::testing::Test {
protected:
    void SetUp() override { transport_ = std::make_shared<fake_transport>(); }

    void TearDown() override { transport_->unbind(); }

    std::shared_ptr<fake_transport> transport_;
};

TEST_F(TaskManagerBuilderTest, BuildsWithFakeTransport) {
    auto result = task_manager::builder()
        .with_transport_factory(transport_->factory())
        .with_callback_executor(std::make_shared<inline_callback_executor>())
        .with_max_concurrent_operations(3)
        .with_download_directory("/tmp/task_session_builder")
        .build();

    ASSERT_TRUE(result.has_value());
    auto& manager = result.value();
    EXPECT_EQ(manager.config().max_concurrent_operations, 3u);
    EXPECT_EQ(manager.queue().max_concurrent_operations(), 3u);
    EXPECT_EQ(manager.config().effective_download_directory(),
              std::filesystem::path("/tmp/task_session_builder"));
    EXPECT_FALSE(manager.is_invalidated());
    EXPECT_TRUE(manager.registry().empty());
}

TEST_F(TaskManagerBuilderTest, PassesSessionConfigurationToTransport) {
    session_configuration session;
    session.request_timeout = std::chrono::seconds(5);
    session.additional_headers["User-Agent"] = "task-session-test";

    auto result = task_manager::builder()
        .with_transport_factory(transport_->factory())
        .with_session_configuration(session)
        .build();

    ASSERT_TRUE(result.has_value());
    auto seen = transport_->configuration();
    EXPECT_EQ(seen.request_timeout, std::chrono::milliseconds(5000));
    EXPECT_EQ(seen.additional_headers.at("User-Agent"), "task-session-test");
}

TEST_F(TaskManagerBuilderTest, RejectsInvalidConfiguration) {
    credential nameless;
    nameless.password = "pw";
    auto no_user = task_manager::builder()
        .with_transport_factory(transport_->factory())
        .with_default_credential(nameless)
        .build();
    ASSERT_FALSE(no_user.has_value());
    EXPECT_EQ(no_user.error().code, error_code::invalid_argument);

    auto too_many_workers = task_manager::builder()
        .with_transport_factory(transport_->factory())
        .with_worker_count(5000)
        .build();
    ASSERT_FALSE(too_many_workers.has_value());
    EXPECT_EQ(too_many_workers.error().code, error_code::invalid_argument);

    session_configuration zero_timeout;
    zero_timeout.request_timeout = std::chrono::milliseconds(0);
    auto bad_session = task_manager::builder()
        .with_transport_factory(transport_->factory())
        .with_session_configuration(zero_timeout)
        .build();
    ASSERT_FALSE(bad_session.has_value());
    EXPECT_EQ(bad_session.error().code, error_code::invalid_argument);
}

TEST_F(TaskManagerBuilderTest, PropagatesTransportFactoryError) {
    auto result = task_manager::builder()
        .with_transport_factory([](const session_configuration&,
                                   std::shared_ptr<session_delegate>)
                                    -> ::kcenon::task_session::result<std::unique_ptr<transport_session>> {
            return unexpected{error{error_code::transport_unavailable, "no network stack"}};
        })
        .build();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::transport_unavailable);
}

TEST_F(TaskManagerBuilderTest, RejectsFactoryReturningNothing) {
    auto result = task_manager::builder()
        .with_transport_factory([](const session_configuration&,
                                   std::shared_ptr<session_delegate>)
                                    -> ::kcenon::task_session::result<std::unique_ptr<transport_session>> {
            return std::unique_ptr<transport_session>{};
        })
        .build();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::internal_error);
}

// =============================================================================
// Background sessions
// =============================================================================

TEST_F(TaskManagerBuilderTest, BackgroundSessionIsSharedWhileAlive) {
    manager_config config;
    config.transport = transport_->factory();
    config.executor = std::make_shared<inline_callback_executor>();

    auto first = task_manager::background_session("com.example.sync", config);
    auto second = task_manager::background_session("com.example.sync", config);

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first.value(), second.value());
    EXPECT_EQ(transport_->configuration().background_identifier,
              std::optional<std::string>("com.example.sync"));
    EXPECT_EQ(first.value()->config().session.background_identifier,
              std::optional<std::string>("com.example.sync"));

    std::weak_ptr<task_manager> weak = first.value();
    first = unexpected{error{error_code::not_initialized}};
    second = unexpected{error{error_code::not_initialized}};
    EXPECT_TRUE(weak.expired());

    auto third = task_manager::background_session("com.example.sync", config);
    ASSERT_TRUE(third.has_value());
    EXPECT_NE(third.value(), nullptr);
}

TEST_F(TaskManagerBuilderTest, BackgroundSessionNeedsIdentifier) {
    auto result = task_manager::background_session("");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_argument);
}

// =============================================================================
// Factories
// =============================================================================

class TaskManagerTest : public ManagerFixture {};

TEST_F(TaskManagerTest, CreateRegistersWithoutStarting) {
    auto op = manager_->create_data_task("https://example.test/a", nullptr, nullptr);

    ASSERT_TRUE(op.has_value());
    auto id = op.value()->identifier();
    EXPECT_TRUE(manager_->registry().contains(id));
    EXPECT_EQ(op.value()->state(), operation_state::ready);

    auto record = transport_->task(id);
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->kind, "data");
    EXPECT_EQ(record->resume_calls.load(), 0);
    EXPECT_EQ(record->request.url, "https://example.test/a");
}

TEST_F(TaskManagerTest, RejectsInvalidUrl) {
    auto op = manager_->create_data_task("not a url", nullptr, nullptr);

    ASSERT_FALSE(op.has_value());
    EXPECT_EQ(op.error().code, error_code::invalid_url);
    EXPECT_EQ(transport_->created_count(), 0u);

    auto download = manager_->create_download_task("ftp:/missing-slashes", nullptr, nullptr);
    ASSERT_FALSE(download.has_value());
    EXPECT_EQ(download.error().code, error_code::invalid_url);
}

TEST_F(TaskManagerTest, UploadValidatesBody) {
    auto empty = manager_->create_upload_task("https://example.test/up", byte_buffer{},
                                              nullptr, nullptr);
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, error_code::invalid_upload_body);

    auto missing = manager_->create_upload_task("https://example.test/up",
                                                test_dir_ / "missing.bin", nullptr, nullptr);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, error_code::file_not_found);

    auto directory = manager_->create_upload_task("https://example.test/up", download_dir_,
                                                  nullptr, nullptr);
    ASSERT_FALSE(directory.has_value());
    EXPECT_EQ(directory.error().code, error_code::invalid_upload_body);
}

TEST_F(TaskManagerTest, UploadFromUrlUsesPost) {
    auto file = create_test_file("payload.bin", 64);

    auto from_file = manager_->create_upload_task("https://example.test/up", file, nullptr,
                                                  nullptr);
    auto from_memory = manager_->create_upload_task("https://example.test/up",
                                                    filled(16, 7), nullptr, nullptr);

    ASSERT_TRUE(from_file.has_value());
    ASSERT_TRUE(from_memory.has_value());
    auto file_record = transport_->task(from_file.value()->identifier());
    auto memory_record = transport_->task(from_memory.value()->identifier());
    EXPECT_EQ(file_record->request.method, "POST");
    EXPECT_EQ(file_record->body_file, file);
    EXPECT_EQ(memory_record->body.size(), 16u);
}

TEST_F(TaskManagerTest, PropagatesTransportCreateError) {
    transport_->fail_next_create(error{error_code::transport_error, "create failed"});

    auto op = manager_->create_download_task("https://example.test/a", nullptr, nullptr);

    ASSERT_FALSE(op.has_value());
    EXPECT_EQ(op.error().code, error_code::transport_error);
    EXPECT_TRUE(manager_->registry().empty());
}

TEST_F(TaskManagerTest, RejectsDuplicateIdentifier) {
    auto capture = std::make_shared<completion_capture<byte_buffer>>();
    transport_->force_next_identifier(42);
    auto first = manager_->create_data_task(
        "https://example.test/a", nullptr,
        [capture](data_task_operation&, std::optional<byte_buffer> data, std::optional<error> err) {
            capture->record(std::move(data), std::move(err));
        });
    ASSERT_TRUE(first.has_value());

    transport_->force_next_identifier(42);
    auto second = manager_->create_data_task("https://example.test/b", nullptr, nullptr);

    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, error_code::duplicate_identifier);
    EXPECT_EQ(first.value()->state(), operation_state::ready);
    EXPECT_EQ(capture->count(), 0);
    EXPECT_TRUE(manager_->registry().contains(task_identifier{42}));
    EXPECT_EQ(manager_->registry().lookup(task_identifier{42}), first.value());

    ASSERT_TRUE(start(first.value()));
    transport_->send_data(task_identifier{42}, bytes_of("still mine"));
    transport_->complete(task_identifier{42});

    ASSERT_TRUE(capture->wait());
    EXPECT_FALSE(capture->err.has_value());
    ASSERT_TRUE(capture->payload.has_value());
    EXPECT_EQ(*capture->payload, bytes_of("still mine"));
}

TEST_F(TaskManagerTest, ResumeDataCreatesDownload) {
    auto data = encode_resume_data({"https://example.test/big.iso", 1024, {}});

    auto op = manager_->create_download_task(data, nullptr, nullptr);

    ASSERT_TRUE(op.has_value());
    auto record = transport_->task(op.value()->identifier());
    ASSERT_TRUE(record->created_from.has_value());
    EXPECT_EQ(*record->created_from, data);
    EXPECT_EQ(op.value()->request().url, "https://example.test/big.iso");
}

TEST_F(TaskManagerTest, RejectsUnusableResumeData) {
    auto empty = manager_->create_download_task(resume_data{}, nullptr, nullptr);
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, error_code::invalid_resume_data);

    auto garbage = manager_->create_download_task(bytes_of("not json"), nullptr, nullptr);
    ASSERT_FALSE(garbage.has_value());
    EXPECT_EQ(garbage.error().code, error_code::invalid_resume_data);
}

// =============================================================================
// Execution
// =============================================================================

TEST_F(TaskManagerTest, EnqueuedDataTaskCompletes) {
    auto capture = std::make_shared<completion_capture<byte_buffer>>();
    auto op = manager_->create_data_task(
        "https://example.test/a", nullptr,
        [capture](data_task_operation&, std::optional<byte_buffer> data, std::optional<error> err) {
            capture->record(std::move(data), std::move(err));
        });
    ASSERT_TRUE(op.has_value());
    ASSERT_TRUE(start(op.value()));

    transport_->send_data(op.value()->identifier(), bytes_of("payload"));
    transport_->complete(op.value()->identifier());

    ASSERT_TRUE(capture->wait());
    EXPECT_EQ(*capture->payload, bytes_of("payload"));
    EXPECT_TRUE(manager_->registry().empty());
    EXPECT_EQ(manager_->router_stats().routed, 2u);
}

TEST_F(TaskManagerTest, DownloadLandsInDownloadDirectory) {
    auto capture = std::make_shared<completion_capture<std::filesystem::path>>();
    auto op = manager_->create_download_task(
        "https://example.test/exports/data.csv", nullptr,
        [capture](download_task_operation&, std::optional<std::filesystem::path> location,
                std::optional<error> err) { capture->record(std::move(location), std::move(err)); });
    ASSERT_TRUE(op.has_value());
    ASSERT_TRUE(start(op.value()));

    auto transient = create_test_file("CFNetworkDownload_1.tmp", 128);
    transport_->finish_download(op.value()->identifier(), transient);
    transport_->complete(op.value()->identifier());

    ASSERT_TRUE(capture->wait());
    ASSERT_TRUE(capture->payload.has_value());
    EXPECT_EQ(*capture->payload, download_dir_ / "data.csv");
    EXPECT_EQ(std::filesystem::file_size(*capture->payload), 128u);
}

TEST_F(TaskManagerTest, DestroyingManagerCancelsInFlight) {
    auto running = std::make_shared<completion_capture<byte_buffer>>();
    auto idle = std::make_shared<completion_capture<byte_buffer>>();
    auto op = manager_->create_data_task(
        "https://example.test/a", nullptr,
        [running](data_task_operation&, std::optional<byte_buffer> data,
                  std::optional<error> err) { running->record(std::move(data), std::move(err)); });
    auto never_enqueued = manager_->create_data_task(
        "https://example.test/b", nullptr,
        [idle](data_task_operation&, std::optional<byte_buffer> data, std::optional<error> err) {
            idle->record(std::move(data), std::move(err));
        });
    ASSERT_TRUE(op.has_value());
    ASSERT_TRUE(never_enqueued.has_value());
    ASSERT_TRUE(start(op.value()));

    manager_.reset();

    ASSERT_EQ(running->count(), 1);
    EXPECT_EQ(running->err->code, error_code::cancelled);
    ASSERT_EQ(idle->count(), 1);
    EXPECT_EQ(idle->err->code, error_code::cancelled);
    EXPECT_TRUE(op.value()->is_cancelled());
    EXPECT_TRUE(transport_->cancelled_on_invalidate());
}

// =============================================================================
// Invalidation and fallbacks
// =============================================================================

TEST_F(TaskManagerTest, InvalidateLetsTasksFinish) {
    auto invalidated = std::make_shared<std::atomic<int>>(0);
    manager_->on_session_invalidated(
        [invalidated](const std::optional<error>&) { invalidated->fetch_add(1); });

    manager_->invalidate();
    manager_->invalidate();

    EXPECT_TRUE(manager_->is_invalidated());
    EXPECT_TRUE(transport_->invalidated());
    EXPECT_FALSE(transport_->cancelled_on_invalidate());
    EXPECT_EQ(invalidated->load(), 1);

    auto op = manager_->create_data_task("https://example.test/a", nullptr, nullptr);
    ASSERT_FALSE(op.has_value());
    EXPECT_EQ(op.error().code, error_code::session_invalidated);
}

TEST_F(TaskManagerTest, InvalidateAndCancelStopsRunningTasks) {
    auto capture = std::make_shared<completion_capture<byte_buffer>>();
    auto op = manager_->create_data_task(
        "https://example.test/a", nullptr,
        [capture](data_task_operation&, std::optional<byte_buffer> data, std::optional<error> err) {
            capture->record(std::move(data), std::move(err));
        });
    ASSERT_TRUE(op.has_value());
    ASSERT_TRUE(start(op.value()));

    manager_->invalidate(true);

    ASSERT_EQ(capture->count(), 1);
    EXPECT_EQ(capture->err->code, error_code::cancelled);
    EXPECT_TRUE(transport_->cancelled_on_invalidate());
}

TEST_F(TaskManagerTest, UnownedCompletionReachesFallback) {
    auto seen = std::make_shared<std::vector<task_identifier>>();
    manager_->on_task_completed_without_operation(
        [seen](task_identifier id, const std::optional<error>&) { seen->push_back(id); });

    transport_->complete(task_identifier{999});

    ASSERT_EQ(seen->size(), 1u);
    EXPECT_EQ(seen->front(), task_identifier{999});
    EXPECT_EQ(manager_->router_stats().fallbacks_invoked, 1u);
}

TEST_F(TaskManagerTest, BackgroundDownloadReachesFallback) {
    auto moved_to = std::make_shared<std::filesystem::path>();
    auto target = download_dir_ / "restored.bin";
    manager_->on_background_download_finished(
        [moved_to, target](task_identifier, const std::filesystem::path& location) {
            if (download_relocator::move_file(location, target)) {
                *moved_to = target;
            }
        });

    auto transient = create_test_file("orphan.tmp", 32);
    transport_->finish_download(task_identifier{500}, transient);

    EXPECT_EQ(*moved_to, target);
    EXPECT_TRUE(std::filesystem::exists(target));
}

TEST_F(TaskManagerTest, DefaultCredentialAnswersSessionChallenge) {
    manager_->set_default_credential(credential{"svc", "pw"});
    std::optional<challenge_disposition> answer;

    transport_->emit_session(session_challenge_event{
        auth_challenge{},
        [&answer](challenge_disposition d, std::optional<credential>) { answer = d; }});

    EXPECT_EQ(answer, challenge_disposition::use_credential);
}

TEST_F(TaskManagerTest, BackgroundEventsFinishedSignalsHost) {
    auto signals = std::make_shared<std::atomic<int>>(0);
    manager_->set_background_events_completion_signal([signals] { signals->fetch_add(1); });

    transport_->emit_session(background_events_finished_event{});

    EXPECT_EQ(signals->load(), 1);
    EXPECT_FALSE(manager_->signal_background_events_completion());
}

}  // namespace kcenon::task_session::test
