/**
 * @file test_task_operations.cpp
 * @brief Unit tests for data, download and upload task operations
 *
 * Events are handed to the operations directly; the session router is
 * covered by the session tests.
 */

#include <gtest/gtest.h>

#include "test_fixtures.h"

#include <fstream>
#include <string>
#include <vector>

namespace kcenon::task_session::test {

class TaskOperationTest : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        transport_ = std::make_shared<fake_transport>();
        transport_->complete_on_cancel = false;
        executor_ = std::make_shared<inline_callback_executor>();
    }

    auto make_task(const std::string& kind, const std::string& url)
        -> std::unique_ptr<transport_task> {
        auto created = transport_->create(kind, url_request{url});
        EXPECT_TRUE(created.has_value());
        return std::move(created).value();
    }

    auto make_transient(const std::string& content) -> std::filesystem::path {
        auto path = test_dir_ / ("transient-" + std::to_string(++transient_counter_) + ".tmp");
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    std::shared_ptr<fake_transport> transport_;
    std::shared_ptr<callback_executor> executor_;
    int transient_counter_{0};
};

// =============================================================================
// Common lifecycle
// =============================================================================

TEST_F(TaskOperationTest, TakesIdentityFromTransportTask) {
    transport_->force_next_identifier(77);
    auto op = std::make_shared<data_task_operation>(
        make_task("data", "https://example.test/a"), executor_, nullptr, nullptr);

    EXPECT_EQ(op->identifier(), task_identifier{77});
    EXPECT_EQ(op->kind(), task_kind::data);
    EXPECT_EQ(op->request().url, "https://example.test/a");
    EXPECT_EQ(op->name(), "data-77");
    EXPECT_EQ(op->executor(), executor_);
}

TEST_F(TaskOperationTest, StartResumesTransportTask) {
    auto op = std::make_shared<data_task_operation>(
        make_task("data", "https://example.test/a"), executor_, nullptr, nullptr);

    op->start();

    auto record = transport_->task(op->identifier());
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->resume_calls.load(), 1);
    EXPECT_TRUE(op->is_executing());
}

TEST_F(TaskOperationTest, CancelWaitsForTransportConfirmation) {
    completion_capture<byte_buffer> capture;
    auto op = std::make_shared<data_task_operation>(
        make_task("data", "https://example.test/a"), executor_, nullptr,
        [&capture](data_task_operation&, std::optional<byte_buffer> data,
                 std::optional<error> err) { capture.record(std::move(data), std::move(err)); });
    op->start();

    op->cancel();
    op->cancel();

    EXPECT_EQ(transport_->task(op->identifier())->cancel_calls.load(), 1);
    EXPECT_FALSE(op->is_finished());

    op->handle_event(task_completed_event{op->identifier(), error{error_code::cancelled}});

    EXPECT_TRUE(op->is_cancelled());
    EXPECT_TRUE(op->is_finished());
    ASSERT_EQ(capture.count(), 1);
    ASSERT_TRUE(capture.err.has_value());
    EXPECT_EQ(capture.err->code, error_code::cancelled);
}

TEST_F(TaskOperationTest, StartWithoutTransportTaskFails) {
    completion_capture<byte_buffer> capture;
    auto op = std::make_shared<data_task_operation>(
        nullptr, executor_, nullptr,
        [&capture](data_task_operation&, std::optional<byte_buffer> data,
                 std::optional<error> err) { capture.record(std::move(data), std::move(err)); });

    op->start();

    EXPECT_TRUE(op->is_finished());
    EXPECT_FALSE(op->is_cancelled());
    ASSERT_EQ(capture.count(), 1);
    ASSERT_TRUE(capture.err.has_value());
    EXPECT_EQ(capture.err->code, error_code::internal_error);
}

TEST_F(TaskOperationTest, CancelBeforeStartNeverResumes) {
    auto op = std::make_shared<data_task_operation>(
        make_task("data", "https://example.test/a"), executor_, nullptr, nullptr);

    op->cancel();
    op->start();

    auto record = transport_->task(op->identifier());
    EXPECT_EQ(record->resume_calls.load(), 0);
    EXPECT_EQ(record->cancel_calls.load(), 1);
    EXPECT_FALSE(op->is_finished());

    op->handle_event(task_completed_event{op->identifier(), error{error_code::cancelled}});
    EXPECT_TRUE(op->is_cancelled());
}

TEST_F(TaskOperationTest, TransportErrorFinishesNotCancelled) {
    completion_capture<byte_buffer> capture;
    auto op = std::make_shared<data_task_operation>(
        make_task("data", "https://example.test/a"), executor_, nullptr,
        [&capture](data_task_operation&, std::optional<byte_buffer> data,
                 std::optional<error> err) { capture.record(std::move(data), std::move(err)); });
    op->start();

    op->handle_event(task_completed_event{op->identifier(),
                                          error{error_code::connection_lost, "reset"}});

    EXPECT_EQ(op->state(), operation_state::finished);
    ASSERT_TRUE(op->terminal_error().has_value());
    EXPECT_EQ(op->terminal_error()->code, error_code::connection_lost);
    EXPECT_FALSE(capture.payload.has_value());
}

TEST_F(TaskOperationTest, EventsAfterTerminalAreIgnored) {
    completion_capture<byte_buffer> capture;
    auto op = std::make_shared<data_task_operation>(
        make_task("data", "https://example.test/a"), executor_, nullptr,
        [&capture](data_task_operation&, std::optional<byte_buffer> data,
                 std::optional<error> err) { capture.record(std::move(data), std::move(err)); });
    op->start();

    op->handle_event(task_completed_event{op->identifier(), std::nullopt});
    op->handle_event(data_received_event{op->identifier(), filled(5, 1), 5});
    op->handle_event(task_completed_event{op->identifier(), error{error_code::transport_error}});

    EXPECT_EQ(capture.count(), 1);
    EXPECT_FALSE(capture.err.has_value());
    EXPECT_EQ(op->bytes_received(), 0u);
}

TEST_F(TaskOperationTest, TerminalRemovesFromRegistry) {
    auto registry = std::make_shared<task_registry>();
    auto op = std::make_shared<data_task_operation>(
        make_task("data", "https://example.test/a"), executor_, nullptr, nullptr);
    ASSERT_TRUE(registry->insert(op->identifier(), op).has_value());
    op->attach_registry(registry);
    op->start();

    op->handle_event(task_completed_event{op->identifier(), std::nullopt});

    EXPECT_FALSE(registry->contains(op->identifier()));
}

TEST_F(TaskOperationTest, ForceTerminateCompletesOnce) {
    completion_capture<byte_buffer> capture;
    auto op = std::make_shared<data_task_operation>(
        make_task("data", "https://example.test/a"), executor_, nullptr,
        [&capture](data_task_operation&, std::optional<byte_buffer> data,
                 std::optional<error> err) { capture.record(std::move(data), std::move(err)); });
    op->start();

    op->force_terminate(error{error_code::cancelled, "session invalidated"});
    op->handle_event(task_completed_event{op->identifier(), std::nullopt});

    EXPECT_TRUE(op->is_cancelled());
    EXPECT_EQ(capture.count(), 1);
    EXPECT_EQ(capture.err->message, "session invalidated");
}

TEST_F(TaskOperationTest, CompletionRunsOnExecutor) {
    auto serial = std::make_shared<serial_callback_executor>("operation-test");
    completion_capture<byte_buffer> capture;
    std::atomic<bool> on_executor{false};
    auto op = std::make_shared<data_task_operation>(
        make_task("data", "https://example.test/a"), serial, nullptr,
        [&](data_task_operation&, std::optional<byte_buffer> data, std::optional<error> err) {
            on_executor = serial->is_current();
            capture.record(std::move(data), std::move(err));
        });
    op->start();

    op->handle_event(task_completed_event{op->identifier(), std::nullopt});

    ASSERT_TRUE(capture.wait());
    EXPECT_TRUE(on_executor.load());
    EXPECT_TRUE(op->wait_until_finished_for(std::chrono::seconds(5)));
}

// =============================================================================
// Authentication challenges
// =============================================================================

TEST_F(TaskOperationTest, ChallengeWithoutConfigurationUsesDefaultHandling) {
    auto op = std::make_shared<data_task_operation>(
        make_task("data", "https://example.test/a"), executor_, nullptr, nullptr);
    op->start();
    std::optional<challenge_disposition> answer;

    op->handle_event(task_challenge_event{
        op->identifier(), auth_challenge{},
        [&answer](challenge_disposition d, std::optional<credential>) { answer = d; }});

    ASSERT_TRUE(answer.has_value());
    EXPECT_EQ(*answer, challenge_disposition::perform_default_handling);
}

TEST_F(TaskOperationTest, CredentialAnswersFirstChallenge) {
    auto op = std::make_shared<data_task_operation>(
        make_task("data", "https://example.test/a"), executor_, nullptr, nullptr);
    op->set_credential(credential{"alice", "secret"});
    op->start();
    std::optional<challenge_disposition> answer;
    std::optional<credential> sent;

    op->handle_event(task_challenge_event{
        op->identifier(), auth_challenge{},
        [&](challenge_disposition d, std::optional<credential> c) {
            answer = d;
            sent = std::move(c);
        }});

    ASSERT_TRUE(answer.has_value());
    EXPECT_EQ(*answer, challenge_disposition::use_credential);
    ASSERT_TRUE(sent.has_value());
    EXPECT_EQ(sent->user, "alice");
}

TEST_F(TaskOperationTest, RejectedCredentialFailsAuthentication) {
    completion_capture<byte_buffer> capture;
    auto op = std::make_shared<data_task_operation>(
        make_task("data", "https://example.test/a"), executor_, nullptr,
        [&capture](data_task_operation&, std::optional<byte_buffer> data,
                 std::optional<error> err) { capture.record(std::move(data), std::move(err)); });
    op->set_credential(credential{"alice", "wrong"});
    op->start();

    auth_challenge retry;
    retry.previous_failure_count = 1;
    std::optional<challenge_disposition> answer;
    op->handle_event(task_challenge_event{
        op->identifier(), retry,
        [&answer](challenge_disposition d, std::optional<credential>) { answer = d; }});
    op->handle_event(task_completed_event{op->identifier(), error{error_code::cancelled}});

    EXPECT_EQ(answer, challenge_disposition::cancel_challenge);
    ASSERT_TRUE(capture.err.has_value());
    EXPECT_EQ(capture.err->code, error_code::authentication_failed);
    EXPECT_EQ(op->state(), operation_state::finished);
}

TEST_F(TaskOperationTest, ChallengeHandlerDecides) {
    auto op = std::make_shared<data_task_operation>(
        make_task("data", "https://example.test/a"), executor_, nullptr, nullptr);
    std::string seen_realm;
    op->set_challenge_handler([&seen_realm](task_operation&, const auth_challenge& ch,
                                            challenge_reply reply) {
        seen_realm = ch.space.realm;
        reply(challenge_disposition::reject_protection_space, std::nullopt);
    });
    op->start();

    auth_challenge ch;
    ch.space.realm = "files";
    std::optional<challenge_disposition> answer;
    op->handle_event(task_challenge_event{
        op->identifier(), ch,
        [&answer](challenge_disposition d, std::optional<credential>) { answer = d; }});

    EXPECT_EQ(seen_realm, "files");
    EXPECT_EQ(answer, challenge_disposition::reject_protection_space);
}

TEST_F(TaskOperationTest, ChallengeAfterTerminalIsCancelled) {
    auto op = std::make_shared<data_task_operation>(
        make_task("data", "https://example.test/a"), executor_, nullptr, nullptr);
    op->start();
    op->handle_event(task_completed_event{op->identifier(), std::nullopt});

    std::optional<challenge_disposition> answer;
    op->handle_event(task_challenge_event{
        op->identifier(), auth_challenge{},
        [&answer](challenge_disposition d, std::optional<credential>) { answer = d; }});

    EXPECT_EQ(answer, challenge_disposition::cancel_challenge);
}

// =============================================================================
// Data tasks
// =============================================================================

TEST_F(TaskOperationTest, DataTaskAccumulatesBody) {
    completion_capture<byte_buffer> capture;
    auto op = std::make_shared<data_task_operation>(
        make_task("data", "https://example.test/a"), executor_, nullptr,
        [&capture](data_task_operation&, std::optional<byte_buffer> data,
                 std::optional<error> err) { capture.record(std::move(data), std::move(err)); });
    op->start();

    op->handle_event(data_received_event{op->identifier(), bytes_of("hello "), 11});
    op->handle_event(data_received_event{op->identifier(), bytes_of("world"), 11});
    op->handle_event(task_completed_event{op->identifier(), std::nullopt});

    ASSERT_TRUE(capture.payload.has_value());
    EXPECT_EQ(*capture.payload, bytes_of("hello world"));
    EXPECT_FALSE(capture.err.has_value());
    EXPECT_EQ(op->bytes_received(), 11u);
    EXPECT_EQ(op->bytes_expected(), 11);
    EXPECT_FALSE(op->has_progress_handler());
}

TEST_F(TaskOperationTest, DataTaskStreamsToProgressHandler) {
    std::vector<std::pair<std::size_t, uint64_t>> chunks;
    completion_capture<byte_buffer> capture;
    auto op = std::make_shared<data_task_operation>(
        make_task("data", "https://example.test/a"), executor_,
        [&chunks](data_task_operation&, const byte_buffer& chunk, uint64_t received, int64_t) {
            chunks.emplace_back(chunk.size(), received);
        },
        [&capture](data_task_operation&, std::optional<byte_buffer> data,
                 std::optional<error> err) { capture.record(std::move(data), std::move(err)); });
    op->start();

    op->handle_event(data_received_event{op->identifier(), filled(4, 1)});
    op->handle_event(data_received_event{op->identifier(), filled(6, 2)});
    op->handle_event(task_completed_event{op->identifier(), std::nullopt});

    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0], (std::pair<std::size_t, uint64_t>{4, 4}));
    EXPECT_EQ(chunks[1], (std::pair<std::size_t, uint64_t>{6, 10}));
    EXPECT_EQ(capture.count(), 1);
    EXPECT_FALSE(capture.payload.has_value());
    EXPECT_FALSE(capture.err.has_value());
}

// =============================================================================
// Download tasks
// =============================================================================

TEST_F(TaskOperationTest, DownloadRelocatesIntoDirectory) {
    completion_capture<std::filesystem::path> capture;
    auto op = std::make_shared<download_task_operation>(
        make_task("download", "https://example.test/files/report.pdf?sig=1"), executor_,
        nullptr,
        [&capture](download_task_operation&, std::optional<std::filesystem::path> location,
                 std::optional<error> err) { capture.record(std::move(location), std::move(err)); },
        download_relocator(download_dir_));
    op->start();

    auto transient = make_transient("pdf-bytes");
    op->handle_event(download_finished_event{op->identifier(), transient});
    EXPECT_FALSE(std::filesystem::exists(transient));

    op->handle_event(task_completed_event{op->identifier(), std::nullopt});

    ASSERT_TRUE(capture.payload.has_value());
    EXPECT_EQ(*capture.payload, download_dir_ / "report.pdf");
    EXPECT_TRUE(std::filesystem::exists(*capture.payload));
    EXPECT_EQ(op->location(), capture.payload);
}

TEST_F(TaskOperationTest, DownloadDestinationHandlerChoosesPath) {
    completion_capture<std::filesystem::path> capture;
    auto op = std::make_shared<download_task_operation>(
        make_task("download", "https://example.test/a.bin"), executor_, nullptr,
        [&capture](download_task_operation&, std::optional<std::filesystem::path> location,
                 std::optional<error> err) { capture.record(std::move(location), std::move(err)); },
        download_relocator(download_dir_));
    auto destination = test_dir_ / "chosen" / "final.bin";
    op->set_destination_handler(
        [destination](download_task_operation&, const std::filesystem::path&) {
            return destination;
        });
    op->start();

    op->handle_event(download_finished_event{op->identifier(), make_transient("abc")});
    op->handle_event(task_completed_event{op->identifier(), std::nullopt});

    ASSERT_TRUE(capture.payload.has_value());
    EXPECT_EQ(*capture.payload, destination);
    EXPECT_TRUE(std::filesystem::exists(destination));
}

TEST_F(TaskOperationTest, DownloadWithoutDestinationFails) {
    completion_capture<std::filesystem::path> capture;
    auto op = std::make_shared<download_task_operation>(
        make_task("download", "https://example.test/a.bin"), executor_, nullptr,
        [&capture](download_task_operation&, std::optional<std::filesystem::path> location,
                 std::optional<error> err) { capture.record(std::move(location), std::move(err)); });
    op->start();

    op->handle_event(download_finished_event{op->identifier(), make_transient("abc")});
    op->handle_event(task_completed_event{op->identifier(), std::nullopt});

    ASSERT_TRUE(capture.err.has_value());
    EXPECT_EQ(capture.err->code, error_code::file_write_error);
    EXPECT_FALSE(capture.payload.has_value());
}

TEST_F(TaskOperationTest, DownloadCompletedWithoutFileFails) {
    completion_capture<std::filesystem::path> capture;
    auto op = std::make_shared<download_task_operation>(
        make_task("download", "https://example.test/a.bin"), executor_, nullptr,
        [&capture](download_task_operation&, std::optional<std::filesystem::path> location,
                 std::optional<error> err) { capture.record(std::move(location), std::move(err)); },
        download_relocator(download_dir_));
    op->start();

    op->handle_event(task_completed_event{op->identifier(), std::nullopt});

    ASSERT_TRUE(capture.err.has_value());
    EXPECT_EQ(capture.err->code, error_code::file_not_found);
}

TEST_F(TaskOperationTest, DownloadReportsWriteProgress) {
    std::vector<uint64_t> totals;
    auto op = std::make_shared<download_task_operation>(
        make_task("download", "https://example.test/a.bin"), executor_,
        [&totals](download_task_operation&, uint64_t, uint64_t total, int64_t expected) {
            EXPECT_EQ(expected, 300);
            totals.push_back(total);
        },
        nullptr, download_relocator(download_dir_));
    op->start();

    op->handle_event(download_progress_event{op->identifier(), 100, 100, 300});
    op->handle_event(download_progress_event{op->identifier(), 200, 300, 300});

    EXPECT_EQ(totals, (std::vector<uint64_t>{100, 300}));
    EXPECT_EQ(op->bytes_written(), 300u);
    EXPECT_EQ(op->total_bytes_expected(), 300);
}

TEST_F(TaskOperationTest, CancelProducingResumeDataAttachesData) {
    auto expected = encode_resume_data({"https://example.test/big.iso", 4096, "/tmp/p"});
    transport_->set_resume_data(expected);
    completion_capture<std::filesystem::path> capture;
    std::optional<resume_data> handed;
    auto op = std::make_shared<download_task_operation>(
        make_task("download", "https://example.test/big.iso"), executor_, nullptr,
        [&capture](download_task_operation&, std::optional<std::filesystem::path> location,
                 std::optional<error> err) { capture.record(std::move(location), std::move(err)); },
        download_relocator(download_dir_));
    op->start();

    op->cancel_producing_resume_data([&handed](std::optional<resume_data> data) {
        handed = std::move(data);
    });
    op->handle_event(task_completed_event{op->identifier(), error{error_code::cancelled}});

    EXPECT_TRUE(transport_->task(op->identifier())->resume_data_requested.load());
    ASSERT_TRUE(handed.has_value());
    EXPECT_EQ(*handed, expected);
    EXPECT_EQ(op->produced_resume_data(), expected);
    ASSERT_TRUE(capture.err.has_value());
    EXPECT_EQ(capture.err->code, error_code::cancelled);
    ASSERT_TRUE(capture.err->resume_data.has_value());
    EXPECT_EQ(*capture.err->resume_data, expected);
    EXPECT_TRUE(op->is_cancelled());
}

TEST_F(TaskOperationTest, ResumeDataAfterPlainCancelIsEmpty) {
    completion_capture<std::filesystem::path> capture;
    std::vector<std::optional<resume_data>> handed;
    auto op = std::make_shared<download_task_operation>(
        make_task("download", "https://example.test/big.iso"), executor_, nullptr,
        [&capture](download_task_operation&, std::optional<std::filesystem::path> location,
                 std::optional<error> err) { capture.record(std::move(location), std::move(err)); },
        download_relocator(download_dir_));
    op->start();

    op->cancel();
    op->cancel_producing_resume_data([&handed](std::optional<resume_data> data) {
        handed.push_back(std::move(data));
    });

    auto record = transport_->task(op->identifier());
    EXPECT_EQ(record->cancel_calls.load(), 1);
    EXPECT_FALSE(record->resume_data_requested.load());
    ASSERT_EQ(handed.size(), 1u);
    EXPECT_FALSE(handed.front().has_value());

    op->handle_event(task_completed_event{op->identifier(), error{error_code::cancelled}});

    ASSERT_TRUE(capture.err.has_value());
    EXPECT_EQ(capture.err->code, error_code::cancelled);
    EXPECT_FALSE(capture.err->resume_data.has_value());
}

// =============================================================================
// Upload tasks
// =============================================================================

TEST_F(TaskOperationTest, UploadReportsProgressAndResponse) {
    std::vector<uint64_t> totals;
    completion_capture<byte_buffer> capture;
    auto op = std::make_shared<upload_task_operation>(
        make_task("upload", "https://example.test/upload"), executor_,
        [&totals](upload_task_operation&, uint64_t, uint64_t total, int64_t) {
            totals.push_back(total);
        },
        [&capture](upload_task_operation&, std::optional<byte_buffer> response,
                 std::optional<error> err) { capture.record(std::move(response), std::move(err)); });
    op->start();

    op->handle_event(upload_progress_event{op->identifier(), 50, 50, 100});
    op->handle_event(upload_progress_event{op->identifier(), 50, 100, 100});
    op->handle_event(data_received_event{op->identifier(), bytes_of("{\"ok\":true}")});
    op->handle_event(task_completed_event{op->identifier(), std::nullopt});

    EXPECT_EQ(totals, (std::vector<uint64_t>{50, 100}));
    EXPECT_EQ(op->bytes_sent(), 100u);
    EXPECT_EQ(op->total_bytes_expected_to_send(), 100);
    ASSERT_TRUE(capture.payload.has_value());
    EXPECT_EQ(*capture.payload, bytes_of("{\"ok\":true}"));
}

}  // namespace kcenon::task_session::test
