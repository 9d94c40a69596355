/**
 * @file test_resume_data.cpp
 * @brief Unit tests for the resume data codec
 */

#include <gtest/gtest.h>

#include <kcenon/task_session/core/resume_data.h>

#include <string>

namespace kcenon::task_session::test {

namespace {

auto bytes(const std::string& text) -> resume_data {
    resume_data data;
    for (char c : text) {
        data.push_back(static_cast<std::byte>(c));
    }
    return data;
}

}  // namespace

class ResumeDataTest : public ::testing::Test {};

TEST_F(ResumeDataTest, EncodedFormIsJson) {
    auto data = encode_resume_data({"https://example.test/a.bin", 1024, "/tmp/a.part"});
    std::string json(reinterpret_cast<const char*>(data.data()), data.size());

    EXPECT_EQ(json.front(), '{');
    EXPECT_EQ(json.back(), '}');
    EXPECT_NE(json.find("\"url\": \"https://example.test/a.bin\""), std::string::npos);
    EXPECT_NE(json.find("\"bytes_received\": 1024"), std::string::npos);
}

TEST_F(ResumeDataTest, DecodeRestoresState) {
    resume_state state{"https://example.test/path with \"quotes\"/a.bin", 4096,
                       "/var/tmp/task_session-9.part"};

    auto decoded = decode_resume_data(encode_resume_data(state));

    // URL with a space is not a valid URL
    EXPECT_FALSE(decoded.has_value());

    state.url = "https://example.test/a%20b/a.bin?sig=\"x\"";
    decoded = decode_resume_data(encode_resume_data(state));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_EQ(decoded.value().url, state.url);
    EXPECT_EQ(decoded.value().bytes_received, 4096u);
    EXPECT_EQ(decoded.value().partial_path, state.partial_path);
}

TEST_F(ResumeDataTest, PartialPathIsOptional) {
    auto decoded = decode_resume_data(bytes(R"({"url": "https://example.test/a", "bytes_received": 0})"));

    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded.value().partial_path.empty());
}

TEST_F(ResumeDataTest, RejectsEmptyData) {
    auto decoded = decode_resume_data({});

    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, error_code::invalid_resume_data);
}

TEST_F(ResumeDataTest, RejectsNonObject) {
    auto decoded = decode_resume_data(bytes("not resume data"));

    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code, error_code::invalid_resume_data);
}

TEST_F(ResumeDataTest, RejectsMissingOrInvalidUrl) {
    EXPECT_FALSE(decode_resume_data(bytes(R"({"bytes_received": 10})")).has_value());
    EXPECT_FALSE(decode_resume_data(bytes(R"({"url": "nowhere", "bytes_received": 10})")).has_value());
}

TEST_F(ResumeDataTest, RejectsBadByteCount) {
    auto missing = decode_resume_data(bytes(R"({"url": "https://example.test/a"})"));
    auto garbage = decode_resume_data(
        bytes(R"({"url": "https://example.test/a", "bytes_received": lots})"));

    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, error_code::invalid_resume_data);
    ASSERT_FALSE(garbage.has_value());
    EXPECT_EQ(garbage.error().code, error_code::invalid_resume_data);
}

}  // namespace kcenon::task_session::test
