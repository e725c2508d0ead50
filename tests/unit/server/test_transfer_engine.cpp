/**
 * @file test_transfer_engine.cpp
 * @brief Unit tests for server-side UPLOAD and GET handling
 */

#include <gtest/gtest.h>

#include <rawxfer/server/transfer_engine.h>

#include "utils/memory_stream.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <random>
#include <string>

namespace rawxfer::test {

class TransferEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        storage_dir_ = std::filesystem::temp_directory_path() /
                       ("rawxfer_engine_test_" + std::to_string(std::random_device{}()));
        auto storage = storage_directory::create(storage_dir_);
        ASSERT_TRUE(storage.has_value());
        engine_.emplace(storage.value(), 8);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(storage_dir_, ec);
    }

    auto read_stored(const std::string& name) -> std::string {
        std::ifstream in(storage_dir_ / name, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    void store(const std::string& name, const std::string& content) {
        std::ofstream out(storage_dir_ / name, std::ios::binary);
        out << content;
    }

    static auto framed(const std::string& json) -> std::string {
        return json + "\r\n\r\n";
    }

    std::filesystem::path storage_dir_;
    std::optional<transfer_engine> engine_;
};

// =============================================================================
// UPLOAD
// =============================================================================

TEST_F(TransferEngineTest, UploadWithPayloadInHeaderRead) {
    memory_stream stream("UPLOAD a.bin 5\r\n\r\nhello");

    auto outcome = engine_->handle_connection(stream, "test-peer");

    EXPECT_TRUE(outcome.success);
    ASSERT_TRUE(outcome.command.has_value());
    EXPECT_EQ(outcome.command.value(), command_type::upload);
    EXPECT_EQ(outcome.filename, "a.bin");
    EXPECT_EQ(outcome.bytes_received, 5u);
    EXPECT_EQ(stream.output_text(), framed(R"({"status": "OK", "data": "Uploaded a.bin"})"));
    EXPECT_EQ(read_stored("a.bin"), "hello");
}

TEST_F(TransferEngineTest, UploadSplitAcrossManyReads) {
    std::string payload(1000, 'z');
    memory_stream stream("UPLOAD big.bin 1000\r\n\r\n" + payload);
    stream.set_max_read(3);

    auto outcome = engine_->handle_connection(stream);

    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(read_stored("big.bin"), payload);
}

TEST_F(TransferEngineTest, ZeroByteUpload) {
    memory_stream stream("UPLOAD empty.bin 0\r\n\r\n");

    auto outcome = engine_->handle_connection(stream);

    EXPECT_TRUE(outcome.success);
    EXPECT_TRUE(std::filesystem::is_regular_file(storage_dir_ / "empty.bin"));
    EXPECT_EQ(std::filesystem::file_size(storage_dir_ / "empty.bin"), 0u);
    EXPECT_EQ(stream.output_text(), framed(R"({"status": "OK", "data": "Uploaded empty.bin"})"));
}

TEST_F(TransferEngineTest, UploadOverwritesExisting) {
    store("a.bin", "previous content that is longer");
    memory_stream stream("UPLOAD a.bin 3\r\n\r\nnew");

    auto outcome = engine_->handle_connection(stream);

    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(read_stored("a.bin"), "new");
}

TEST_F(TransferEngineTest, ShortUploadReported) {
    memory_stream stream("UPLOAD a.bin 10\r\n\r\nabc");

    auto outcome = engine_->handle_connection(stream);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.bytes_received, 3u);
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->code, error_code::incomplete_transfer);
    EXPECT_EQ(stream.output_text(),
              framed(R"({"status": "ERROR", "data": "Incomplete file received"})"));
}

TEST_F(TransferEngineTest, MorePayloadThanDeclaredRejected) {
    memory_stream stream("UPLOAD a.bin 2\r\n\r\nabcdef");

    auto outcome = engine_->handle_connection(stream);

    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->code, error_code::size_mismatch);
    EXPECT_EQ(stream.output_text(),
              framed(R"({"status": "ERROR", "data": "File size smaller than received data"})"));
    EXPECT_FALSE(std::filesystem::exists(storage_dir_ / "a.bin"));
}

TEST_F(TransferEngineTest, BytesPastDeclaredSizeLeftUnread) {
    auto storage = storage_directory::create(storage_dir_);
    ASSERT_TRUE(storage.has_value());
    transfer_engine engine(storage.value(), 64);
    std::string header = "UPLOAD a.bin 4\r\n\r\n";
    memory_stream stream(header);
    stream.append_input("abcdEXTRA");
    stream.set_max_read(header.size());

    auto outcome = engine.handle_connection(stream);

    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(read_stored("a.bin"), "abcd");
    EXPECT_EQ(stream.remaining(), 5u);
}

TEST_F(TransferEngineTest, UploadInvalidFilenameCreatesNothing) {
    memory_stream stream("UPLOAD ../escape.bin 3\r\n\r\nabc");

    auto outcome = engine_->handle_connection(stream);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(stream.output_text(), framed(R"({"status": "ERROR", "data": "Invalid filename"})"));
    EXPECT_FALSE(std::filesystem::exists(storage_dir_.parent_path() / "escape.bin"));
    EXPECT_TRUE(std::filesystem::is_empty(storage_dir_));
}

TEST_F(TransferEngineTest, TransportErrorDuringUploadSendsNothing) {
    memory_stream stream("UPLOAD a.bin 10\r\n\r\nabc");
    stream.fail_reads_at_end(true);

    auto outcome = engine_->handle_connection(stream);

    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->code, error_code::connection_broken);
    EXPECT_TRUE(stream.output().empty());
}

TEST_F(TransferEngineTest, FailedFlushOnCloseReportsError) {
    if (!std::filesystem::exists("/dev/full")) {
        GTEST_SKIP() << "/dev/full not available";
    }
    std::filesystem::create_symlink("/dev/full", storage_dir_ / "full.bin");
    memory_stream stream("UPLOAD full.bin 5\r\n\r\nhello");

    auto outcome = engine_->handle_connection(stream);

    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->code, error_code::file_write_error);
    EXPECT_EQ(stream.output_text(),
              framed(R"({"status": "ERROR", "data": "Failed to write uploaded data"})"));
}

TEST_F(TransferEngineTest, ExceptionDuringUploadBecomesErrorResponse) {
    memory_stream stream("UPLOAD a.bin 10\r\n\r\nabc");
    stream.throw_reads_at_end(true);

    auto outcome = engine_->handle_connection(stream);

    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->code, error_code::internal_error);
    EXPECT_EQ(stream.output_text(), framed(R"({"status": "ERROR", "data": "stream fault"})"));
}

TEST_F(TransferEngineTest, ExceptionWhileReadingHeaderBecomesErrorResponse) {
    memory_stream stream("GET a.bin");
    stream.throw_reads_at_end(true);

    auto outcome = engine_->handle_connection(stream);

    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->code, error_code::internal_error);
    EXPECT_EQ(stream.output_text(), framed(R"({"status": "ERROR", "data": "stream fault"})"));
}

// =============================================================================
// GET
// =============================================================================

TEST_F(TransferEngineTest, GetSendsHeaderThenBytes) {
    store("a.bin", "0123456789ABCDEF!");
    memory_stream stream("GET a.bin 0\r\n\r\n");

    auto outcome = engine_->handle_connection(stream);

    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.bytes_sent, 17u);
    EXPECT_EQ(stream.output_text(),
              framed(R"({"status": "OK", "data": {"filename": "a.bin", "filesize": 17}})") +
              "0123456789ABCDEF!");
}

TEST_F(TransferEngineTest, GetEmptyFile) {
    store("empty.bin", "");
    memory_stream stream("GET empty.bin 0\r\n\r\n");

    auto outcome = engine_->handle_connection(stream);

    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(stream.output_text(),
              framed(R"({"status": "OK", "data": {"filename": "empty.bin", "filesize": 0}})"));
}

TEST_F(TransferEngineTest, GetMissingFile) {
    memory_stream stream("GET missing.bin 0\r\n\r\n");

    auto outcome = engine_->handle_connection(stream);

    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->code, error_code::file_not_found);
    EXPECT_EQ(stream.output_text(), framed(R"({"status": "ERROR", "data": "File not found"})"));
}

TEST_F(TransferEngineTest, GetInvalidFilename) {
    memory_stream stream("GET ../../etc/passwd 0\r\n\r\n");

    auto outcome = engine_->handle_connection(stream);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(stream.output_text(), framed(R"({"status": "ERROR", "data": "Invalid filename"})"));
}

TEST_F(TransferEngineTest, GetPeerGoneAfterHeader) {
    store("a.bin", std::string(100, 'q'));
    memory_stream stream("GET a.bin 0\r\n\r\n");
    auto header = framed(R"({"status": "OK", "data": {"filename": "a.bin", "filesize": 100}})");
    stream.set_write_limit(header.size() + 10);

    auto outcome = engine_->handle_connection(stream);

    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->code, error_code::connection_broken);
}

// =============================================================================
// Request errors
// =============================================================================

TEST_F(TransferEngineTest, MalformedRequest) {
    memory_stream stream("HELLO\r\n\r\n");

    auto outcome = engine_->handle_connection(stream);

    EXPECT_FALSE(outcome.success);
    EXPECT_FALSE(outcome.command.has_value());
    EXPECT_EQ(stream.output_text(),
              framed(R"({"status": "ERROR", "data": "Invalid command format"})"));
}

TEST_F(TransferEngineTest, InvalidSize) {
    memory_stream stream("UPLOAD a.bin -1\r\n\r\n");

    auto outcome = engine_->handle_connection(stream);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(stream.output_text(), framed(R"({"status": "ERROR", "data": "Invalid file size"})"));
}

TEST_F(TransferEngineTest, UnknownCommand) {
    memory_stream stream("DELETE a.bin 0\r\n\r\n");

    auto outcome = engine_->handle_connection(stream);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(stream.output_text(), framed(R"({"status": "ERROR", "data": "Invalid command"})"));
}

TEST_F(TransferEngineTest, TruncatedHeaderGetsNoResponse) {
    memory_stream stream("UPLOAD a.bin 5");

    auto outcome = engine_->handle_connection(stream);

    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->code, error_code::malformed_request);
    EXPECT_TRUE(stream.output().empty());
}

TEST_F(TransferEngineTest, OversizedHeaderRejected) {
    auto storage = storage_directory::create(storage_dir_);
    ASSERT_TRUE(storage.has_value());
    transfer_engine limited(storage.value(), 16, 64);
    memory_stream stream(std::string(500, 'A'));

    auto outcome = limited.handle_connection(stream);

    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.failure.has_value());
    EXPECT_EQ(outcome.failure->code, error_code::header_too_large);
    EXPECT_EQ(stream.output_text(),
              framed(R"({"status": "ERROR", "data": "Request header too large"})"));
}

}  // namespace rawxfer::test
