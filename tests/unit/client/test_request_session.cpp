/**
 * @file test_request_session.cpp
 * @brief Unit tests for the client request/response exchange
 */

#include <gtest/gtest.h>

#include <rawxfer/client/file_transfer_client.h>

#include "utils/memory_stream.h"

#include <memory>
#include <sstream>
#include <string>

namespace rawxfer::test {

class RequestSessionTest : public ::testing::Test {
protected:
    auto make_session(std::string_view server_output) -> request_session {
        auto stream = std::make_unique<memory_stream>(server_output);
        stream_ = stream.get();
        return request_session(std::move(stream), 4);
    }

    memory_stream* stream_ = nullptr;
};

TEST_F(RequestSessionTest, SendRequestFramesAndHalfCloses) {
    auto session = make_session("");
    auto payload = to_bytes("hello");

    ASSERT_TRUE(session.send_request("UPLOAD a.bin 5", payload).has_value());

    EXPECT_EQ(stream_->output_text(), "UPLOAD a.bin 5\r\n\r\nhello");
    EXPECT_TRUE(stream_->write_shut());
}

TEST_F(RequestSessionTest, SendRequestFromStream) {
    auto session = make_session("");
    std::istringstream source("0123456789");

    ASSERT_TRUE(session.send_request("UPLOAD a.bin 10", source, 10).has_value());

    EXPECT_EQ(stream_->output_text(), "UPLOAD a.bin 10\r\n\r\n0123456789");
}

TEST_F(RequestSessionTest, ReceiveMessageResponse) {
    auto session = make_session("{\"status\": \"OK\", \"data\": \"Uploaded a.bin\"}\r\n\r\n");

    auto response = session.receive_response();

    ASSERT_TRUE(response.has_value());
    EXPECT_TRUE(response.value().is_ok());
    EXPECT_EQ(response.value().message, "Uploaded a.bin");
    EXPECT_FALSE(response.value().file.has_value());
}

TEST_F(RequestSessionTest, ReceiveErrorResponse) {
    auto session = make_session("{\"status\": \"ERROR\", \"data\": \"File not found\"}\r\n\r\n");

    auto response = session.receive_response();

    ASSERT_TRUE(response.has_value());
    EXPECT_FALSE(response.value().is_ok());
    EXPECT_EQ(response.value().message, "File not found");
}

TEST_F(RequestSessionTest, ReceiveFilePayload) {
    auto session = make_session(
        "{\"status\": \"OK\", \"data\": {\"filename\": \"a.bin\", \"filesize\": 11}}\r\n\r\n"
        "hello world");

    auto response = session.receive_response();

    ASSERT_TRUE(response.has_value());
    ASSERT_TRUE(response.value().file.has_value());
    EXPECT_EQ(response.value().file->filesize, 11u);
    EXPECT_EQ(to_text(response.value().file_data), "hello world");
    EXPECT_TRUE(response.value().payload_complete());
}

TEST_F(RequestSessionTest, ShortFilePayloadIsIncomplete) {
    auto session = make_session(
        "{\"status\": \"OK\", \"data\": {\"filename\": \"a.bin\", \"filesize\": 100}}\r\n\r\n"
        "short");

    auto response = session.receive_response();

    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response.value().file_data.size(), 5u);
    EXPECT_FALSE(response.value().payload_complete());
}

TEST_F(RequestSessionTest, TruncatedResponseHeader) {
    auto session = make_session("{\"status\": \"OK\"");

    auto response = session.receive_response();

    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, error_code::connection_broken);
}

TEST_F(RequestSessionTest, UnparseableResponseHeader) {
    auto session = make_session("garbage\r\n\r\n");

    auto response = session.receive_response();

    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, error_code::invalid_response);
}

class ServerResponseTest : public ::testing::Test {};

TEST_F(ServerResponseTest, ToStringRendersJson) {
    server_response response;
    response.status = response_status::error;
    response.message = "File not found";

    EXPECT_EQ(response.to_string(), R"({"status": "ERROR", "data": "File not found"})");
}

TEST_F(ServerResponseTest, ToStringIncludesDownloadPath) {
    server_response response;
    response.status = response_status::ok;
    response.file = file_entry{"a.bin", 3};
    response.download_path = std::filesystem::path("out") / "download_a.bin";

    EXPECT_EQ(response.to_string(),
              R"({"status": "OK", "data": {"filename": "a.bin", "filesize": 3}, )"
              R"("download_path": "out/download_a.bin"})");
}

class FileTransferClientBuilderTest : public ::testing::Test {};

TEST_F(FileTransferClientBuilderTest, RejectsInvalidConfiguration) {
    auto client = file_transfer_client::builder()
        .with_server(endpoint{"", 10001})
        .build();

    ASSERT_FALSE(client.has_value());
    EXPECT_EQ(client.error().code, error_code::invalid_configuration);
}

TEST_F(FileTransferClientBuilderTest, AppliesSettings) {
    auto client = file_transfer_client::builder()
        .with_server(endpoint{"10.0.0.1", 9000})
        .with_chunk_size(1024)
        .with_download_directory("downloads")
        .build();

    ASSERT_TRUE(client.has_value());
    EXPECT_EQ(client.value().config().server.port, 9000);
    EXPECT_EQ(client.value().config().chunk_size, 1024u);
    EXPECT_EQ(client.value().config().download_directory, std::filesystem::path("downloads"));
}

TEST_F(FileTransferClientBuilderTest, UploadOfMissingLocalFile) {
    auto client = file_transfer_client::builder().build();
    ASSERT_TRUE(client.has_value());

    auto response = client.value().upload("/nonexistent/rawxfer/file.bin");

    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, error_code::file_read_error);
}

}  // namespace rawxfer::test
