/**
 * @file test_core_types.cpp
 * @brief Unit tests for error codes, result and endpoint
 */

#include <gtest/gtest.h>

#include <rawxfer/core/types.h>
#include <rawxfer/server/server_types.h>
#include <rawxfer/client/client_types.h>

#include <memory>
#include <string>

namespace rawxfer::test {

// =============================================================================
// error_code Tests
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    // Request errors: -100 to -119
    EXPECT_EQ(static_cast<int>(error_code::malformed_request), -100);
    EXPECT_EQ(static_cast<int>(error_code::header_too_large), -104);

    // Transfer errors: -120 to -139
    EXPECT_EQ(static_cast<int>(error_code::file_not_found), -120);
    EXPECT_EQ(static_cast<int>(error_code::invalid_response), -123);

    // File I/O errors: -140 to -159
    EXPECT_EQ(static_cast<int>(error_code::file_read_error), -140);
    EXPECT_EQ(static_cast<int>(error_code::file_write_error), -141);

    // Network errors: -160 to -179
    EXPECT_EQ(static_cast<int>(error_code::connection_failed), -160);
    EXPECT_EQ(static_cast<int>(error_code::connection_broken), -162);

    // Lifecycle errors: -200 to -219
    EXPECT_EQ(static_cast<int>(error_code::invalid_configuration), -200);
    EXPECT_EQ(static_cast<int>(error_code::internal_error), -203);
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::invalid_filename), "invalid filename");
    EXPECT_STREQ(to_string(error_code::size_mismatch), "size mismatch");
    EXPECT_STREQ(to_string(error_code::connection_broken), "connection broken");
    EXPECT_STREQ(to_string(static_cast<error_code>(-999)), "unknown error");
}

TEST_F(ErrorCodeTest, ConnectionErrorClassification) {
    EXPECT_TRUE(is_connection_error(error_code::connection_failed));
    EXPECT_TRUE(is_connection_error(error_code::connection_timeout));
    EXPECT_TRUE(is_connection_error(error_code::connection_broken));
    EXPECT_FALSE(is_connection_error(error_code::invalid_filename));
    EXPECT_FALSE(is_connection_error(error_code::file_not_found));
}

// =============================================================================
// error / result Tests
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, ErrorDefaultsToSuccess) {
    error err;
    EXPECT_EQ(err.code, error_code::success);
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST_F(ResultTest, ErrorFromCodeUsesDefaultMessage) {
    error err(error_code::file_not_found);
    EXPECT_TRUE(static_cast<bool>(err));
    EXPECT_EQ(err.message, "file not found");
}

TEST_F(ResultTest, ValueResult) {
    result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
}

TEST_F(ResultTest, ErrorResult) {
    result<int> r = unexpected{error{error_code::invalid_size, "Invalid file size"}};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::invalid_size);
    EXPECT_EQ(r.error().message, "Invalid file size");
}

TEST_F(ResultTest, MoveOnlyValue) {
    result<std::unique_ptr<int>> r(std::make_unique<int>(7));
    ASSERT_TRUE(r.has_value());
    auto owned = std::move(r).value();
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 7);
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = unexpected{error{error_code::not_running}};
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, error_code::not_running);
}

// =============================================================================
// endpoint / config Tests
// =============================================================================

class EndpointTest : public ::testing::Test {};

TEST_F(EndpointTest, PortOnlyBindsAllInterfaces) {
    endpoint ep(10001);
    EXPECT_EQ(ep.host, "0.0.0.0");
    EXPECT_EQ(ep.to_string(), "0.0.0.0:10001");
}

TEST_F(EndpointTest, HostAndPort) {
    endpoint ep("127.0.0.1", 8080);
    EXPECT_EQ(ep.to_string(), "127.0.0.1:8080");
}

class ConfigTest : public ::testing::Test {};

TEST_F(ConfigTest, ServerConfigValidation) {
    server_config config;
    EXPECT_FALSE(config.is_valid());

    config.storage_directory = "storage";
    EXPECT_TRUE(config.is_valid());

    config.worker_count = 0;
    EXPECT_FALSE(config.is_valid());
}

TEST_F(ConfigTest, ClientConfigDefaults) {
    client_config config;
    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 10001);
    EXPECT_EQ(config.chunk_size, 512u * 1024u);
    EXPECT_TRUE(config.is_valid());

    config.server.port = 0;
    EXPECT_FALSE(config.is_valid());
}

TEST_F(ConfigTest, DispatchPolicyNames) {
    EXPECT_STREQ(to_string(dispatch_policy::sequential), "single");
    EXPECT_STREQ(to_string(dispatch_policy::shared_pool), "thread");
    EXPECT_STREQ(to_string(dispatch_policy::isolated_pool), "process");

    EXPECT_EQ(parse_dispatch_policy("thread").value(), dispatch_policy::shared_pool);
    EXPECT_EQ(parse_dispatch_policy("isolated_pool").value(), dispatch_policy::isolated_pool);
    EXPECT_FALSE(parse_dispatch_policy("fork").has_value());
}

TEST_F(ConfigTest, TransferOperationNames) {
    EXPECT_EQ(parse_transfer_operation("upload").value(), transfer_operation::upload);
    EXPECT_EQ(parse_transfer_operation("download").value(), transfer_operation::download);
    EXPECT_FALSE(parse_transfer_operation("delete").has_value());
}

}  // namespace rawxfer::test
