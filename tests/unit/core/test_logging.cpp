/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging
 */

#include <gtest/gtest.h>

#include <rawxfer/core/logging.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace rawxfer::test {

// =============================================================================
// Log Level Tests
// =============================================================================

class LogLevelTest : public ::testing::Test {};

TEST_F(LogLevelTest, LevelNames) {
    EXPECT_EQ(log_level_to_string(log_level::trace), "TRACE");
    EXPECT_EQ(log_level_to_string(log_level::warn), "WARN");
    EXPECT_EQ(log_level_to_string(log_level::fatal), "FATAL");
}

TEST_F(LogLevelTest, ParseLevelNames) {
    EXPECT_EQ(log_level_from_string("debug").value(), log_level::debug);
    EXPECT_EQ(log_level_from_string("warning").value(), log_level::warn);
    EXPECT_EQ(log_level_from_string("error").value(), log_level::error);
    EXPECT_FALSE(log_level_from_string("loud").has_value());
}

// =============================================================================
// JSON Escaping Tests
// =============================================================================

class JsonEscapeTest : public ::testing::Test {};

TEST_F(JsonEscapeTest, EscapesSpecialCharacters) {
    EXPECT_EQ(escape_json_string("plain"), "plain");
    EXPECT_EQ(escape_json_string("a\"b"), "a\\\"b");
    EXPECT_EQ(escape_json_string("a\\b"), "a\\\\b");
    EXPECT_EQ(escape_json_string("line\nbreak\t"), "line\\nbreak\\t");
}

TEST_F(JsonEscapeTest, EscapesControlCharacters) {
    std::string input("\x01", 1);
    EXPECT_EQ(escape_json_string(input), "\\u0001");
}

// =============================================================================
// Transfer Log Context Tests
// =============================================================================

class TransferLogContextTest : public ::testing::Test {};

TEST_F(TransferLogContextTest, EmptyContext) {
    transfer_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(TransferLogContextTest, PopulatedContext) {
    transfer_log_context ctx;
    ctx.filename = "a.bin";
    ctx.file_size = 2048;
    ctx.bytes_transferred = 1024;
    ctx.peer = "127.0.0.1:5000";
    ctx.worker = 3;

    EXPECT_EQ(ctx.to_json(),
              R"({"filename":"a.bin","size":2048,"bytes_transferred":1024,)"
              R"("peer":"127.0.0.1:5000","worker":3})");
}

// =============================================================================
// Structured Log Entry Tests
// =============================================================================

class LogEntryBuilderTest : public ::testing::Test {};

TEST_F(LogEntryBuilderTest, BuildsEntryWithContext) {
    transfer_log_context ctx;
    ctx.filename = "a.bin";
    ctx.bytes_transferred = 10;

    auto entry = log_entry_builder()
        .with_level(log_level::warn)
        .with_category(log_category::transfer)
        .with_message("Upload ended before declared size")
        .with_context(ctx)
        .build();

    EXPECT_EQ(entry.level, log_level::warn);
    EXPECT_EQ(entry.category, "rawxfer.transfer");
    ASSERT_TRUE(entry.context.has_value());
    EXPECT_EQ(entry.context->filename, "a.bin");
    EXPECT_FALSE(entry.timestamp.empty());

    auto json = entry.to_json();
    EXPECT_NE(json.find(R"("level":"WARN")"), std::string::npos);
    EXPECT_NE(json.find(R"("filename":"a.bin")"), std::string::npos);
    EXPECT_NE(json.find(R"("bytes_transferred":10)"), std::string::npos);
}

// =============================================================================
// Transfer Logger Tests
// =============================================================================

class TransferLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = get_logger();
        saved_level_ = logger.get_level();
        logger.set_level(log_level::trace);
        logger.set_callback([this](log_level level, std::string_view category,
                                   std::string_view message,
                                   const transfer_log_context* ctx) {
            records_.push_back({level, std::string(category), std::string(message),
                                ctx != nullptr});
        });
    }

    void TearDown() override {
        auto& logger = get_logger();
        logger.set_callback(nullptr);
        logger.set_json_callback(nullptr);
        logger.enable_json_output(false);
        logger.set_level(saved_level_);
    }

    struct record {
        log_level level;
        std::string category;
        std::string message;
        bool has_context;
    };

    std::vector<record> records_;
    log_level saved_level_ = log_level::info;
};

TEST_F(TransferLoggerTest, MacrosReachCallback) {
    RX_LOG_INFO(log_category::server, "started");

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].level, log_level::info);
    EXPECT_EQ(records_[0].category, "rawxfer.server");
    EXPECT_EQ(records_[0].message, "started");
    EXPECT_FALSE(records_[0].has_context);
}

TEST_F(TransferLoggerTest, ContextMacroPassesContext) {
    transfer_log_context ctx;
    ctx.filename = "a.bin";
    RX_LOG_ERROR_CTX(log_category::client, "failed", ctx);

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_TRUE(records_[0].has_context);
}

TEST_F(TransferLoggerTest, LevelFilter) {
    get_logger().set_level(log_level::warn);

    RX_LOG_DEBUG(log_category::dispatcher, "hidden");
    RX_LOG_INFO(log_category::dispatcher, "hidden");
    RX_LOG_WARN(log_category::dispatcher, "shown");

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].message, "shown");
    EXPECT_FALSE(get_logger().is_enabled(log_level::info));
    EXPECT_TRUE(get_logger().is_enabled(log_level::error));
}

TEST_F(TransferLoggerTest, JsonOutput) {
    std::string captured;
    get_logger().enable_json_output(true);
    get_logger().set_json_callback([&captured](const structured_log_entry&,
                                               const std::string& json) {
        captured = json;
    });

    transfer_log_context ctx;
    ctx.filename = "b.bin";
    ctx.file_size = 5;
    RX_LOG_INFO_CTX(log_category::stress, "done", ctx);

    EXPECT_NE(captured.find(R"("category":"rawxfer.stress")"), std::string::npos);
    EXPECT_NE(captured.find(R"("message":"done")"), std::string::npos);
    EXPECT_NE(captured.find(R"("size":5)"), std::string::npos);
    EXPECT_NE(captured.find(R"("source":{)"), std::string::npos);
}

TEST_F(TransferLoggerTest, ChildForkedWhileAnotherThreadLogsCanStillLog) {
    std::atomic<bool> inside_callback{false};
    get_logger().set_callback([&inside_callback](log_level, std::string_view,
                                                 std::string_view message,
                                                 const transfer_log_context*) {
        if (message == "slow") {
            inside_callback = true;
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    });

    std::thread writer([] { RX_LOG_INFO(log_category::server, "slow"); });
    while (!inside_callback) {
        std::this_thread::yield();
    }

    pid_t pid = ::fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        RX_LOG_INFO(log_category::dispatcher, "from child");
        get_logger().flush();
        ::_exit(0);
    }
    writer.join();

    int status = 0;
    pid_t reaped = 0;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while ((reaped = ::waitpid(pid, &status, WNOHANG)) == 0 &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (reaped == 0) {
        ::kill(pid, SIGKILL);
        ::waitpid(pid, &status, 0);
        FAIL() << "Forked child blocked on the logger";
    }

    ASSERT_EQ(reaped, pid);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}

}  // namespace rawxfer::test
