/**
 * @file test_concurrency.cpp
 * @brief Concurrent transfer tests across dispatch policies
 */

#include "test_fixtures.h"

#include <atomic>

namespace rawxfer::test {

class ConcurrencyTest : public ServerFixture {
protected:
    static constexpr std::size_t file_count = 4;
    static constexpr std::size_t file_size = 2 * 1024 * 1024;

    auto make_files() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> files;
        for (std::size_t i = 0; i < file_count; ++i) {
            files.push_back(create_test_file("concurrent_" + std::to_string(i) + ".bin",
                                             file_size, static_cast<unsigned>(100 + i)));
        }
        return files;
    }

    /**
     * @brief Upload every file from its own thread, then fetch them all back
     */
    void upload_and_verify(const std::vector<std::filesystem::path>& files) {
        auto client = make_client();
        std::atomic<std::size_t> uploaded{0};

        std::vector<std::thread> threads;
        for (const auto& file : files) {
            threads.emplace_back([&client, &uploaded, file] {
                auto response = client.upload(file);
                if (response && response.value().is_ok()) {
                    ++uploaded;
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        ASSERT_EQ(uploaded.load(), files.size());

        std::atomic<std::size_t> downloaded{0};
        threads.clear();
        for (const auto& file : files) {
            auto name = file.filename().string();
            threads.emplace_back([&client, &downloaded, name] {
                auto response = client.download(name);
                if (response && response.value().is_ok()) {
                    ++downloaded;
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        ASSERT_EQ(downloaded.load(), files.size());

        for (const auto& file : files) {
            auto name = file.filename().string();
            EXPECT_TRUE(files_equal(file, storage_dir_ / name)) << name;
            EXPECT_TRUE(files_equal(file, download_dir_ / ("download_" + name))) << name;
        }
    }
};

TEST_F(ConcurrencyTest, SharedPoolConcurrentUploads) {
    start_server(dispatch_policy::shared_pool, 4);
    upload_and_verify(make_files());
}

TEST_F(ConcurrencyTest, SequentialQueuesConcurrentClients) {
    start_server(dispatch_policy::sequential, 1);
    upload_and_verify(make_files());
}

TEST_F(ConcurrencyTest, IsolatedPoolConcurrentUploads) {
    start_server(dispatch_policy::isolated_pool, 2);
    upload_and_verify(make_files());
}

TEST_F(ConcurrencyTest, SharedPoolSmallerThanClientCount) {
    start_server(dispatch_policy::shared_pool, 2);
    upload_and_verify(make_files());
}

TEST_F(ConcurrencyTest, ServerSurvivesBadClients) {
    start_server(dispatch_policy::shared_pool, 2);

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([this] {
            (void)raw_exchange("UPLOAD broken.bin 100\r\n\r\nxyz");
            (void)raw_exchange("NONSENSE\r\n\r\n");
            (void)raw_exchange("UPLOAD half.bin");
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    auto file = create_test_file("after.bin", 4096);
    auto response = make_client().upload(file);
    ASSERT_TRUE(response.has_value()) << response.error().message;
    EXPECT_TRUE(response.value().is_ok());
    EXPECT_TRUE(server_->is_running());
}

TEST_F(ConcurrencyTest, IsolatedPoolSurvivesBadClients) {
    start_server(dispatch_policy::isolated_pool, 2);

    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(raw_exchange("GET ../x 0\r\n\r\n"),
                  "{\"status\": \"ERROR\", \"data\": \"Invalid filename\"}\r\n\r\n");
    }

    auto file = create_test_file("after.bin", 4096);
    auto response = make_client().upload(file);
    ASSERT_TRUE(response.has_value());
    EXPECT_TRUE(response.value().is_ok());
}

// Stress runner against a live server
class StressRunIntegrationTest : public ServerFixture {
protected:
    auto make_config(pool_mode mode, std::size_t pool_size) -> stress_config {
        stress_config config;
        config.client.server = endpoint{"127.0.0.1", port_};
        config.client.io_timeout = std::chrono::seconds(10);
        config.client.download_directory = download_dir_;
        config.file = create_test_file("stress.bin", 256 * 1024);
        config.mode = mode;
        config.pool_size = pool_size;
        config.server_workers = 4;
        config.test_number = 3;
        config.report_path = test_dir_ / "stress_test_report.csv";
        return config;
    }
};

TEST_F(StressRunIntegrationTest, ThreadPoolUploads) {
    start_server(dispatch_policy::shared_pool, 4);
    auto config = make_config(pool_mode::thread, 4);

    auto summary = stress_runner(config).run();

    ASSERT_TRUE(summary.has_value()) << summary.error().message;
    EXPECT_EQ(summary.value().success_count, 4u);
    EXPECT_EQ(summary.value().fail_count, 0u);
    EXPECT_EQ(summary.value().total_bytes, 4u * 256u * 1024u);
    EXPECT_GT(summary.value().average_seconds(), 0.0);
    // Same-name uploads race; only the final length is deterministic
    EXPECT_EQ(std::filesystem::file_size(storage_dir_ / "stress.bin"), 256u * 1024u);
}

TEST_F(StressRunIntegrationTest, ProcessPoolUploads) {
    start_server(dispatch_policy::shared_pool, 4);
    auto config = make_config(pool_mode::process, 3);

    auto summary = stress_runner(config).run();

    ASSERT_TRUE(summary.has_value()) << summary.error().message;
    EXPECT_EQ(summary.value().success_count, 3u);
    EXPECT_EQ(summary.value().fail_count, 0u);
    EXPECT_EQ(summary.value().total_bytes, 3u * 256u * 1024u);
}

TEST_F(StressRunIntegrationTest, AppendsReportRow) {
    start_server(dispatch_policy::shared_pool, 2);
    auto config = make_config(pool_mode::thread, 2);

    auto summary = stress_runner(config).run();
    ASSERT_TRUE(summary.has_value());
    ASSERT_TRUE(stress_runner::append_report(config.report_path, config.test_number,
                                             summary.value()).has_value());

    std::ifstream in(config.report_path);
    std::string header;
    std::string row;
    ASSERT_TRUE(std::getline(in, header));
    ASSERT_TRUE(std::getline(in, row));
    EXPECT_EQ(header, stress_runner::report_header());
    EXPECT_EQ(row.rfind("3,upload,0MB,2,4,", 0), 0u) << row;
    EXPECT_NE(row.find("\"2 succeeded, 0 failed\""), std::string::npos) << row;
}

}  // namespace rawxfer::test
