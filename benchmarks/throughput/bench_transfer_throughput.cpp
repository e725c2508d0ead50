/**
 * @file bench_transfer_throughput.cpp
 * @brief End-to-end loopback throughput for upload and download
 *
 * Starts a file_server on an ephemeral loopback port and drives it with
 * file_transfer_client, once per dispatch policy.
 */

#include <benchmark/benchmark.h>

#include <rawxfer/rawxfer.h>

#include "utils/benchmark_helpers.h"

#include <atomic>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace rawxfer::benchmark {

namespace {

/**
 * @brief Running server plus a client pointed at it
 */
struct loopback_setup {
    temp_file_manager temp_files;
    std::unique_ptr<file_server> server;
    std::optional<file_transfer_client> client;

    auto start(dispatch_policy policy, std::size_t workers) -> bool {
        auto built = file_server::builder()
            .with_storage_directory(temp_files.create_directory("storage"))
            .with_dispatch_policy(policy)
            .with_worker_count(workers)
            .build();
        if (!built) {
            return false;
        }
        server = std::make_unique<file_server>(std::move(built.value()));
        if (!server->start(endpoint{"127.0.0.1", 0})) {
            return false;
        }

        auto c = file_transfer_client::builder()
            .with_server(endpoint{"127.0.0.1", server->port()})
            .with_download_directory(temp_files.create_directory("downloads"))
            .build();
        if (!c) {
            return false;
        }
        client.emplace(std::move(c.value()));
        return true;
    }

    ~loopback_setup() {
        if (server && server->is_running()) {
            (void)server->stop();
        }
    }
};

auto policy_from(int64_t arg) -> dispatch_policy {
    switch (arg) {
        case 1: return dispatch_policy::shared_pool;
        case 2: return dispatch_policy::isolated_pool;
        default: return dispatch_policy::sequential;
    }
}

}  // namespace

/**
 * @brief Single client upload throughput
 *
 * Args: file size, dispatch policy (0 sequential, 1 shared, 2 isolated)
 */
static void BM_Loopback_Upload(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto policy = policy_from(state.range(1));

    loopback_setup setup;
    if (!setup.start(policy, 2)) {
        state.SkipWithError("Failed to start loopback server");
        return;
    }
    state.SetLabel(to_string(policy));
    auto file = setup.temp_files.create_random_file("upload.bin", file_size, 42);

    for (auto _ : state) {
        auto response = setup.client->upload(file);
        if (!response || !response.value().is_ok()) {
            state.SkipWithError("Upload failed");
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["throughput_MB_s"] =
        ::benchmark::Counter(static_cast<double>(file_size) / sizes::MB,
                             ::benchmark::Counter::kIsIterationInvariantRate);
}
BENCHMARK(BM_Loopback_Upload)
    ->Args({static_cast<int64_t>(sizes::small_file), 0})
    ->Args({static_cast<int64_t>(sizes::medium_file), 0})
    ->Args({static_cast<int64_t>(sizes::medium_file), 1})
    ->Args({static_cast<int64_t>(sizes::medium_file), 2})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

/**
 * @brief Single client download throughput
 */
static void BM_Loopback_Download(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto policy = policy_from(state.range(1));

    loopback_setup setup;
    if (!setup.start(policy, 2)) {
        state.SkipWithError("Failed to start loopback server");
        return;
    }
    state.SetLabel(to_string(policy));
    auto file = setup.temp_files.create_random_file("download.bin", file_size, 43);
    auto seeded = setup.client->upload(file);
    if (!seeded || !seeded.value().is_ok()) {
        state.SkipWithError("Failed to seed server storage");
        return;
    }

    for (auto _ : state) {
        auto response = setup.client->download("download.bin");
        if (!response || !response.value().is_ok()) {
            state.SkipWithError("Download failed");
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Loopback_Download)
    ->Args({static_cast<int64_t>(sizes::medium_file), 0})
    ->Args({static_cast<int64_t>(sizes::medium_file), 1})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

/**
 * @brief Aggregate throughput with several concurrent clients
 *
 * Args: client count; the server runs a shared pool of the same size.
 */
static void BM_Loopback_ConcurrentUploads(::benchmark::State& state) {
    const auto clients = static_cast<std::size_t>(state.range(0));
    const auto file_size = sizes::medium_file;

    loopback_setup setup;
    if (!setup.start(dispatch_policy::shared_pool, clients)) {
        state.SkipWithError("Failed to start loopback server");
        return;
    }

    std::vector<std::filesystem::path> files;
    for (std::size_t i = 0; i < clients; ++i) {
        files.push_back(setup.temp_files.create_random_file(
            "concurrent_" + std::to_string(i) + ".bin", file_size,
            static_cast<uint32_t>(i + 1)));
    }

    for (auto _ : state) {
        std::atomic<std::size_t> failures{0};
        std::vector<std::thread> threads;
        for (const auto& file : files) {
            threads.emplace_back([&setup, &failures, file] {
                auto response = setup.client->upload(file);
                if (!response || !response.value().is_ok()) {
                    ++failures;
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }
        if (failures > 0) {
            state.SkipWithError("Concurrent upload failed");
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size * clients) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Loopback_ConcurrentUploads)
    ->Arg(1)
    ->Arg(4)
    ->Arg(8)
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

}  // namespace rawxfer::benchmark
