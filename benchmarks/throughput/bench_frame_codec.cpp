/**
 * @file bench_frame_codec.cpp
 * @brief Benchmarks for header framing and payload streaming
 *
 * Runs the frame codec and the server transfer engine over an in-memory
 * stream so socket costs are excluded.
 */

#include <benchmark/benchmark.h>

#include <rawxfer/core/frame_codec.h>
#include <rawxfer/core/protocol.h>
#include <rawxfer/server/transfer_engine.h>

#include "utils/benchmark_helpers.h"

#include <string>

namespace rawxfer::benchmark {

/**
 * @brief Locate the header delimiter when the header arrives in small reads
 */
static void BM_FrameCodec_ReadHeader(::benchmark::State& state) {
    const auto read_size = static_cast<std::size_t>(state.range(0));
    auto request = make_request("UPLOAD benchmark_payload.bin 1048576", {});
    replay_stream stream(request, read_size);
    frame_codec codec;

    for (auto _ : state) {
        stream.rewind();
        auto header = codec.read_header(stream);
        if (!header || header.value().truncated) {
            state.SkipWithError("Failed to read header");
            return;
        }
        ::benchmark::DoNotOptimize(header.value().text);
    }

    state.SetBytesProcessed(static_cast<int64_t>(request.size()) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_FrameCodec_ReadHeader)->Arg(1)->Arg(8)->Arg(4096);

/**
 * @brief Payload delivery throughput across chunk sizes
 */
static void BM_FrameCodec_ReadPayload(::benchmark::State& state) {
    const auto chunk = static_cast<std::size_t>(state.range(0));
    const auto payload_size = sizes::medium_file;
    replay_stream stream(test_data_generator::generate_random_data(payload_size, 42), chunk);
    frame_codec codec(chunk);

    for (auto _ : state) {
        stream.rewind();
        uint64_t seen = 0;
        auto delivered = codec.read_payload(stream, {}, payload_size,
            [&seen](std::span<const std::byte> piece) -> result<void> {
                seen += piece.size();
                return {};
            });
        if (!delivered || delivered.value() != payload_size) {
            state.SkipWithError("Short payload");
            return;
        }
        ::benchmark::DoNotOptimize(seen);
    }

    state.SetBytesProcessed(static_cast<int64_t>(payload_size) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["throughput_MB_s"] =
        ::benchmark::Counter(static_cast<double>(payload_size) / sizes::MB,
                             ::benchmark::Counter::kIsIterationInvariantRate);
}
BENCHMARK(BM_FrameCodec_ReadPayload)
    ->Arg(sizes::min_chunk)
    ->Arg(sizes::default_chunk)
    ->Arg(512 * sizes::KB)
    ->Arg(sizes::max_chunk);

/**
 * @brief Request line parsing and validation
 */
static void BM_Protocol_ParseRequest(::benchmark::State& state) {
    const std::string header = "UPLOAD some_archive-2024.tar.gz 52428800";

    for (auto _ : state) {
        auto req = parse_request(header);
        ::benchmark::DoNotOptimize(req);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Protocol_ParseRequest);

/**
 * @brief Server-side UPLOAD handling including the storage write
 */
static void BM_TransferEngine_Upload(::benchmark::State& state) {
    const auto payload_size = static_cast<std::size_t>(state.range(0));

    temp_file_manager temp_files;
    auto storage = storage_directory::create(temp_files.create_directory("storage"));
    if (!storage) {
        state.SkipWithError("Failed to create storage directory");
        return;
    }
    transfer_engine engine(storage.value());

    auto payload = test_data_generator::generate_random_data(payload_size, 7);
    auto request = make_request("UPLOAD engine.bin " + std::to_string(payload_size), payload);
    replay_stream stream(std::move(request), default_chunk_size);

    for (auto _ : state) {
        stream.rewind();
        auto outcome = engine.handle_connection(stream);
        if (!outcome.success) {
            state.SkipWithError("Upload failed");
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(payload_size) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_TransferEngine_Upload)
    ->Arg(sizes::small_file)
    ->Arg(sizes::medium_file)
    ->Unit(::benchmark::kMillisecond);

/**
 * @brief Server-side GET handling including the storage read
 */
static void BM_TransferEngine_Get(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));

    temp_file_manager temp_files;
    auto dir = temp_files.create_directory("storage");
    auto storage = storage_directory::create(dir);
    if (!storage) {
        state.SkipWithError("Failed to create storage directory");
        return;
    }
    temp_file_manager stored(dir);
    stored.create_random_file("stored.bin", file_size, 9);
    transfer_engine engine(storage.value());

    replay_stream stream(make_request("GET stored.bin 0", {}), default_chunk_size);

    for (auto _ : state) {
        stream.rewind();
        auto outcome = engine.handle_connection(stream);
        if (!outcome.success) {
            state.SkipWithError("Get failed");
            return;
        }
        ::benchmark::DoNotOptimize(stream.bytes_written());
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_TransferEngine_Get)
    ->Arg(sizes::small_file)
    ->Arg(sizes::medium_file)
    ->Unit(::benchmark::kMillisecond);

}  // namespace rawxfer::benchmark
