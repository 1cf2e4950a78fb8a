/**
 * @file bench_transfer_operations.cpp
 * @brief Benchmarks for file keys, registry updates and lane downloads
 */

#include <benchmark/benchmark.h>

#include <kcenon/media_transfer/media_transfer.h>

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::media_transfer::benchmark {

/**
 * @brief Benchmark for file key derivation
 */
static void BM_FileKey_Make(::benchmark::State& state) {
    const std::optional<std::string> size_type =
        state.range(0) != 0 ? std::optional<std::string>("m") : std::nullopt;

    for (auto _ : state) {
        auto key = make_file_key("5437113627421491713", 2000000, size_type);
        ::benchmark::DoNotOptimize(key);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for copy-on-write registry updates
 */
static void BM_Registry_UpdateDownloadingFile(::benchmark::State& state) {
    get_logger().set_sink_enabled(false);
    const auto entries = static_cast<int>(state.range(0));

    transfer_registry registry;
    std::vector<std::string> keys;
    for (int i = 0; i < entries; ++i) {
        downloading_file file;
        file.id = "file-" + std::to_string(i);
        file.size = 100 * sizes::MB;
        file.part_size = sizes::default_part;
        file.parts_count = calculate_parts_count(file.size, file.part_size);
        registry.set_downloading_file(file);
        keys.push_back(file_key_of(file));
    }

    std::size_t next = 0;
    for (auto _ : state) {
        const auto& key = keys[next++ % keys.size()];
        auto stored = registry.update_downloading_file(key, [](downloading_file& f) {
            if (f.last_part + 1 < f.parts_count) {
                f.last_part += 1;
            }
        });
        ::benchmark::DoNotOptimize(stored);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for accumulating parts and assembling the artifact
 */
static void BM_MemoryPartStore_Assemble(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto part_size = static_cast<std::size_t>(state.range(1));
    auto content = test_data_generator::generate_random_data(file_size, 42);

    std::vector<byte_buffer> parts;
    for (std::size_t offset = 0; offset < file_size; offset += part_size) {
        auto end = std::min(file_size, offset + part_size);
        parts.emplace_back(content.begin() + static_cast<std::ptrdiff_t>(offset),
                           content.begin() + static_cast<std::ptrdiff_t>(end));
    }

    memory_part_store store;
    for (auto _ : state) {
        uint64_t offset = 0;
        for (const auto& part : parts) {
            if (!store.add_bytes("bench", offset, part)) {
                state.SkipWithError("Failed to add bytes");
                return;
            }
            offset += part.size();
        }
        auto artifact = store.transfer_bytes_to_file("bench", "video/mp4");
        if (!artifact) {
            state.SkipWithError("Failed to assemble");
            return;
        }
        ::benchmark::DoNotOptimize(artifact);
        store.release_artifact(*artifact);
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                           static_cast<int64_t>(state.iterations()));
    state.SetLabel(format_bytes(file_size) + " in " + format_bytes(part_size) + " parts");
}

/**
 * @brief Benchmark for complete downloads spread across lanes
 */
static void BM_DownloadScheduler_Files(::benchmark::State& state) {
    get_logger().set_sink_enabled(false);
    const auto lanes = static_cast<std::size_t>(state.range(0));
    constexpr int files = 16;
    constexpr std::size_t file_size = sizes::small_file;

    auto transport = std::make_shared<loopback_transport>();
    std::vector<file_location> locations;
    for (int i = 0; i < files; ++i) {
        file_location location;
        location.id = "file-" + std::to_string(i);
        location.size = file_size;
        location.type = "video/mp4";
        transport->add_remote_file(location.id,
                                   test_data_generator::generate_random_data(file_size, 7));
        locations.push_back(location);
    }

    engine_config config;
    config.lane_count = lanes;
    config.part_size = 16 * sizes::KB;
    config.lane_pause = std::chrono::milliseconds(0);

    for (auto _ : state) {
        state.PauseTiming();
        transfer_registry registry;
        transfer_statistics statistics;
        download_scheduler scheduler(registry, transport,
                                     std::make_shared<memory_part_store>(),
                                     std::make_shared<quiet_message_service>(), statistics,
                                     config);
        state.ResumeTiming();

        for (const auto& location : locations) {
            scheduler.download_file(0, location);
        }
        if (!scheduler.wait_idle(std::chrono::seconds(30))) {
            state.SkipWithError("Downloads did not finish");
            return;
        }

        state.PauseTiming();
        scheduler.shutdown();
        state.ResumeTiming();
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) * files *
                           static_cast<int64_t>(state.iterations()));
}

// File key benchmarks
BENCHMARK(BM_FileKey_Make)->Arg(0)->Arg(1);

// Registry benchmarks
BENCHMARK(BM_Registry_UpdateDownloadingFile)->Arg(1)->Arg(100)->Arg(10000);

// Part store benchmarks
BENCHMARK(BM_MemoryPartStore_Assemble)
    ->Args({static_cast<int64_t>(sizes::small_file), static_cast<int64_t>(sizes::min_part)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::default_part)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::max_part)})
    ->Unit(::benchmark::kMillisecond);

// Scheduler benchmarks
BENCHMARK(BM_DownloadScheduler_Files)
    ->Arg(1)
    ->Arg(4)
    ->Arg(8)
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

}  // namespace kcenon::media_transfer::benchmark
