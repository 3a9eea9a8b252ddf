/**
 * @file bench_chunk_operations.cpp
 * @brief Benchmarks for chunk splitting and assembling operations
 */

#include <benchmark/benchmark.h>

#include <kcenon/peer_transfer/core/chunk_assembler.h>
#include <kcenon/peer_transfer/core/chunk_splitter.h>
#include <kcenon/peer_transfer/core/file_source.h>

#include "utils/benchmark_helpers.h"

#include <memory>

namespace kcenon::peer_transfer::benchmark {

/**
 * @brief Benchmark for chunk_splitter reading from disk
 */
static void BM_ChunkSplitter_SplitDisk(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    temp_file_manager temp_files;
    auto test_file = temp_files.create_random_file("split_test.bin", file_size, 42);
    auto source = disk_file_source::open(test_file);
    if (!source) {
        state.SkipWithError("Failed to open source file");
        return;
    }

    chunk_splitter splitter(chunk_config{chunk_size});

    for (auto _ : state) {
        auto result = splitter.split(source.value());
        if (!result) {
            state.SkipWithError("Failed to create splitter iterator");
            return;
        }

        auto& iterator = result.value();
        while (iterator.has_next()) {
            auto chunk_result = iterator.next();
            if (!chunk_result) {
                state.SkipWithError("Failed to get chunk");
                return;
            }
            ::benchmark::DoNotOptimize(chunk_result.value());
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                           static_cast<int64_t>(state.iterations()));
    state.SetItemsProcessed(static_cast<int64_t>((file_size + chunk_size - 1) / chunk_size) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for chunk_splitter over an in-memory source
 */
static void BM_ChunkSplitter_SplitMemory(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));

    auto source = std::make_shared<memory_file_source>(
        "memory.bin", test_data_generator::generate_random_data(file_size, 42));
    chunk_splitter splitter;

    for (auto _ : state) {
        auto result = splitter.split(source);
        if (!result) {
            state.SkipWithError("Failed to create splitter iterator");
            return;
        }

        auto& iterator = result.value();
        while (iterator.has_next()) {
            auto chunk_result = iterator.next();
            ::benchmark::DoNotOptimize(chunk_result);
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for chunk_assembler reassembly
 */
static void BM_ChunkAssembler_Process(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    // Pre-generate all chunks
    auto source = std::make_shared<memory_file_source>(
        "assemble.bin", test_data_generator::generate_random_data(file_size, 42));
    chunk_splitter splitter(chunk_config{chunk_size});
    std::vector<byte_buffer> chunks;

    auto split_result = splitter.split(source);
    if (!split_result) {
        state.SkipWithError("Failed to create splitter");
        return;
    }
    auto& iterator = split_result.value();
    while (iterator.has_next()) {
        auto chunk_result = iterator.next();
        if (!chunk_result) {
            state.SkipWithError("Failed to get chunk");
            return;
        }
        chunks.push_back(std::move(chunk_result.value()));
    }

    chunk_assembler assembler;

    for (auto _ : state) {
        state.PauseTiming();
        auto copies = chunks;
        state.ResumeTiming();

        (void)assembler.begin("bench", "assemble.bin", file_size, "application/octet-stream");
        for (auto& chunk : copies) {
            if (!assembler.append(std::move(chunk))) {
                state.SkipWithError("Chunk dropped");
                return;
            }
        }

        auto file = assembler.finish("bench");
        if (!file) {
            state.SkipWithError("Failed to finish transfer");
            return;
        }
        ::benchmark::DoNotOptimize(file->data().data());
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                           static_cast<int64_t>(state.iterations()));
}

// Chunk Splitter benchmarks
BENCHMARK(BM_ChunkSplitter_SplitDisk)
    ->Args({static_cast<int64_t>(sizes::small_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::min_chunk)})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_ChunkSplitter_SplitMemory)
    ->Arg(static_cast<int64_t>(sizes::small_file))
    ->Arg(static_cast<int64_t>(sizes::medium_file))
    ->Unit(::benchmark::kMicrosecond);

// Chunk Assembler benchmarks
BENCHMARK(BM_ChunkAssembler_Process)
    ->Args({static_cast<int64_t>(sizes::small_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::large_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::peer_transfer::benchmark
