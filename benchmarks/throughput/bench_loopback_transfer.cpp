/**
 * @file bench_loopback_transfer.cpp
 * @brief End-to-end transfer throughput over the in-process loopback backend
 *
 * Covers the whole send path: splitting, framing, buffered-amount flow
 * control, reassembly and delivery of the received file.
 */

#include <benchmark/benchmark.h>

#include <kcenon/peer_transfer/session/transfer_session.h>
#include <kcenon/peer_transfer/transport/loopback_backend.h>

#include "utils/benchmark_helpers.h"

#include <chrono>
#include <memory>
#include <optional>

namespace kcenon::peer_transfer::benchmark {

namespace {

struct connected_pair {
    boost::asio::io_context io;
    std::shared_ptr<loopback_hub> hub;
    std::shared_ptr<transfer_session> sender;
    std::shared_ptr<transfer_session> receiver;

    auto connect(const peer_config& config, const loopback_options& options) -> bool {
        hub = std::make_shared<loopback_hub>(io, options);
        auto a = transfer_session::create(io, hub, config);
        auto b = transfer_session::create(io, hub, config);
        if (!a || !b) {
            return false;
        }
        sender = a.value();
        receiver = b.value();

        std::optional<result<std::string>> offer;
        sender->create_offer([&](result<std::string> r) { offer = std::move(r); });
        if (!run_until(io, [&] { return offer.has_value(); }) || !offer->has_value()) {
            return false;
        }

        std::optional<result<std::string>> answer;
        receiver->accept_offer(offer->value(),
                               [&](result<std::string> r) { answer = std::move(r); });
        if (!run_until(io, [&] { return answer.has_value(); }) || !answer->has_value()) {
            return false;
        }
        if (!sender->accept_answer(answer->value())) {
            return false;
        }

        return run_until(io, [&] {
            return sender->is_channel_open() && receiver->is_channel_open();
        });
    }

    ~connected_pair() {
        if (sender) sender->teardown();
        if (receiver) receiver->teardown();
    }
};

}  // namespace

/**
 * @brief Single file transfer between two connected sessions
 */
static void BM_Loopback_SingleFile(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    auto config = peer_config_builder().with_chunk_size(chunk_size).build();
    loopback_options options;
    options.drain_bytes_per_tick = 4 * sizes::MB;

    connected_pair pair;
    if (!pair.connect(config, options)) {
        state.SkipWithError("Failed to connect loopback pair");
        return;
    }

    auto payload = test_data_generator::generate_random_data(file_size, 42);
    std::size_t expected = 0;
    double elapsed_seconds = 0.0;

    for (auto _ : state) {
        auto source = std::make_shared<memory_file_source>("bench.bin", payload);
        ++expected;

        auto start = std::chrono::steady_clock::now();
        pair.sender->send_files({source});
        if (!run_until(pair.io, [&] { return pair.receiver->received_files().size() >= expected; })) {
            state.SkipWithError("Transfer did not complete");
            return;
        }
        elapsed_seconds += std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start).count();
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                           static_cast<int64_t>(state.iterations()));
    if (elapsed_seconds > 0.0) {
        state.SetLabel(format_throughput(
            static_cast<double>(file_size) * static_cast<double>(state.iterations()) /
            elapsed_seconds));
    }
}

/**
 * @brief Batch of small files sent one after another
 */
static void BM_Loopback_SmallFileBatch(::benchmark::State& state) {
    const auto file_count = static_cast<std::size_t>(state.range(0));

    connected_pair pair;
    if (!pair.connect(peer_config{}, loopback_options{})) {
        state.SkipWithError("Failed to connect loopback pair");
        return;
    }

    auto payload = test_data_generator::generate_random_data(4 * sizes::KB, 7);

    for (auto _ : state) {
        std::vector<file_source_ptr> files;
        files.reserve(file_count);
        for (std::size_t i = 0; i < file_count; ++i) {
            files.push_back(std::make_shared<memory_file_source>(
                "file_" + std::to_string(i) + ".txt", payload, "text/plain"));
        }

        std::optional<result<void>> outcome;
        pair.sender->send_files(std::move(files),
                                [&](result<void> r) { outcome = std::move(r); });
        if (!run_until(pair.io, [&] { return outcome.has_value(); }) || !outcome->has_value()) {
            state.SkipWithError("Batch failed");
            return;
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(file_count) *
                           static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Loopback_SingleFile)
    ->Args({static_cast<int64_t>(sizes::small_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::default_chunk)})
    ->Args({static_cast<int64_t>(sizes::medium_file), static_cast<int64_t>(sizes::min_chunk)})
    ->Iterations(20)
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

BENCHMARK(BM_Loopback_SmallFileBatch)
    ->Arg(10)
    ->Arg(100)
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

}  // namespace kcenon::peer_transfer::benchmark
