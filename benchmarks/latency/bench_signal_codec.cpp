/**
 * @file bench_signal_codec.cpp
 * @brief Benchmarks for connection codes and control frames
 */

#include <benchmark/benchmark.h>

#include <kcenon/peer_transfer/protocol/control_message.h>
#include <kcenon/peer_transfer/signal/signal_codec.h>

#include "utils/benchmark_helpers.h"

namespace kcenon::peer_transfer::benchmark {

static void BM_SignalCodec_Encode(::benchmark::State& state) {
    signal_descriptor offer{signal_kind::offer,
                            test_data_generator::generate_sdp(static_cast<std::size_t>(state.range(0)))};

    for (auto _ : state) {
        auto code = encode_signal(offer);
        ::benchmark::DoNotOptimize(code);
    }

    state.SetBytesProcessed(static_cast<int64_t>(offer.sdp.size()) *
                           static_cast<int64_t>(state.iterations()));
}

static void BM_SignalCodec_Decode(::benchmark::State& state) {
    auto code = encode_signal(signal_descriptor{
        signal_kind::answer,
        test_data_generator::generate_sdp(static_cast<std::size_t>(state.range(0)))});

    for (auto _ : state) {
        auto decoded = decode_signal(code);
        if (!decoded) {
            state.SkipWithError("Failed to decode connection code");
            return;
        }
        ::benchmark::DoNotOptimize(decoded.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(code.size()) *
                           static_cast<int64_t>(state.iterations()));
}

static void BM_ControlMessage_ParseMeta(::benchmark::State& state) {
    auto text = serialize(meta_message{"3b241101-e2bb-4255-8caf-4136c566a962",
                                       "quarterly report (final).pdf", 48318382,
                                       "application/pdf"});

    for (auto _ : state) {
        auto message = parse_control_message(text);
        ::benchmark::DoNotOptimize(message);
    }
}

static void BM_ControlMessage_RejectGarbage(::benchmark::State& state) {
    const std::string text = R"({"type":"meta","id":"x","name":"a.bin","size":"not a number"})";

    for (auto _ : state) {
        auto message = parse_control_message(text);
        ::benchmark::DoNotOptimize(message);
    }
}

BENCHMARK(BM_SignalCodec_Encode)->Arg(1)->Arg(8)->Arg(32)->Unit(::benchmark::kMicrosecond);
BENCHMARK(BM_SignalCodec_Decode)->Arg(1)->Arg(8)->Arg(32)->Unit(::benchmark::kMicrosecond);
BENCHMARK(BM_ControlMessage_ParseMeta)->Unit(::benchmark::kNanosecond);
BENCHMARK(BM_ControlMessage_RejectGarbage)->Unit(::benchmark::kNanosecond);

}  // namespace kcenon::peer_transfer::benchmark
