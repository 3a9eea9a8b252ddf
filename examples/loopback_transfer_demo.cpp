/**
 * @file loopback_transfer_demo.cpp
 * @brief Two peers in one process exchanging files over the loopback backend
 *
 * This example demonstrates how to:
 * - Create two transfer sessions sharing a loopback hub
 * - Exchange connection codes between them
 * - Send files and follow progress through the event queue
 * - Save received files to a directory
 */

#include <kcenon/peer_transfer/peer_transfer.h>

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace kcenon::peer_transfer;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <output_dir> [file...]" << std::endl;
    std::cout << std::endl;
    std::cout << "Sends the given files from one in-process peer to another and" << std::endl;
    std::cout << "writes what was received to <output_dir>. Without files, a" << std::endl;
    std::cout << "generated 50 KiB sample is sent." << std::endl;
}

/**
 * @brief Run the loop until the predicate holds
 */
auto run_until(boost::asio::io_context& io, const std::function<bool()>& done) -> bool {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
    io.restart();
    while (!done()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        if (io.run_one_for(std::chrono::milliseconds(10)) == 0) {
            io.restart();
        }
    }
    return true;
}

void print_events(const std::string& who, transfer_session& session) {
    for (auto& event : session.events().drain()) {
        if (auto* progress = std::get_if<progress_event>(&event)) {
            const auto& p = progress->progress;
            std::cout << "[" << who << "] " << to_string(p.direction) << " " << p.file_name
                      << ": " << format_percent(p.done_bytes, p.total_bytes)
                      << " (" << format_size(p.done_bytes) << "/" << format_size(p.total_bytes)
                      << ")" << std::endl;
        } else if (auto* received = std::get_if<file_received_event>(&event)) {
            std::cout << "[" << who << "] received " << received->file->name() << " ("
                      << format_size(received->file->size()) << ")" << std::endl;
        } else if (auto* sent = std::get_if<transfer_sent_event>(&event)) {
            std::cout << "[" << who << "] sent " << sent->file_name << std::endl;
        } else if (auto* state = std::get_if<connection_state_changed>(&event)) {
            std::cout << "[" << who << "] connection " << to_string(state->current) << std::endl;
        } else if (auto* failure = std::get_if<error_event>(&event)) {
            std::cout << "[" << who << "] error: " << failure->reason.message << std::endl;
        }
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::filesystem::path output_dir = argv[1];

    std::vector<file_source_ptr> files;
    for (int i = 2; i < argc; ++i) {
        auto source = disk_file_source::open(argv[i]);
        if (!source) {
            std::cerr << "Cannot open " << argv[i] << ": " << source.error().message << std::endl;
            return 1;
        }
        files.push_back(source.value());
    }
    if (files.empty()) {
        byte_buffer sample(51200);
        for (std::size_t i = 0; i < sample.size(); ++i) {
            sample[i] = static_cast<std::byte>('A' + (i % 26));
        }
        files.push_back(std::make_shared<memory_file_source>("sample.txt", std::move(sample)));
    }

    get_logger().initialize();
    get_logger().set_level(log_level::warn);

    boost::asio::io_context io;
    auto hub = std::make_shared<loopback_hub>(io);

    auto config = peer_config_builder()
        .with_progress_interval(std::chrono::milliseconds{50})
        .build();

    auto alice_result = transfer_session::create(io, hub, config);
    auto bob_result = transfer_session::create(io, hub, config);
    if (!alice_result || !bob_result) {
        std::cerr << "Failed to create sessions" << std::endl;
        return 1;
    }
    auto alice = alice_result.value();
    auto bob = bob_result.value();

    std::cout << "=== Connection Setup ===" << std::endl;

    std::optional<result<std::string>> offer;
    alice->create_offer([&](result<std::string> r) { offer = std::move(r); });
    if (!run_until(io, [&] { return offer.has_value(); }) || !offer->has_value()) {
        std::cerr << "Offer failed" << std::endl;
        return 1;
    }
    std::cout << "Offer code (" << offer->value().size() << " characters)" << std::endl;

    std::optional<result<std::string>> answer;
    bob->accept_offer(offer->value(), [&](result<std::string> r) { answer = std::move(r); });
    if (!run_until(io, [&] { return answer.has_value(); }) || !answer->has_value()) {
        std::cerr << "Answer failed" << std::endl;
        return 1;
    }
    std::cout << "Answer code (" << answer->value().size() << " characters)" << std::endl;

    if (auto applied = alice->accept_answer(answer->value()); !applied) {
        std::cerr << "Applying answer failed: " << applied.error().message << std::endl;
        return 1;
    }

    if (!run_until(io, [&] { return alice->is_channel_open() && bob->is_channel_open(); })) {
        std::cerr << "Data channel did not open" << std::endl;
        return 1;
    }
    print_events("alice", *alice);
    print_events("bob", *bob);

    std::cout << std::endl << "=== Transfer ===" << std::endl;

    auto expected = files.size();
    std::optional<result<void>> outcome;
    alice->send_files(std::move(files), [&](result<void> r) { outcome = std::move(r); });

    bool finished = run_until(io, [&] {
        print_events("alice", *alice);
        print_events("bob", *bob);
        return outcome.has_value() && (!outcome->has_value()
                                       || bob->received_files().size() >= expected);
    });
    if (!finished || !outcome->has_value()) {
        std::cerr << "Transfer failed"
                  << (finished ? ": " + outcome->error().message : std::string{}) << std::endl;
        return 1;
    }

    std::cout << std::endl << "=== Saving ===" << std::endl;
    for (const auto& file : bob->received_files()) {
        auto saved = file->save_to(output_dir);
        if (!saved) {
            std::cerr << "Save failed: " << saved.error().message << std::endl;
            return 1;
        }
        std::cout << saved.value().string() << std::endl;
    }

    alice->teardown();
    bob->teardown();
    return 0;
}
