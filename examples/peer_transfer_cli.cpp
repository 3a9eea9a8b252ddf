/**
 * @file peer_transfer_cli.cpp
 * @brief Interactive peer-to-peer file transfer over WebRTC data channels
 *
 * Connection codes are exchanged by copy and paste through any side channel:
 *
 *   peer A> offer                 (prints an offer code)
 *   peer B> code <offer code>     (prints an answer code)
 *   peer A> code <answer code>
 *   peer A> send report.pdf notes.txt
 *   peer B> save ./downloads
 */

#include <kcenon/peer_transfer/peer_transfer.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/streambuf.hpp>

#include <unistd.h>

#include <csignal>
#include <cstring>
#include <iostream>
#include <istream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace kcenon::peer_transfer;

namespace {

struct options {
    peer_config config;
    std::string log_level = "warn";
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --stun                    Add the public STUN server" << std::endl;
    std::cout << "  --ice <url>               Add a STUN server" << std::endl;
    std::cout << "  --turn <url> <user> <pw>  Add a TURN server" << std::endl;
    std::cout << "  --log-level <level>       trace, debug, info, warn, error" << std::endl;
}

void print_commands() {
    std::cout << "Commands:" << std::endl;
    std::cout << "  offer                 create a connection code for the other peer" << std::endl;
    std::cout << "  code <code>           apply the other peer's offer or answer" << std::endl;
    std::cout << "  send <file>...        send files once connected" << std::endl;
    std::cout << "  cancel                stop the current batch" << std::endl;
    std::cout << "  status                show connection and transfer state" << std::endl;
    std::cout << "  save <dir>            write received files to a directory" << std::endl;
    std::cout << "  reset                 close the connection and clear received files" << std::endl;
    std::cout << "  quit" << std::endl;
}

auto parse_log_level(const std::string& name) -> std::optional<log_level> {
    if (name == "trace") return log_level::trace;
    if (name == "debug") return log_level::debug;
    if (name == "info") return log_level::info;
    if (name == "warn") return log_level::warn;
    if (name == "error") return log_level::error;
    return std::nullopt;
}

auto parse_args(int argc, char* argv[]) -> std::optional<options> {
    options opt;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--stun") {
            opt.config.use_stun = true;
        } else if (arg == "--ice" && i + 1 < argc) {
            opt.config.ice_servers.push_back(ice_server{argv[++i], {}, {}});
        } else if (arg == "--turn" && i + 3 < argc) {
            ice_server server;
            server.url = argv[++i];
            server.username = argv[++i];
            server.credential = argv[++i];
            opt.config.ice_servers.push_back(std::move(server));
        } else if (arg == "--log-level" && i + 1 < argc) {
            opt.log_level = argv[++i];
            if (!parse_log_level(opt.log_level)) {
                return std::nullopt;
            }
        } else {
            return std::nullopt;
        }
    }
    return opt;
}

auto split_words(const std::string& line) -> std::vector<std::string> {
    std::istringstream iss(line);
    std::vector<std::string> words;
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

/**
 * @brief Line-based front end driving one transfer session
 */
class cli_app : public std::enable_shared_from_this<cli_app> {
public:
    cli_app(boost::asio::io_context& io, std::shared_ptr<transfer_session> session)
        : io_(io),
          session_(std::move(session)),
          stdin_(io, ::dup(STDIN_FILENO)),
          signals_(io, SIGINT, SIGTERM) {}

    void start() {
        std::weak_ptr<cli_app> weak = weak_from_this();
        session_->events().set_notifier([this, weak]() {
            if (render_scheduled_) {
                return;
            }
            render_scheduled_ = true;
            boost::asio::post(io_, [weak]() {
                if (auto self = weak.lock()) {
                    self->render_scheduled_ = false;
                    self->render_events();
                }
            });
        });

        signals_.async_wait([self = shared_from_this()](const boost::system::error_code& ec, int) {
            if (!ec) {
                self->shutdown();
            }
        });

        print_commands();
        prompt();
        start_stdin_read();
    }

private:
    void start_stdin_read() {
        auto self = shared_from_this();
        boost::asio::async_read_until(stdin_, stdin_buf_, '\n',
            [self](const boost::system::error_code& ec, std::size_t) {
                if (ec) {
                    if (ec != boost::asio::error::operation_aborted) {
                        self->shutdown();
                    }
                    return;
                }
                std::istream is(&self->stdin_buf_);
                std::string line;
                std::getline(is, line);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                self->handle_line(line);
                if (!self->stopped_) {
                    self->start_stdin_read();
                }
            });
    }

    void handle_line(const std::string& line) {
        auto words = split_words(line);
        if (words.empty()) {
            prompt();
            return;
        }

        const auto& command = words[0];
        if (command == "quit" || command == "exit") {
            shutdown();
            return;
        }

        if (command == "offer") {
            std::cout << "Gathering candidates..." << std::endl;
            session_->create_offer([self = shared_from_this()](result<std::string> code) {
                self->print_code("Offer", code);
            });
        } else if (command == "code" && words.size() >= 2) {
            session_->apply_remote_code(words[1],
                [self = shared_from_this()](result<std::string> code) {
                    if (code && code.value().empty()) {
                        std::cout << "Answer applied, connecting..." << std::endl;
                        self->prompt();
                        return;
                    }
                    self->print_code("Answer", code);
                });
        } else if (command == "send" && words.size() >= 2) {
            send(std::vector<std::string>(words.begin() + 1, words.end()));
        } else if (command == "cancel") {
            session_->cancel();
        } else if (command == "status") {
            print_status();
        } else if (command == "save" && words.size() >= 2) {
            save(words[1]);
        } else if (command == "reset") {
            session_->reset();
            std::cout << "Connection closed" << std::endl;
        } else {
            print_commands();
        }
        prompt();
    }

    void send(const std::vector<std::string>& paths) {
        std::vector<file_source_ptr> files;
        for (const auto& path : paths) {
            auto source = disk_file_source::open(path);
            if (!source) {
                std::cout << "Cannot open " << path << ": " << source.error().message << std::endl;
                return;
            }
            files.push_back(source.value());
        }

        session_->send_files(std::move(files), [self = shared_from_this()](result<void> outcome) {
            if (outcome) {
                std::cout << "All files sent" << std::endl;
            } else {
                std::cout << "Send stopped: " << outcome.error().message << std::endl;
            }
            self->prompt();
        });
    }

    void save(const std::string& directory) {
        auto files = session_->received_files();
        if (files.empty()) {
            std::cout << "Nothing received yet" << std::endl;
            return;
        }
        for (const auto& file : files) {
            auto saved = file->save_to(directory);
            if (saved) {
                std::cout << "Saved " << saved.value().string() << std::endl;
            } else {
                std::cout << "Failed to save " << file->name() << ": "
                          << saved.error().message << std::endl;
            }
        }
    }

    void print_code(const char* kind, const result<std::string>& code) {
        if (!code) {
            std::cout << kind << " failed: " << code.error().message << std::endl;
        } else {
            std::cout << kind << " code, paste it into the other peer with 'code <code>':"
                      << std::endl << std::endl << code.value() << std::endl << std::endl;
        }
        prompt();
    }

    void print_status() {
        std::cout << "connection: " << to_string(session_->state())
                  << ", ice: " << to_string(session_->connection().ice())
                  << ", channel: " << to_string(session_->data_channel_state())
                  << ", role: " << to_string(session_->connection().role()) << std::endl;
        if (auto out = session_->send_progress()) {
            std::cout << "sending " << out->file_name << " "
                      << format_percent(out->done_bytes, out->total_bytes)
                      << ", " << session_->queued_files() << " queued" << std::endl;
        }
        if (auto in = session_->receive_progress()) {
            std::cout << "receiving " << in->file_name << " "
                      << format_percent(in->done_bytes, in->total_bytes) << std::endl;
        }
        std::cout << session_->received_files().size() << " file(s) received" << std::endl;
    }

    void render_events() {
        for (auto& event : session_->events().drain()) {
            if (auto* progress = std::get_if<progress_event>(&event)) {
                const auto& p = progress->progress;
                std::cout << (p.direction == transfer_direction::outgoing ? "-> " : "<- ")
                          << p.file_name << " " << format_percent(p.done_bytes, p.total_bytes)
                          << " (" << format_size(p.done_bytes) << "/"
                          << format_size(p.total_bytes) << ")" << std::endl;
            } else if (auto* received = std::get_if<file_received_event>(&event)) {
                std::cout << "Received " << received->file->name() << " ("
                          << format_size(received->file->size()) << ")" << std::endl;
            } else if (auto* abandoned = std::get_if<transfer_abandoned_event>(&event)) {
                std::cout << "Discarded unfinished " << abandoned->file_name << std::endl;
            } else if (auto* state = std::get_if<connection_state_changed>(&event)) {
                std::cout << "Connection " << to_string(state->current) << std::endl;
            } else if (auto* channel = std::get_if<channel_state_changed>(&event)) {
                if (channel->state == channel_state::open) {
                    std::cout << "Data channel open, ready to send" << std::endl;
                } else if (channel->state == channel_state::closed) {
                    std::cout << "Data channel closed" << std::endl;
                }
            } else if (auto* failure = std::get_if<error_event>(&event)) {
                std::cout << "Error: " << failure->reason.message << std::endl;
            }
        }
    }

    void prompt() {
        std::cout << "> " << std::flush;
    }

    void shutdown() {
        if (stopped_) {
            return;
        }
        stopped_ = true;
        std::cout << std::endl << "Closing" << std::endl;

        boost::system::error_code ignored;
        signals_.cancel(ignored);
        stdin_.cancel(ignored);
        session_->events().set_notifier(nullptr);
        session_->teardown();
    }

    boost::asio::io_context& io_;
    std::shared_ptr<transfer_session> session_;
    boost::asio::posix::stream_descriptor stdin_;
    boost::asio::streambuf stdin_buf_;
    boost::asio::signal_set signals_;
    bool render_scheduled_ = false;
    bool stopped_ = false;
};

}  // namespace

int main(int argc, char* argv[]) {
    auto opt = parse_args(argc, argv);
    if (!opt) {
        print_usage(argv[0]);
        return 1;
    }

    get_logger().initialize();
    get_logger().set_level(*parse_log_level(opt->log_level));

    if (auto valid = opt->config.validate(); !valid) {
        std::cerr << "Invalid configuration: " << valid.error().message << std::endl;
        return 1;
    }

    boost::asio::io_context io;
    auto factory = std::make_shared<datachannel_factory>(io, opt->log_level);

    auto session = transfer_session::create(io, factory, opt->config);
    if (!session) {
        std::cerr << "Failed to create session: " << session.error().message << std::endl;
        return 1;
    }

    auto app = std::make_shared<cli_app>(io, session.value());
    app->start();

    // Returns once stdin and the signal set are cancelled by quit
    io.run();
    return 0;
}
