#include "mcphub/transport/stdio_transport.hpp"
#include "mcphub/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/write.hpp>

#include <sys/wait.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>

extern char** environ;

namespace mcphub {

namespace {

constexpr useconds_t kProcessTerminationWaitUs = 100'000;  // 100ms wait before SIGKILL
constexpr int kReapAttempts = 50;
constexpr useconds_t kReapPollUs = 2'000;
constexpr const char* kCategory = "transport";

TransportError make_error(TransportError::Category cat, const std::string& msg) {
    return TransportError{cat, msg, std::nullopt};
}

void close_pipe(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] != -1) {
            close(fds[i]);
            fds[i] = -1;
        }
    }
}

std::optional<int> decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return -WTERMSIG(status);
    }
    return std::nullopt;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// LineBuffer
// ═══════════════════════════════════════════════════════════════════════════

std::vector<std::string> LineBuffer::append(std::string_view chunk) {
    std::vector<std::string> lines;
    buffer_.append(chunk);

    std::size_t start = 0;
    for (;;) {
        const auto newline = buffer_.find('\n', start);
        if (newline == std::string::npos) {
            break;
        }

        std::size_t end = newline;
        if (end > start && buffer_[end - 1] == '\r') {
            --end;
        }

        const bool blank = buffer_.find_first_not_of(" \t", start) >= end;
        if (blank == false) {
            lines.emplace_back(buffer_, start, end - start);
        }
        start = newline + 1;
    }
    buffer_.erase(0, start);

    if (buffer_.size() > max_line_size_) {
        buffer_.clear();
        ++overflows_;
    }
    return lines;
}

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

StdioTransport::StdioTransport(asio::any_io_executor executor, StdioTransportConfig config)
    : config_(std::move(config))
    , executor_(std::move(executor))
    , strand_(asio::make_strand(executor_))
    , write_gate_(std::make_shared<WriteGate>(executor_, 1))
    , alive_(std::make_shared<bool>(true))
    , stdout_lines_(config_.max_message_size)
    , stderr_lines_(config_.max_message_size)
{}

StdioTransport::~StdioTransport() {
    *alive_ = false;

    asio::error_code ec;
    for (auto* stream : {&stdin_stream_, &stdout_stream_, &stderr_stream_}) {
        if (*stream && (*stream)->is_open()) {
            (*stream)->close(ec);
        }
    }
    if (message_channel_) {
        message_channel_->close();
    }

    // Synchronous cleanup - can't co_await in destructor
    running_ = false;
    terminate_process();
}

// ═══════════════════════════════════════════════════════════════════════════
// IAsyncTransport Interface
// ═══════════════════════════════════════════════════════════════════════════

asio::any_io_executor StdioTransport::get_executor() {
    return executor_;
}

asio::awaitable<TransportResult<void>> StdioTransport::async_start() {
    if (running_) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Protocol,
            "Transport already running"
        ));
    }

    if (config_.command.empty()) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Network,
            "No command configured"
        ));
    }

    auto result = spawn_process();
    if (!result) {
        co_return result;
    }

    stdout_lines_.clear();
    stderr_lines_.clear();
    message_channel_ = std::make_shared<MessageChannel>(executor_, config_.channel_capacity);
    running_ = true;

    asio::co_spawn(strand_,
        stdout_reader_loop(stdout_stream_, message_channel_, alive_),
        asio::detached);
    asio::co_spawn(strand_,
        stderr_reader_loop(stderr_stream_, alive_),
        asio::detached);

    MCPHUB_LOG_INFO(kCategory, "Stdio transport started", {
        {"server", config_.server_name},
        {"command", config_.command},
        {"pid", child_pid_}
    });

    co_return TransportResult<void>{};
}

asio::awaitable<void> StdioTransport::async_stop() {
    const bool was_running = running_.exchange(false);

    asio::error_code ec;
    for (auto* stream : {&stdin_stream_, &stdout_stream_, &stderr_stream_}) {
        if (*stream && (*stream)->is_open()) {
            (*stream)->close(ec);
        }
    }
    if (message_channel_) {
        message_channel_->close();
    }

    terminate_process();

    if (was_running) {
        MCPHUB_LOG_INFO(kCategory, "Stdio transport stopped", {
            {"server", config_.server_name},
            {"exitCode", exit_code_.has_value() ? Json(*exit_code_) : Json(nullptr)}
        });
    }
    co_return;
}

asio::awaitable<TransportResult<void>> StdioTransport::async_send(Json message) {
    if (!running_ || !stdin_stream_) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Transport not running"
        ));
    }

    // Keep the stream alive for the duration of the write even if the
    // transport is stopped concurrently
    auto stream = stdin_stream_;
    auto data = std::make_shared<std::string>(message.dump() + "\n");

    // One writer at a time so two large messages never interleave on the pipe
    auto gate = write_gate_;
    std::optional<TransportError> failure;
    bool acquired = false;
    try {
        co_await gate->async_send(asio::error_code{}, asio::use_awaitable);
        acquired = true;
        co_await asio::async_write(
            *stream,
            asio::buffer(*data),
            asio::use_awaitable
        );
    } catch (const std::system_error& e) {
        failure = make_error(
            TransportError::Category::Network,
            "Write failed: " + std::string(e.what())
        );
    }
    if (acquired) {
        gate->try_receive([](asio::error_code) {});
    }

    if (failure) {
        co_return tl::unexpected(std::move(*failure));
    }

    MCPHUB_LOG_TRACE(kCategory, "Sent message", {
        {"server", config_.server_name},
        {"bytes", data->size()}
    });
    co_return TransportResult<void>{};
}

asio::awaitable<TransportResult<Json>> StdioTransport::async_receive() {
    auto channel = message_channel_;
    if (!channel || channel->is_open() == false) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Transport not running"
        ));
    }

    try {
        auto result = co_await channel->async_receive(asio::use_awaitable);
        co_return result;
    } catch (const std::system_error& e) {
        co_return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Receive failed: " + std::string(e.what())
        ));
    }
}

bool StdioTransport::is_running() const {
    return running_;
}

void StdioTransport::on_link_change(LinkListener listener) {
    link_listener_ = std::move(listener);
}

pid_t StdioTransport::child_pid() const {
    return child_pid_;
}

std::optional<int> StdioTransport::exit_code() const {
    return exit_code_;
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Reader Loops
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> StdioTransport::stdout_reader_loop(
    std::shared_ptr<Stream> stream,
    std::shared_ptr<MessageChannel> channel,
    std::shared_ptr<bool> alive
) {
    std::array<char, 4096> chunk{};
    std::string reason = "Process closed stdout";

    for (;;) {
        std::size_t n = 0;
        try {
            n = co_await stream->async_read_some(asio::buffer(chunk), asio::use_awaitable);
        } catch (const std::system_error& e) {
            if (*alive == false) {
                co_return;
            }
            if (e.code() != asio::error::eof) {
                reason = "stdout read failed: " + e.code().message();
            }
            break;
        }
        if (*alive == false) {
            co_return;
        }

        const std::size_t overflows_before = stdout_lines_.overflow_count();
        auto lines = stdout_lines_.append(std::string_view(chunk.data(), n));
        if (stdout_lines_.overflow_count() != overflows_before) {
            MCPHUB_LOG_ERROR(kCategory, "Discarded oversized message from server", {
                {"server", config_.server_name},
                {"limit", config_.max_message_size}
            });
        }

        for (auto& line : lines) {
            Json message;
            try {
                message = Json::parse(line);
            } catch (const Json::parse_error& e) {
                MCPHUB_LOG_WARN(kCategory, "Dropping unparsable line from server stdout", {
                    {"server", config_.server_name},
                    {"error", e.what()}
                });
                continue;
            }

            try {
                co_await channel->async_send(
                    asio::error_code{},
                    TransportResult<Json>{std::move(message)},
                    asio::use_awaitable
                );
            } catch (const std::system_error&) {
                // Channel closed by async_stop
                co_return;
            }
            if (*alive == false) {
                co_return;
            }
        }
    }

    // EOF without async_stop means the child went away on its own
    const bool unexpected = running_.exchange(false);
    if (unexpected) {
        reap_child();
        if (exit_code_.has_value()) {
            reason += " (exit code " + std::to_string(*exit_code_) + ")";
        }
        MCPHUB_LOG_WARN(kCategory, "Server process exited", {
            {"server", config_.server_name},
            {"reason", reason}
        });
        notify_link(LinkState::Down, reason);
    }
    channel->close();
}

asio::awaitable<void> StdioTransport::stderr_reader_loop(
    std::shared_ptr<Stream> stream,
    std::shared_ptr<bool> alive
) {
    if (!stream || stream->is_open() == false) {
        co_return;
    }

    std::array<char, 4096> chunk{};
    for (;;) {
        std::size_t n = 0;
        try {
            n = co_await stream->async_read_some(asio::buffer(chunk), asio::use_awaitable);
        } catch (const std::system_error&) {
            co_return;  // EOF or stream closed
        }
        if (*alive == false) {
            co_return;
        }

        for (const auto& line : stderr_lines_.append(std::string_view(chunk.data(), n))) {
            MCPHUB_LOG_WARN(kCategory, "Server stderr", {
                {"server", config_.server_name},
                {"line", line}
            });
        }
    }
}

void StdioTransport::notify_link(LinkState state, const std::string& reason) {
    if (link_listener_) {
        link_listener_(state, reason);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Process Management
// ═══════════════════════════════════════════════════════════════════════════

TransportResult<void> StdioTransport::spawn_process() {
    // Everything the child needs is allocated BEFORE fork(): after fork only
    // the calling thread exists, and malloc may be locked by another thread.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(config_.args.size() + 1);
    argv_storage.push_back(config_.command);
    for (const auto& arg : config_.args) {
        argv_storage.push_back(arg);
    }

    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& str : argv_storage) {
        argv.push_back(str.data());
    }
    argv.push_back(nullptr);

    const bool custom_env = (config_.env.empty() == false);
    std::vector<std::string> env_storage;
    std::vector<char*> envp;
    if (custom_env) {
        for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
            const std::string_view kv(*entry);
            const std::string key(kv.substr(0, kv.find('=')));
            if (config_.env.contains(key) == false) {
                env_storage.emplace_back(kv);
            }
        }
        for (const auto& [key, value] : config_.env) {
            env_storage.push_back(key + "=" + value);
        }
        envp.reserve(env_storage.size() + 1);
        for (auto& str : env_storage) {
            envp.push_back(str.data());
        }
        envp.push_back(nullptr);
    }

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};

    if (pipe(stdin_pipe) == -1 || pipe(stdout_pipe) == -1 || pipe(stderr_pipe) == -1) {
        const std::string reason = std::strerror(errno);
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Failed to create pipes: " + reason
        ));
    }

    // Parent-side ends must not leak into other children
    fcntl(stdin_pipe[1], F_SETFD, FD_CLOEXEC);
    fcntl(stdout_pipe[0], F_SETFD, FD_CLOEXEC);
    fcntl(stderr_pipe[0], F_SETFD, FD_CLOEXEC);

    const pid_t pid = fork();

    if (pid == -1) {
        const std::string reason = std::strerror(errno);
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return tl::unexpected(make_error(
            TransportError::Category::Network,
            "Failed to fork: " + reason
        ));
    }

    if (pid == 0) {
        // Child process - NO ALLOCATIONS ALLOWED
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);

        if (custom_env) {
            execvpe(config_.command.c_str(), argv.data(), envp.data());
        } else {
            execvp(config_.command.c_str(), argv.data());
        }
        _exit(127);
    }

    // Parent process
    close(stdin_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    stdin_stream_ = std::make_shared<Stream>(executor_, stdin_pipe[1]);
    stdout_stream_ = std::make_shared<Stream>(executor_, stdout_pipe[0]);
    stderr_stream_ = std::make_shared<Stream>(executor_, stderr_pipe[0]);

    child_pid_ = pid;
    exit_code_.reset();
    return {};
}

void StdioTransport::terminate_process() {
    if (child_pid_ <= 0) {
        return;
    }

    kill(child_pid_, SIGTERM);

    int status = 0;
    pid_t result = waitpid(child_pid_, &status, WNOHANG);

    if (result == 0) {
        usleep(kProcessTerminationWaitUs);
        result = waitpid(child_pid_, &status, WNOHANG);

        if (result == 0) {
            kill(child_pid_, SIGKILL);
            result = waitpid(child_pid_, &status, 0);
        }
    }

    if (result > 0) {
        exit_code_ = decode_wait_status(status);
    }

    child_pid_ = -1;
}

void StdioTransport::reap_child() {
    if (child_pid_ <= 0) {
        return;
    }

    // stdout can hit EOF a moment before the child becomes waitable
    int status = 0;
    pid_t result = waitpid(child_pid_, &status, WNOHANG);
    for (int attempt = 0; result == 0 && attempt < kReapAttempts; ++attempt) {
        usleep(kReapPollUs);
        result = waitpid(child_pid_, &status, WNOHANG);
    }

    if (result > 0) {
        exit_code_ = decode_wait_status(status);
        child_pid_ = -1;
    }
}

}  // namespace mcphub
