#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Stdio Transport
// ═══════════════════════════════════════════════════════════════════════════
// Spawns an MCP server as a child process and exchanges newline-delimited
// JSON over its stdin/stdout using asio stream descriptors.
//
// - stdout is buffered across reads; one complete line is one message
// - stderr is diagnostic only: each line is logged at warn level
// - process exit reports LinkState::Down; there is no automatic restart
// - shutdown escalates SIGTERM -> SIGKILL

#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "StdioTransport is only available on POSIX-compatible systems"
#endif

#include "mcphub/transport/async_transport.hpp"

#include <asio/experimental/channel.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <sys/types.h>  // pid_t

namespace mcphub {

// ─────────────────────────────────────────────────────────────────────────────
// LineBuffer
// ─────────────────────────────────────────────────────────────────────────────
// Accumulates raw bytes and hands back every complete line. Bytes after the
// last '\n' stay buffered until the next append, so a message split across
// reads is reassembled and several messages in one read are all returned.

class LineBuffer {
public:
    explicit LineBuffer(std::size_t max_line_size = 1 << 20)
        : max_line_size_(max_line_size)
    {}

    /// Append a chunk; returns the complete lines it finished, without '\n'
    /// (a trailing '\r' is stripped too). Blank lines are skipped.
    std::vector<std::string> append(std::string_view chunk);

    /// Bytes waiting for their terminating newline
    [[nodiscard]] std::size_t pending() const noexcept { return buffer_.size(); }

    /// Incremented whenever an over-long partial line had to be discarded
    [[nodiscard]] std::size_t overflow_count() const noexcept { return overflows_; }

    void clear() noexcept { buffer_.clear(); }

private:
    std::string buffer_;
    std::size_t max_line_size_;
    std::size_t overflows_{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct StdioTransportConfig {
    std::string command;
    std::vector<std::string> args;

    /// Added to (or overriding) the inherited environment
    std::unordered_map<std::string, std::string> env;

    /// Server name, used only to label log records
    std::string server_name;

    std::size_t max_message_size{1 << 20};  // 1 MiB
    std::size_t channel_capacity{64};
};

// ─────────────────────────────────────────────────────────────────────────────
// StdioTransport
// ─────────────────────────────────────────────────────────────────────────────

class StdioTransport : public IAsyncTransport {
public:
    StdioTransport(asio::any_io_executor executor, StdioTransportConfig config);
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;
    StdioTransport(StdioTransport&&) = delete;
    StdioTransport& operator=(StdioTransport&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // IAsyncTransport interface
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] asio::any_io_executor get_executor() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_start() override;
    [[nodiscard]] asio::awaitable<void> async_stop() override;
    [[nodiscard]] asio::awaitable<TransportResult<void>> async_send(Json message) override;
    [[nodiscard]] asio::awaitable<TransportResult<Json>> async_receive() override;
    [[nodiscard]] bool is_running() const override;
    void on_link_change(LinkListener listener) override;

    // ─────────────────────────────────────────────────────────────────────────
    // Process-specific methods
    // ─────────────────────────────────────────────────────────────────────────

    /// Child process PID (-1 if not running)
    [[nodiscard]] pid_t child_pid() const;

    /// Exit code, once the child has been reaped (negative = killed by signal)
    [[nodiscard]] std::optional<int> exit_code() const;

private:
    using Stream = asio::posix::stream_descriptor;
    using MessageChannel = asio::experimental::channel<
        void(asio::error_code, TransportResult<Json>)
    >;
    using WriteGate = asio::experimental::channel<void(asio::error_code)>;

    asio::awaitable<void> stdout_reader_loop(
        std::shared_ptr<Stream> stream,
        std::shared_ptr<MessageChannel> channel,
        std::shared_ptr<bool> alive
    );
    asio::awaitable<void> stderr_reader_loop(
        std::shared_ptr<Stream> stream,
        std::shared_ptr<bool> alive
    );

    TransportResult<void> spawn_process();
    void terminate_process();
    void reap_child();
    void notify_link(LinkState state, const std::string& reason);

    StdioTransportConfig config_;

    asio::any_io_executor executor_;
    asio::strand<asio::any_io_executor> strand_;

    std::shared_ptr<Stream> stdin_stream_;
    std::shared_ptr<Stream> stdout_stream_;
    std::shared_ptr<Stream> stderr_stream_;

    // producer: stdout_reader_loop, consumer: async_receive
    std::shared_ptr<MessageChannel> message_channel_;

    // Capacity-1 channel used as an async mutex around stdin writes
    std::shared_ptr<WriteGate> write_gate_;

    // Cleared by the destructor so reader coroutines still parked on the
    // executor never touch this object again
    std::shared_ptr<bool> alive_;

    pid_t child_pid_{-1};
    std::atomic<bool> running_{false};
    std::optional<int> exit_code_;

    LineBuffer stdout_lines_;
    LineBuffer stderr_lines_;

    LinkListener link_listener_;
};

}  // namespace mcphub
