#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include <atomic>
#include <string>
#include <string_view>

namespace dtmcp {

/// StdioTransport reads newline-delimited JSON from stdin and writes one
/// response line per request to stdout. Single-threaded: each line is
/// parsed, dispatched and answered before the next one is read.
class StdioTransport : public ITransport {
public:
    /// Create transport using system stdin/stdout.
    StdioTransport();

    /// Create transport using specified file descriptors (for testing).
    /// The transport takes ownership and closes them on destruction.
    StdioTransport(int read_fd, int write_fd);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void start(RequestCallback on_request) override;
    void send(const JsonRpcResponse& resp) override;
    void shutdown() override;
    bool is_connected() const override;

private:
    void handle_line(std::string_view line, const RequestCallback& on_request);
    void write_all(const std::string& data);

    int read_fd_;
    int write_fd_;
    bool owns_fds_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};
};

} // namespace dtmcp
