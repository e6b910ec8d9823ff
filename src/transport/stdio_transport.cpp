#include "dtmcp/transport/stdio_transport.hpp"
#include "dtmcp/error.hpp"
#include "dtmcp/logging.hpp"

#include <log4cplus/loggingmacros.h>

#include <unistd.h>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace dtmcp {

namespace {

bool is_blank(std::string_view line) {
    for (char c : line) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // anonymous namespace

StdioTransport::StdioTransport()
    : read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true) {
}

StdioTransport::~StdioTransport() {
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }
}

void StdioTransport::start(RequestCallback on_request) {
    // shutdown() before start() means there is nothing to run
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) {
        return; // already running
    }
    connected_ = true;

    std::string buffer;
    buffer.reserve(4096);

    char chunk[4096];

    while (running_) {
        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            connected_ = false;
            running_ = false;
            throw McpTransportError(std::string("Read error: ") + std::strerror(errno));
        }
        if (n == 0) {
            // EOF: an unterminated last line still counts as a message
            LOG4CPLUS_DEBUG(transport_logger(), "EOF received");
            if (!buffer.empty()) {
                handle_line(buffer, on_request);
                buffer.clear();
            }
            break;
        }

        buffer.append(chunk, static_cast<size_t>(n));

        // Process complete lines
        size_t pos = 0;
        while (running_) {
            size_t nl = buffer.find('\n', pos);
            if (nl == std::string::npos) break;

            std::string_view line(buffer.data() + pos, nl - pos);
            pos = nl + 1;
            handle_line(line, on_request);
        }

        if (pos > 0) {
            buffer.erase(0, pos);
        }
    }

    connected_ = false;
    running_ = false;
}

void StdioTransport::handle_line(std::string_view line, const RequestCallback& on_request) {
    // Remove trailing \r if present (CRLF)
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    if (is_blank(line)) return;

    LOG4CPLUS_TRACE(transport_logger(), "Received: " << line);

    JsonRpcRequest req;
    try {
        req = Codec::parse_request(line);
    } catch (const McpParseError& e) {
        LOG4CPLUS_WARN(transport_logger(), "Parse error: " << e.what());
        send(JsonRpcResponse::failure(std::nullopt, error::ParseError, "Parse error"));
        return;
    }

    JsonRpcResponse resp;
    try {
        resp = on_request(req);
    } catch (const std::exception& e) {
        LOG4CPLUS_ERROR(transport_logger(), "Request handler failed: " << e.what());
        resp = JsonRpcResponse::failure(req.id, error::InternalError, e.what());
    }
    send(resp);
}

void StdioTransport::send(const JsonRpcResponse& resp) {
    std::string serialized = Codec::serialize(resp);
    LOG4CPLUS_TRACE(transport_logger(), "Sending: " << serialized);
    serialized += '\n';
    write_all(serialized);
}

// Nothing is buffered in user space: the peer sees each line as soon as the
// loop below finishes.
void StdioTransport::write_all(const std::string& data) {
    const char* p = data.data();
    size_t remaining = data.size();

    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, p, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            connected_ = false;
            running_ = false;
            throw McpTransportError(std::string("Write error: ") + std::strerror(errno));
        }
        p += written;
        remaining -= static_cast<size_t>(written);
    }
}

void StdioTransport::shutdown() {
    shutdown_requested_ = true;
    running_ = false;
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace dtmcp
