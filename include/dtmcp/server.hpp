#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "calendar.hpp"
#include "transport/transport.hpp"
#include <memory>
#include <string>

namespace dtmcp {

/// Date/time MCP server: initialize, tools/list and tools/call over a
/// line-oriented transport. Stateless between requests.
class McpServer {
public:
    struct Options {
        Implementation server_info;
        std::string protocol_version;
        DateTimeTools::Options calendar;
    };

    /// Server named datetime-mcp-server, default calendar options.
    McpServer();
    explicit McpServer(Options opts);
    ~McpServer();

    // Non-copyable, non-movable
    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    /// Handle one request. Total: every failure becomes an error response
    /// that echoes the request id.
    [[nodiscard]] JsonRpcResponse handle(const JsonRpcRequest& req) const noexcept;

    /// Serve over stdio. Blocks until end of input.
    void serve_stdio();
    void serve(std::unique_ptr<ITransport> transport);
    void shutdown();

    bool is_running() const;

    [[nodiscard]] static Options default_options();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dtmcp
