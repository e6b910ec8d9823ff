#pragma once
#include "../json_rpc.hpp"
#include <functional>

namespace dtmcp {

/// Produces the response for one parsed request.
using RequestCallback = std::function<JsonRpcResponse(const JsonRpcRequest&)>;

/// Abstract transport interface
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Run the read/dispatch/write loop. Blocks until end of input or shutdown.
    virtual void start(RequestCallback on_request) = 0;

    /// Write one response and flush it.
    virtual void send(const JsonRpcResponse& resp) = 0;

    /// Stop after the message currently being processed.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace dtmcp
