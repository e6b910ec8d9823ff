#include "dtmcp/server.hpp"
#include "dtmcp/error.hpp"
#include "dtmcp/logging.hpp"
#include "dtmcp/router.hpp"
#include "dtmcp/tool_dispatcher.hpp"
#include "dtmcp/tool_registry.hpp"
#include "dtmcp/version.hpp"
#include "dtmcp/transport/stdio_transport.hpp"

#include <log4cplus/loggingmacros.h>

#include <atomic>
#include <string>
#include <utility>

namespace dtmcp {

// ----------- McpServer::Impl -----------

struct McpServer::Impl {
    Options opts;
    Router router;
    ToolDispatcher dispatcher;

    ITransport* transport{nullptr};
    std::atomic<bool> running{false};

    explicit Impl(Options o)
        : opts(std::move(o)), dispatcher(DateTimeTools(opts.calendar)) {}

    void setup_handlers() {
        // initialize
        router.on_request("initialize", [this](const nlohmann::json&) -> HandlerResult {
            InitializeResult result;
            result.protocol_version = opts.protocol_version;
            result.server_info = opts.server_info;
            result.capabilities.tools = nlohmann::json::object();

            nlohmann::json j;
            to_json(j, result);
            return j;
        });

        // tools/list
        router.on_request("tools/list", [](const nlohmann::json&) -> HandlerResult {
            return nlohmann::json{{"tools", ToolRegistry::list()}};
        });

        // tools/call; without params the method is treated as unknown
        router.on_request("tools/call", [this](const nlohmann::json& params) -> HandlerResult {
            std::string name = params.at("name").get<std::string>();
            nlohmann::json arguments = nlohmann::json::object();
            auto args_it = params.find("arguments");
            if (args_it != params.end() && !args_it->is_null()) {
                arguments = *args_it;
            }

            ToolOutput output = dispatcher.dispatch(name, arguments);

            CallToolResult result;
            result.content.push_back(TextContent{to_text(output)});
            nlohmann::json j;
            to_json(j, result);
            return j;
        }, ParamsPolicy::Required);
    }
};

// ----------- McpServer -----------

McpServer::Options McpServer::default_options() {
    Options opts;
    opts.server_info = {std::string(SERVER_NAME), std::string(SERVER_VERSION)};
    opts.protocol_version = std::string(PROTOCOL_VERSION);
    return opts;
}

McpServer::McpServer()
    : McpServer(default_options()) {
}

McpServer::McpServer(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {
    impl_->setup_handlers();
}

McpServer::~McpServer() = default;

JsonRpcResponse McpServer::handle(const JsonRpcRequest& req) const noexcept {
    return impl_->router.dispatch(req);
}

void McpServer::serve(std::unique_ptr<ITransport> transport) {
    impl_->running = true;
    impl_->transport = transport.get();
    LOG4CPLUS_INFO(server_logger(), impl_->opts.server_info.name << " "
                   << impl_->opts.server_info.version << " serving");

    try {
        transport->start([this](const JsonRpcRequest& req) {
            return handle(req);
        });
    } catch (...) {
        impl_->running = false;
        impl_->transport = nullptr;
        throw;
    }

    LOG4CPLUS_INFO(server_logger(), "Input closed, shutting down");
    impl_->running = false;
    impl_->transport = nullptr;
}

void McpServer::serve_stdio() {
    serve(std::make_unique<StdioTransport>());
}

void McpServer::shutdown() {
    impl_->running = false;
    if (impl_->transport) {
        impl_->transport->shutdown();
    }
}

bool McpServer::is_running() const {
    return impl_->running;
}

} // namespace dtmcp
