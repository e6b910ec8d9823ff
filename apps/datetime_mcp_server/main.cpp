/// datetime-mcp-server: date/time tools for MCP hosts.
/// Usage: datetime-mcp-server [--log-level LEVEL] [--log-config FILE]
///                            [--timezone ZONE] [--zoneinfo DIR]
/// Communicates over stdio (newline-delimited JSON-RPC). Diagnostics go to stderr.

#include <dtmcp/dtmcp.hpp>

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <csignal>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>

namespace {

void print_usage(std::ostream& out) {
    out << "Usage: datetime-mcp-server [options]\n"
        << "  --log-level LEVEL   TRACE, DEBUG, INFO, WARN, ERROR, FATAL or OFF (default OFF)\n"
        << "  --log-config FILE   log4cplus properties file\n"
        << "  --timezone ZONE     override the system default timezone (IANA id)\n"
        << "  --zoneinfo DIR      timezone database root (default "
        << dtmcp::DEFAULT_ZONEINFO_ROOT << ")\n"
        << "  -v, --version       print version and exit\n"
        << "  -h, --help          print this help and exit\n";
}

// Matches "--name value" and "--name=value".
bool take_option(int argc, char** argv, int& i, const char* name, std::string& out) {
    const size_t len = std::strlen(name);
    if (std::strcmp(argv[i], name) == 0 && i + 1 < argc) {
        out = argv[++i];
        return true;
    }
    if (std::strncmp(argv[i], name, len) == 0 && argv[i][len] == '=') {
        out = argv[i] + len + 1;
        return true;
    }
    return false;
}

} // anonymous namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    std::optional<std::string> log_config;
    std::string log_level = "OFF";
    dtmcp::McpServer::Options opts = dtmcp::McpServer::default_options();

    for (int i = 1; i < argc; ++i) {
        std::string value;
        if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
            std::cout << dtmcp::SERVER_NAME << " " << dtmcp::SERVER_VERSION
                      << " (MCP " << dtmcp::PROTOCOL_VERSION << ")" << std::endl;
            return 0;
        }
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage(std::cout);
            return 0;
        }
        if (take_option(argc, argv, i, "--log-level", value)) {
            log_level = value;
            continue;
        }
        if (take_option(argc, argv, i, "--log-config", value)) {
            log_config = value;
            continue;
        }
        if (take_option(argc, argv, i, "--timezone", value)) {
            opts.calendar.default_timezone = value;
            continue;
        }
        if (take_option(argc, argv, i, "--zoneinfo", value)) {
            opts.calendar.zoneinfo_root = value;
            continue;
        }
        std::cerr << "Unknown option: " << argv[i] << "\n";
        print_usage(std::cerr);
        return 2;
    }

    dtmcp::init_logging(log_config, log_level);

    // A vanished client must surface as a write error, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    try {
        dtmcp::McpServer server{std::move(opts)};
        server.serve_stdio();
    } catch (const dtmcp::McpTransportError& e) {
        LOG4CPLUS_ERROR(dtmcp::server_logger(), "Transport failure: " << e.what());
        return 1;
    }

    LOG4CPLUS_INFO(dtmcp::server_logger(), "DateTime MCP server stopped");
    return 0;
}
