#include "dtmcp/codec.hpp"
#include "dtmcp/error.hpp"
#include "dtmcp/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace dtmcp {

namespace {

using simdjson::ondemand::json_type;
using simdjson::ondemand::number_type;

nlohmann::json to_nlohmann(simdjson::ondemand::value val);

nlohmann::json number_to_nlohmann(simdjson::ondemand::value& val) {
    simdjson::ondemand::number num = val.get_number();
    switch (num.get_number_type()) {
        case number_type::signed_integer:
            return num.get_int64();
        case number_type::unsigned_integer:
            return num.get_uint64();
        default:
            return num.as_double();
    }
}

// Walks the on-demand tree once, in document order.
nlohmann::json to_nlohmann(simdjson::ondemand::value val) {
    const json_type type = val.type();
    if (type == json_type::object) {
        nlohmann::json out = nlohmann::json::object();
        for (auto field : val.get_object()) {
            std::string key(field.unescaped_key().value());
            out[std::move(key)] = to_nlohmann(field.value());
        }
        return out;
    }
    if (type == json_type::array) {
        nlohmann::json out = nlohmann::json::array();
        for (auto element : val.get_array()) {
            out.push_back(to_nlohmann(element.value()));
        }
        return out;
    }
    if (type == json_type::string) {
        return std::string(std::string_view(val.get_string()));
    }
    if (type == json_type::number) {
        return number_to_nlohmann(val);
    }
    if (type == json_type::boolean) {
        return bool(val.get_bool());
    }
    if (val.is_null()) {
        return nullptr;
    }
    throw McpParseError("Unexpected JSON value");
}

} // anonymous namespace

JsonRpcRequest Codec::parse_object(const nlohmann::json& j) {
    auto version = j.find("jsonrpc");
    if (version == j.end()) {
        throw McpParseError("Missing 'jsonrpc' field");
    }
    if (!version->is_string() || version->get<std::string>() != JSONRPC_VERSION) {
        throw McpParseError("Invalid jsonrpc version, expected '2.0'");
    }

    auto method = j.find("method");
    if (method == j.end() || !method->is_string()) {
        throw McpParseError("Missing or non-string 'method' field");
    }

    auto id = j.find("id");
    if (id != j.end() && !id->is_null() && !id->is_number_integer() && !id->is_string()) {
        throw McpParseError("Request ID must be an integer, a string or null");
    }
    // RequestId holds signed 64-bit integers; larger ids could not be echoed intact
    if (id != j.end() && id->is_number_unsigned()
        && id->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw McpParseError("Request ID is out of range");
    }

    JsonRpcRequest req;
    from_json(j, req);
    return req;
}

JsonRpcRequest Codec::parse_request(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty input");
    }

    // simdjson requires padded input
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    // Convert to nlohmann for further processing
    nlohmann::json j;
    try {
        simdjson::ondemand::json_type root_type = doc.type();
        if (root_type != simdjson::ondemand::json_type::object) {
            throw McpParseError("Message must be a JSON object");
        }
        j = to_nlohmann(doc.get_value().value());
        if (!doc.at_end()) {
            throw McpParseError("Trailing content after JSON object");
        }
    } catch (const McpParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw McpParseError(std::string("JSON conversion error: ") + e.what());
    }

    return parse_object(j);
}

std::string Codec::serialize(const JsonRpcResponse& resp) {
    nlohmann::json j;
    to_json(j, resp);
    return j.dump();
}

std::string Codec::serialize(const JsonRpcRequest& req) {
    nlohmann::json j;
    to_json(j, req);
    return j.dump();
}

} // namespace dtmcp
