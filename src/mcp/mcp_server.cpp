#include <ffmpeg_tools/mcp/mcp_server.hpp>

#include <ffmpeg_tools/core/log.hpp>
#include <ffmpeg_tools/core/version.hpp>
#include <ffmpeg_tools/mcp/result_encoder.hpp>

#include <string>

namespace ffmpeg_tools {

namespace {

constexpr const char* kComponent = "mcp";
constexpr const char* kProtocolVersion = "2024-11-05";
constexpr const char* kServerName = "ffmpeg-tools";

// JSON-RPC 2.0 error codes.
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;

} // anonymous namespace

McpServer::McpServer(ToolRegistry registry,
                     std::istream& in,
                     std::ostream& out)
    : dispatcher_(std::move(registry)), in_(in), out_(out) {}

void McpServer::Run() {
    LogInfo(kComponent, "serving " +
            std::to_string(dispatcher_.Registry().Tools().size()) +
            " tools on stdio");

    std::string line;
    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        nlohmann::json message;
        try {
            message = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception& e) {
            LogWarn(kComponent, std::string("unparseable message: ") + e.what());
            Send(MakeError(nullptr, kParseError, "Parse error"));
            continue;
        }

        // A well-formed line with the wrong field types must not end the
        // session.
        std::optional<nlohmann::json> response;
        try {
            response = HandleMessage(message);
        } catch (const nlohmann::json::exception& e) {
            LogWarn(kComponent, std::string("malformed request: ") + e.what());
            const bool has_id = message.is_object() && message.contains("id");
            response = MakeError(has_id ? message["id"] : nlohmann::json(nullptr),
                                 kInvalidRequest, "Invalid Request");
        }
        if (response) {
            Send(*response);
        }
    }

    LogInfo(kComponent, "input closed, shutting down");
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    if (!message.is_object()) {
        return MakeError(nullptr, kInvalidRequest, "Invalid Request");
    }

    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        if (message.contains("id")) {
            return MakeError(message["id"], kInvalidRequest,
                             "Invalid JSON-RPC version");
        }
        return std::nullopt;
    }

    const bool has_id = message.contains("id");
    if (!message.contains("method") || !message["method"].is_string()) {
        if (has_id) {
            return MakeError(message["id"], kInvalidRequest,
                             "Invalid Request: method must be a string");
        }
        return std::nullopt;
    }
    if (message.contains("params") && !message["params"].is_object()) {
        if (has_id) {
            return MakeError(message["id"], kInvalidParams,
                             "Invalid params: params must be an object");
        }
        return std::nullopt;
    }

    const auto method = message["method"].get<std::string>();
    auto params = message.value("params", nlohmann::json::object());

    // Notifications have no "id" and never get a response.
    if (!has_id) {
        HandleNotification(method, params);
        return std::nullopt;
    }

    const auto& id = message["id"];
    LogDebug(kComponent, "request " + method + " id=" + id.dump());

    if (method == "initialize") {
        return HandleInitialize(params, id);
    } else if (method == "ping") {
        return MakeResult(id, nlohmann::json::object());
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        return HandleToolsCall(params, id);
    } else if (method == "prompts/list") {
        return MakeResult(id, {{"prompts", nlohmann::json::array()}});
    } else if (method == "resources/list") {
        return MakeResult(id, {{"resources", nlohmann::json::array()}});
    } else if (method == "resources/templates/list") {
        return MakeResult(id, {{"resourceTemplates", nlohmann::json::array()}});
    }
    return MakeError(id, kMethodNotFound, "Method not found: " + method);
}

void McpServer::HandleNotification(const std::string& method,
                                   const nlohmann::json& params) {
    if (method == "notifications/initialized") {
        initialized_ = true;
        LogInfo(kComponent, "client initialized");
    } else if (method == "notifications/cancelled") {
        // Requests run to completion one at a time; by the time a cancel
        // arrives the request it names has already been answered.
        const auto request_id =
            params.contains("requestId") ? params["requestId"].dump() : "?";
        LogDebug(kComponent, "ignoring cancel for request " + request_id);
    } else {
        LogDebug(kComponent, "ignoring notification " + method);
    }
}

nlohmann::json McpServer::HandleInitialize(const nlohmann::json& params,
                                           const nlohmann::json& id) {
    initialized_ = true;

    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        const auto& info = params["clientInfo"];
        const auto field = [&info](const char* key, const char* fallback) {
            return info.contains(key) && info[key].is_string()
                       ? info[key].get<std::string>()
                       : std::string(fallback);
        };
        LogInfo(kComponent, "client: " + field("name", "unknown") + " " +
                field("version", ""));
    }

    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()},
        {"prompts", nlohmann::json::object()},
        {"resources", nlohmann::json::object()},
    };
    result["serverInfo"] = {
        {"name", kServerName},
        {"version", kVersion},
    };

    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) const {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& schema : dispatcher_.Registry().Tools()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema},
        });
    }

    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(const nlohmann::json& params,
                                          const nlohmann::json& id) const {
    if (!params.contains("name") || !params["name"].is_string()) {
        return MakeError(id, kInvalidParams, "Missing 'name' parameter");
    }

    ToolCallRequest request;
    request.tool_name = params["name"].get<std::string>();
    request.arguments = params.value("arguments", nlohmann::json::object());

    auto result = dispatcher_.Dispatch(request);

    if (result.error_kind == ToolErrorKind::UnknownTool) {
        return MakeError(id, kInvalidParams, "Unknown tool: " + request.tool_name,
                         {{"kind", ToolErrorKindName(ToolErrorKind::UnknownTool)},
                          {"tool", request.tool_name}});
    }

    nlohmann::json response_result;
    response_result["content"] = result.content;
    if (result.is_error) {
        response_result["isError"] = true;
    }

    return MakeResult(id, response_result);
}

nlohmann::json McpServer::MakeError(const nlohmann::json& id, int code,
                                    const std::string& message,
                                    const nlohmann::json& data) {
    nlohmann::json error = {
        {"code", code},
        {"message", message},
    };
    if (!data.is_null()) {
        error["data"] = data;
    }
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", error},
    };
}

nlohmann::json McpServer::MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result},
    };
}

void McpServer::Send(const nlohmann::json& message) {
    out_ << DumpJson(message) << '\n';
    out_.flush();
}

} // namespace ffmpeg_tools
