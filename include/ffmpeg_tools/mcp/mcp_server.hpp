#pragma once

#include <ffmpeg_tools/mcp/tool_dispatcher.hpp>
#include <ffmpeg_tools/mcp/tool_registry.hpp>

#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ffmpeg_tools {

// ---------------------------------------------------------------------------
// McpServer: MCP 2024-11-05 server over newline-delimited JSON-RPC 2.0.
//
// Requests:       initialize, ping, tools/list, tools/call, prompts/list,
//                 resources/list, resources/templates/list
// Notifications:  notifications/initialized, notifications/cancelled
//
// One request is handled at a time; a failing tool call never ends the
// session.
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(ToolRegistry registry,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    // Run the server loop (blocks until EOF on the input stream).
    void Run();

    // Process a single JSON-RPC message and return the response (if any).
    // Returns nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    [[nodiscard]] bool Initialized() const noexcept { return initialized_; }

private:
    nlohmann::json HandleInitialize(const nlohmann::json& params,
                                    const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id) const;
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id) const;
    void HandleNotification(const std::string& method,
                            const nlohmann::json& params);

    static nlohmann::json MakeError(const nlohmann::json& id, int code,
                                    const std::string& message,
                                    const nlohmann::json& data = nullptr);
    static nlohmann::json MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result);

    void Send(const nlohmann::json& message);

    ToolDispatcher dispatcher_;
    std::istream& in_;
    std::ostream& out_;
    bool initialized_ = false;
};

} // namespace ffmpeg_tools
