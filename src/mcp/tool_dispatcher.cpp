#include <ffmpeg_tools/mcp/tool_dispatcher.hpp>

#include <ffmpeg_tools/core/log.hpp>
#include <ffmpeg_tools/mcp/result_encoder.hpp>

#include <exception>

namespace ffmpeg_tools {

namespace {

constexpr const char* kComponent = "dispatch";

bool MatchesType(const nlohmann::json& value, const std::string& type) {
    if (type == "string")  return value.is_string();
    if (type == "integer") return value.is_number_integer();
    if (type == "number")  return value.is_number();
    if (type == "boolean") return value.is_boolean();
    if (type == "array")   return value.is_array();
    if (type == "object")  return value.is_object();
    if (type == "null")    return value.is_null();
    // Unknown type keywords are not enforced.
    return true;
}

std::optional<std::string> ValidateProperty(const std::string& name,
                                            const nlohmann::json& spec,
                                            const nlohmann::json& value) {
    const auto type = spec.value("type", std::string());
    if (!type.empty() && !MatchesType(value, type)) {
        return "Parameter '" + name + "' must be of type " + type;
    }

    if (value.is_string() && spec.contains("minLength")) {
        const auto min = spec["minLength"].get<std::size_t>();
        if (value.get_ref<const std::string&>().size() < min) {
            return min == 1 ? "Parameter '" + name + "' must not be empty"
                            : "Parameter '" + name + "' must have at least " +
                                  std::to_string(min) + " characters";
        }
    }

    if (value.is_array()) {
        if (spec.contains("minItems")) {
            const auto min = spec["minItems"].get<std::size_t>();
            if (value.size() < min) {
                return min == 1 ? "Parameter '" + name + "' must not be empty"
                                : "Parameter '" + name + "' must have at least " +
                                      std::to_string(min) + " items";
            }
        }
        if (spec.contains("items") && spec["items"].is_object()) {
            const auto item_type = spec["items"].value("type", std::string());
            for (std::size_t i = 0; i < value.size(); ++i) {
                if (!item_type.empty() && !MatchesType(value[i], item_type)) {
                    return "Parameter '" + name + "[" + std::to_string(i) +
                           "]' must be of type " + item_type;
                }
            }
        }
    }

    return std::nullopt;
}

} // anonymous namespace

std::optional<std::string> ValidateArguments(const nlohmann::json& schema,
                                             const nlohmann::json& arguments) {
    if (!arguments.is_object()) {
        return std::string("Arguments must be a JSON object");
    }

    if (schema.contains("required") && schema["required"].is_array()) {
        for (const auto& key : schema["required"]) {
            const auto& name = key.get_ref<const std::string&>();
            if (!arguments.contains(name) || arguments[name].is_null()) {
                return "Missing required parameter: " + name;
            }
        }
    }

    if (schema.contains("properties") && schema["properties"].is_object()) {
        for (const auto& [name, spec] : schema["properties"].items()) {
            if (!arguments.contains(name)) continue;
            auto problem = ValidateProperty(name, spec, arguments[name]);
            if (problem) return problem;
        }
    }

    return std::nullopt;
}

ToolDispatcher::ToolDispatcher(ToolRegistry registry)
    : registry_(std::move(registry)) {}

ToolResult ToolDispatcher::Dispatch(const ToolCallRequest& request) const {
    const auto& name = request.tool_name;

    const auto* handler = registry_.FindHandler(name);
    const auto* schema = registry_.FindSchema(name);
    if (handler == nullptr || schema == nullptr) {
        LogWarn(kComponent, "unknown tool: " + name);
        return EncodeError(
            ToolError{ToolErrorKind::UnknownTool, "Unknown tool: " + name, name});
    }

    // A missing "arguments" member arrives as null; treat it as {}.
    const auto arguments = request.arguments.is_null()
                               ? nlohmann::json::object()
                               : request.arguments;

    if (auto problem = ValidateArguments(schema->input_schema, arguments)) {
        LogInfo(kComponent, name + ": " + *problem);
        return EncodeError(
            ToolError{ToolErrorKind::InvalidArguments, *problem, name});
    }

    LogDebug(kComponent, "call " + name + " " + DumpJson(arguments));

    try {
        auto outcome = (*handler)(arguments);
        if (outcome.IsErr()) {
            auto error = std::move(outcome).Error();
            error.tool = name;
            LogWarn(kComponent, name + " failed (" +
                    ToolErrorKindName(error.kind) + "): " + error.message);
            return EncodeError(error);
        }
        return EncodeOutput(outcome.Value());
    } catch (const std::exception& e) {
        LogError(kComponent, name + " threw: " + e.what());
        return EncodeError(
            ToolError{ToolErrorKind::HandlerFailed, e.what(), name});
    }
}

} // namespace ffmpeg_tools
