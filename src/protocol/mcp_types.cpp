#include "protocol/mcp_types.hpp"

#include <algorithm>
#include <array>

#include <fmt/format.h>

namespace {

constexpr std::array<std::string_view, 3> kSupportedVersions{
    "2024-11-05",
    "2025-03-26",
    "2025-06-18",
};

// mirror 대상 capability 키 (listChanged 를 가질 수 있는 것만 true)
struct CapabilityKey {
    const char* key;
    bool        has_list_changed;
};

constexpr std::array<CapabilityKey, 5> kMirroredCapabilities{{
    {"tools",       true},
    {"resources",   true},
    {"prompts",     true},
    {"completions", false},
    {"logging",     false},
}};

}  // namespace

bool is_supported_protocol_version(std::string_view version) noexcept {
    return std::find(kSupportedVersions.begin(), kSupportedVersions.end(), version)
           != kSupportedVersions.end();
}

std::optional<ToolDefinition> parse_tool(const Json::Value& tool) {
    if (!tool.isObject() || !tool["name"].isString()) {
        return std::nullopt;
    }
    ToolDefinition def{};
    def.name = tool["name"].asString();
    if (tool["description"].isString()) {
        def.description = tool["description"].asString();
    }
    def.input_schema = tool["inputSchema"];
    def.raw          = tool;
    return def;
}

std::expected<ToolPage, RpcError> parse_tool_page(const Json::Value& result) {
    if (!result.isObject() || !result["tools"].isArray()) {
        return std::unexpected(RpcError{RpcErrorCode::kInternalError,
                                        "backend tools/list result has no 'tools' array"});
    }

    ToolPage page{};
    const Json::Value& tools = result["tools"];
    page.tools.reserve(tools.size());
    for (const auto& tool : tools) {
        if (auto def = parse_tool(tool)) {
            page.tools.push_back(std::move(*def));
        } else {
            ++page.dropped;
        }
    }

    const Json::Value& cursor = result["nextCursor"];
    if (cursor.isString() && !cursor.asString().empty()) {
        page.next_cursor = cursor.asString();
    }
    return page;
}

Json::Value make_tool_list_result(const std::vector<ToolDefinition>& tools) {
    Json::Value list(Json::arrayValue);
    for (const auto& tool : tools) {
        list.append(tool.raw);
    }
    Json::Value result(Json::objectValue);
    result["tools"] = std::move(list);
    return result;
}

std::string blocked_message(std::string_view tool_name) {
    return fmt::format("Tool '{}' is blocked by firewall policy", tool_name);
}

Json::Value make_blocked_tool_result(std::string_view tool_name) {
    Json::Value text(Json::objectValue);
    text["type"] = "text";
    text["text"] = blocked_message(tool_name);

    Json::Value result(Json::objectValue);
    result["content"] = Json::Value(Json::arrayValue);
    result["content"].append(std::move(text));
    result["isError"] = true;
    return result;
}

Json::Value make_client_initialize_params() {
    Json::Value client_info(Json::objectValue);
    client_info["name"]    = std::string(kProxyName);
    client_info["version"] = std::string(kProxyVersion);

    Json::Value params(Json::objectValue);
    params["protocolVersion"] = std::string(kLatestProtocolVersion);
    params["capabilities"]    = Json::Value(Json::objectValue);
    params["clientInfo"]      = std::move(client_info);
    return params;
}

std::expected<PeerInfo, RpcError> parse_initialize_result(const Json::Value& result) {
    if (!result.isObject() || !result["protocolVersion"].isString()) {
        return std::unexpected(RpcError{RpcErrorCode::kInternalError,
                                        "backend initialize result has no protocolVersion"});
    }
    PeerInfo info{};
    info.protocol_version = result["protocolVersion"].asString();
    info.server_info      = result["serverInfo"];
    if (result["capabilities"].isObject()) {
        info.capabilities = result["capabilities"];
    }
    if (result["instructions"].isString()) {
        info.instructions = result["instructions"].asString();
    }
    return info;
}

Json::Value mirror_capabilities(const Json::Value& backend_capabilities) {
    Json::Value caps(Json::objectValue);
    if (!backend_capabilities.isObject()) {
        return caps;
    }
    for (const auto& entry : kMirroredCapabilities) {
        if (!backend_capabilities.isMember(entry.key)) {
            continue;
        }
        Json::Value cap = backend_capabilities[entry.key];
        if (!cap.isObject()) {
            cap = Json::Value(Json::objectValue);
        }
        if (entry.has_list_changed) {
            cap["listChanged"] = false;
        }
        cap.removeMember("subscribe");
        caps[entry.key] = std::move(cap);
    }
    return caps;
}

Json::Value make_server_initialize_result(std::string_view requested_version,
                                          const PeerInfo&  backend) {
    Json::Value server_info(Json::objectValue);
    server_info["name"]    = std::string(kProxyName);
    server_info["version"] = std::string(kProxyVersion);

    Json::Value result(Json::objectValue);
    result["protocolVersion"] = is_supported_protocol_version(requested_version)
                                    ? std::string(requested_version)
                                    : std::string(kLatestProtocolVersion);
    result["capabilities"] = mirror_capabilities(backend.capabilities);
    result["serverInfo"]   = std::move(server_info);
    if (backend.instructions) {
        result["instructions"] = *backend.instructions;
    }
    return result;
}
