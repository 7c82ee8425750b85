#include "protocol/jsonrpc.hpp"

#include <array>
#include <memory>
#include <utility>

#include <fmt/format.h>

// ---------------------------------------------------------------------------
// jsonrpc.cpp 구현
//
// jsoncpp 의 CharReaderBuilder / StreamWriterBuilder 를 사용한다.
// 리더는 strictMode (주석 금지, 후행 문자 금지, 중복 키 거부),
// 라이터는 indentation "" (한 줄 출력) 로 설정한다.
// ---------------------------------------------------------------------------

namespace {

struct MethodEntry {
    std::string_view name;
    McpMethod        method;
};

constexpr std::array<MethodEntry, 13> kMethodTable{{
    {"initialize",                McpMethod::kInitialize},
    {"notifications/initialized", McpMethod::kInitialized},
    {"ping",                      McpMethod::kPing},
    {"tools/list",                McpMethod::kToolsList},
    {"tools/call",                McpMethod::kToolsCall},
    {"resources/list",            McpMethod::kResourcesList},
    {"resources/templates/list",  McpMethod::kResourceTemplatesList},
    {"resources/read",            McpMethod::kResourcesRead},
    {"prompts/list",              McpMethod::kPromptsList},
    {"prompts/get",               McpMethod::kPromptsGet},
    {"completion/complete",       McpMethod::kCompletionComplete},
    {"logging/setLevel",          McpMethod::kLoggingSetLevel},
    {"notifications/cancelled",   McpMethod::kCancelled},
}};

const Json::StreamWriterBuilder& writer_builder() {
    static const Json::StreamWriterBuilder kBuilder = [] {
        Json::StreamWriterBuilder b;
        b["indentation"] = "";
        b["emitUTF8"]    = true;
        return b;
    }();
    return kBuilder;
}

}  // namespace

auto parse_method(std::string_view method) noexcept -> McpMethod {
    for (const auto& entry : kMethodTable) {
        if (entry.name == method) {
            return entry.method;
        }
    }
    return McpMethod::kUnknown;
}

auto method_name(McpMethod method) noexcept -> std::string_view {
    for (const auto& entry : kMethodTable) {
        if (entry.method == method) {
            return entry.name;
        }
    }
    return "unknown";
}

auto has_valid_id(const Json::Value& message) noexcept -> bool {
    if (!message.isObject() || !message.isMember("id")) {
        return false;
    }
    const Json::Value& id = message["id"];
    return id.isString() || id.isIntegral();
}

auto classify_message(const Json::Value& message) noexcept -> MessageKind {
    if (!message.isObject()) {
        return MessageKind::kInvalid;
    }
    const Json::Value& version = message["jsonrpc"];
    if (!version.isString() || version.asString() != kJsonRpcVersion) {
        return MessageKind::kInvalid;
    }

    if (message.isMember("method")) {
        if (!message["method"].isString()) {
            return MessageKind::kInvalid;
        }
        if (!message.isMember("id")) {
            return MessageKind::kNotification;
        }
        return has_valid_id(message) ? MessageKind::kRequest : MessageKind::kInvalid;
    }

    const bool has_result = message.isMember("result");
    const bool has_error  = message.isMember("error");
    if (message.isMember("id") && (has_result != has_error)) {
        return MessageKind::kResponse;
    }
    return MessageKind::kInvalid;
}

auto parse_message(std::string_view line) -> std::expected<Json::Value, RpcError> {
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errs;
    if (!reader->parse(line.data(), line.data() + line.size(), &root, &errs)) {
        return std::unexpected(RpcError{RpcErrorCode::kParseError,
                                        fmt::format("Parse error: {}", errs)});
    }
    if (!root.isObject()) {
        return std::unexpected(RpcError{RpcErrorCode::kInvalidRequest,
                                        "Invalid Request: message must be a JSON object"});
    }
    return root;
}

auto serialize_message(const Json::Value& message) -> std::string {
    return Json::writeString(writer_builder(), message);
}

auto make_request(const Json::Value& id, std::string_view method, const Json::Value& params)
    -> Json::Value
{
    Json::Value msg(Json::objectValue);
    msg["jsonrpc"] = std::string(kJsonRpcVersion);
    msg["id"]      = id;
    msg["method"]  = std::string(method);
    if (!params.isNull()) {
        msg["params"] = params;
    }
    return msg;
}

auto make_notification(std::string_view method, const Json::Value& params) -> Json::Value {
    Json::Value msg(Json::objectValue);
    msg["jsonrpc"] = std::string(kJsonRpcVersion);
    msg["method"]  = std::string(method);
    if (!params.isNull()) {
        msg["params"] = params;
    }
    return msg;
}

auto make_result(const Json::Value& id, const Json::Value& result) -> Json::Value {
    Json::Value msg(Json::objectValue);
    msg["jsonrpc"] = std::string(kJsonRpcVersion);
    msg["id"]      = id;
    msg["result"]  = result.isNull() ? Json::Value(Json::objectValue) : result;
    return msg;
}

auto make_error(const Json::Value& id, const RpcError& error) -> Json::Value {
    Json::Value err(Json::objectValue);
    err["code"]    = error.code;
    err["message"] = error.message;
    if (!error.data.isNull()) {
        err["data"] = error.data;
    }

    Json::Value msg(Json::objectValue);
    msg["jsonrpc"] = std::string(kJsonRpcVersion);
    msg["id"]      = id;
    msg["error"]   = std::move(err);
    return msg;
}

auto error_from_json(const Json::Value& error) -> RpcError {
    if (!error.isObject()) {
        return RpcError{RpcErrorCode::kInternalError, "malformed error object from peer"};
    }
    const Json::Value& code    = error["code"];
    const Json::Value& message = error["message"];
    return RpcError{
        code.isInt() ? code.asInt() : static_cast<int>(RpcErrorCode::kInternalError),
        message.isString() ? message.asString() : std::string{"unknown error"},
        error.isMember("data") ? error["data"] : Json::Value{},
    };
}
