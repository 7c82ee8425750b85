#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <json/json.h>

// 빌드 시스템이 -DMCP_FW_VERSION_STRING=... 으로 주입한다.
#ifndef MCP_FW_VERSION_STRING
#define MCP_FW_VERSION_STRING "0.1.0-dev"
#endif

// 양쪽 세션(serverInfo / clientInfo)에 노출되는 프록시 이름.
inline constexpr std::string_view kProxyName    = "mcp-fw";
inline constexpr std::string_view kProxyVersion = MCP_FW_VERSION_STRING;

// ---------------------------------------------------------------------------
// RpcErrorCode
//   JSON-RPC 2.0 표준 오류 코드 + MCP 전송 종료 코드.
//   백엔드가 보낸 임의의 코드도 그대로 릴레이해야 하므로 RpcError::code 는
//   enum 이 아닌 int 로 보관한다.
// ---------------------------------------------------------------------------
enum class RpcErrorCode : int {
    kParseError       = -32700,  // JSON 파싱 불가
    kInvalidRequest   = -32600,  // JSON-RPC 구조 위반
    kMethodNotFound   = -32601,  // 지원하지 않는 method
    kInvalidParams    = -32602,  // params 형식 오류
    kInternalError    = -32603,  // 프록시 내부 오류
    kConnectionClosed = -32000,  // 세션 전송 계층 종료 (MCP SDK 관례)
};

// ---------------------------------------------------------------------------
// RpcError
//   JSON-RPC error 객체 하나를 나타낸다.
//   std::expected<Json::Value, RpcError> 패턴과 함께 사용한다.
//
//   data: 백엔드가 보낸 error.data 를 손대지 않고 보관 (없으면 null).
// ---------------------------------------------------------------------------
struct RpcError {
    int         code{static_cast<int>(RpcErrorCode::kInternalError)};
    std::string message{};
    Json::Value data{};

    RpcError() = default;
    RpcError(RpcErrorCode c, std::string msg)
        : code{static_cast<int>(c)}
        , message{std::move(msg)}
    {}
    RpcError(int c, std::string msg, Json::Value d)
        : code{c}
        , message{std::move(msg)}
        , data{std::move(d)}
    {}

    [[nodiscard]] bool is_transport_closed() const noexcept {
        return code == static_cast<int>(RpcErrorCode::kConnectionClosed);
    }
};
