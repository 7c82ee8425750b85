#pragma once

// ---------------------------------------------------------------------------
// mcp_types.hpp
//
// MCP 페이로드 해석/생성 헬퍼. JSON-RPC 봉투(envelope)는 jsonrpc.hpp 소관,
// 이 헤더는 result/params 내부 구조만 다룬다.
//
// [설계 원칙]
// - 도구 정의는 원본 JSON(raw)을 함께 보관한다. 필터링된 목록을 호출자에게
//   돌려줄 때 raw 를 그대로 전달하여, 릴레이가 모르는 필드(annotations,
//   outputSchema, title 등)가 손실되지 않게 한다.
// - 읽을 수 없는 도구 항목(name 이 문자열이 아님)은 목록에서 제외하고
//   dropped 로 집계한다. 이름이 없으면 허용 집합에 들어갈 수 없다 (fail-close).
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

inline constexpr std::string_view kLatestProtocolVersion = "2025-06-18";

// 호출자가 요청한 버전이 이 목록에 있으면 그대로 응답한다.
[[nodiscard]] bool is_supported_protocol_version(std::string_view version) noexcept;

// ---------------------------------------------------------------------------
// ToolDefinition
//   tools/list 결과의 도구 하나.
//
//   name         : 도구 이름 (게이트 판정 키)
//   description  : 설명 (없으면 빈 문자열)
//   input_schema : inputSchema (없으면 null)
//   raw          : 백엔드가 보낸 원본 JSON 객체
// ---------------------------------------------------------------------------
struct ToolDefinition {
    std::string name{};
    std::string description{};
    Json::Value input_schema{};
    Json::Value raw{};
};

// ---------------------------------------------------------------------------
// ToolPage
//   tools/list 응답 한 페이지.
//   next_cursor 가 있으면 다음 페이지가 존재한다.
// ---------------------------------------------------------------------------
struct ToolPage {
    std::vector<ToolDefinition> tools{};
    std::optional<std::string>  next_cursor{};
    std::size_t                 dropped{0};
};

// parse_tool
//   도구 JSON 하나를 해석한다. name 이 문자열이 아니면 nullopt.
[[nodiscard]] std::optional<ToolDefinition> parse_tool(const Json::Value& tool);

// parse_tool_page
//   tools/list result 를 해석한다. result 가 객체가 아니거나 tools 가
//   배열이 아니면 kInternalError.
[[nodiscard]] std::expected<ToolPage, RpcError> parse_tool_page(const Json::Value& result);

// make_tool_list_result
//   {tools:[raw...]} 를 만든다.
[[nodiscard]] Json::Value make_tool_list_result(const std::vector<ToolDefinition>& tools);

// make_blocked_tool_result
//   차단된 tools/call 에 대한 CallToolResult.
//   {content:[{type:"text", text:"Tool '<name>' is blocked by firewall policy"}],
//    isError:true}
[[nodiscard]] Json::Value make_blocked_tool_result(std::string_view tool_name);

[[nodiscard]] std::string blocked_message(std::string_view tool_name);

// ---------------------------------------------------------------------------
// PeerInfo
//   백엔드 initialize 응답에서 보관하는 정보.
// ---------------------------------------------------------------------------
struct PeerInfo {
    std::string                protocol_version{};
    Json::Value                server_info{};
    Json::Value                capabilities{Json::objectValue};
    std::optional<std::string> instructions{};
};

// make_client_initialize_params
//   백엔드로 보내는 initialize params (clientInfo = mcp-fw).
[[nodiscard]] Json::Value make_client_initialize_params();

// parse_initialize_result
//   백엔드의 initialize result 를 해석한다. protocolVersion 이 없으면 오류.
[[nodiscard]] std::expected<PeerInfo, RpcError> parse_initialize_result(const Json::Value& result);

// mirror_capabilities
//   백엔드 capabilities 중 tools/resources/prompts/completions/logging 키만
//   복사한다. listChanged 는 false 로, resources.subscribe 는 제거한다
//   (릴레이는 백엔드 알림을 전달하지 않는다).
[[nodiscard]] Json::Value mirror_capabilities(const Json::Value& backend_capabilities);

// make_server_initialize_result
//   호출자 initialize 에 대한 응답 result.
//   requested_version 이 지원 목록에 있으면 그대로, 아니면 최신 버전.
[[nodiscard]] Json::Value make_server_initialize_result(std::string_view requested_version,
                                                        const PeerInfo&  backend);
