#pragma once

#include "common/types.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include <json/json.h>

// ---------------------------------------------------------------------------
// McpMethod
//   릴레이가 구분하는 MCP method 종류.
//   호출자 세션의 디스패치 테이블은 이 열거형 위의 switch 로 구성된다
//   (런타임 핸들러 등록 없음).
// ---------------------------------------------------------------------------
enum class McpMethod : std::uint8_t {
    kInitialize,             // initialize
    kInitialized,            // notifications/initialized
    kPing,                   // ping
    kToolsList,              // tools/list         (게이트 적용)
    kToolsCall,              // tools/call         (게이트 적용)
    kResourcesList,          // resources/list
    kResourceTemplatesList,  // resources/templates/list
    kResourcesRead,          // resources/read
    kPromptsList,            // prompts/list
    kPromptsGet,             // prompts/get
    kCompletionComplete,     // completion/complete
    kLoggingSetLevel,        // logging/setLevel
    kCancelled,              // notifications/cancelled
    kUnknown,                // 미분류
};

// ---------------------------------------------------------------------------
// MessageKind
//   JSON-RPC 2.0 메시지 구조 분류.
//
//   kRequest      : method(string) + id(string|number)
//   kNotification : method(string), id 없음
//   kResponse     : id + (result | error), method 없음
//   kInvalid      : 위 어느 것에도 해당하지 않음 (jsonrpc != "2.0" 포함)
// ---------------------------------------------------------------------------
enum class MessageKind : std::uint8_t {
    kRequest,
    kNotification,
    kResponse,
    kInvalid,
};

inline constexpr std::string_view kJsonRpcVersion = "2.0";

// parse_method
//   method 문자열을 McpMethod 로 매핑한다. 모르는 값은 kUnknown.
auto parse_method(std::string_view method) noexcept -> McpMethod;

// method_name
//   McpMethod 의 와이어 문자열. kUnknown 은 "unknown".
auto method_name(McpMethod method) noexcept -> std::string_view;

auto classify_message(const Json::Value& message) noexcept -> MessageKind;

// has_valid_id
//   id 가 string 또는 정수인지. null id 는 요청 id 로 인정하지 않는다.
auto has_valid_id(const Json::Value& message) noexcept -> bool;

// ---------------------------------------------------------------------------
// parse_message
//   개행 없는 한 줄을 JSON 객체로 파싱한다.
//
//   실패 조건:
//     - JSON 문법 오류 / 후행 문자       -> kParseError (-32700)
//     - 최상위가 객체가 아님 (배치 포함)  -> kInvalidRequest (-32600)
// ---------------------------------------------------------------------------
auto parse_message(std::string_view line) -> std::expected<Json::Value, RpcError>;

// serialize_message
//   한 줄 JSON 으로 직렬화한다 (개행 미포함, 문자열 내부 개행은 이스케이프).
auto serialize_message(const Json::Value& message) -> std::string;

// ---------------------------------------------------------------------------
// 메시지 생성 헬퍼
//   params / result 가 null 이면 해당 멤버를 생략한다 (JSON-RPC 2.0 허용).
//   단, result 는 필수 멤버이므로 null 이면 빈 객체로 채운다.
// ---------------------------------------------------------------------------
auto make_request(const Json::Value& id, std::string_view method, const Json::Value& params)
    -> Json::Value;
auto make_notification(std::string_view method, const Json::Value& params) -> Json::Value;
auto make_result(const Json::Value& id, const Json::Value& result) -> Json::Value;
auto make_error(const Json::Value& id, const RpcError& error) -> Json::Value;

// error_from_json
//   응답의 error 객체를 RpcError 로 변환한다. 형식이 잘못되었으면
//   code = -32603 으로 채운다 (코드/메시지/데이터를 가능한 한 보존).
auto error_from_json(const Json::Value& error) -> RpcError;
