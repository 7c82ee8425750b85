#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 감사(audit) 로그 이벤트 타입 정의.
//
// [순환 의존성 방지 설계]
// - ToolDefinition, ServerPolicy, GateResult 를 include 하지 않는다.
//   호출자가 필요한 필드만 문자열/숫자로 복사해 넘긴다.
//
// [민감정보 취급 주의]
// - 도구 호출 인자(arguments)는 기록하지 않는다. 이름과 판정 결과만 남긴다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// LogLevel
//   감사 로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// ConnectionLog
//   백엔드 프로세스 기동/종료 이벤트.
//   event: "backend_start" | "backend_stop"
//   exit_status: backend_stop 에서만 채운다 (시그널 종료는 128 + signo)
// ---------------------------------------------------------------------------
struct ConnectionLog {
    std::string                           server{};
    std::string                           event{};
    std::string                           command{};
    std::int64_t                          pid{0};
    std::optional<int>                    exit_status{};
    std::chrono::system_clock::time_point timestamp{};
};

// ---------------------------------------------------------------------------
// CatalogLog
//   tools/list 한 번의 게이트 결과.
//   excluded          : 제외된 도구 이름 (카탈로그 순서)
//   effective_allowed : 판정에 사용된 유효 허용 라벨 (정렬)
// ---------------------------------------------------------------------------
struct CatalogLog {
    std::string                           server{};
    std::size_t                           total{0};
    std::size_t                           retained{0};
    std::vector<std::string>              excluded{};
    std::vector<std::string>              effective_allowed{};
    std::chrono::system_clock::time_point timestamp{};
};

// ---------------------------------------------------------------------------
// ToolCallLog
//   백엔드로 전달된 tools/call 한 건.
//   backend_error: JSON-RPC error 응답 또는 전송 종료
//   tool_error   : 결과의 isError == true (도구 수준 실패)
// ---------------------------------------------------------------------------
struct ToolCallLog {
    std::string                           server{};
    std::string                           tool{};
    bool                                  backend_error{false};
    bool                                  tool_error{false};
    std::chrono::system_clock::time_point timestamp{};
    std::chrono::microseconds             duration{0};
};

// ---------------------------------------------------------------------------
// BlockLog
//   정책에 의해 차단된 tools/call.
//   reason: 운영자용 사유 (호출자에게는 고정 문구만 노출)
// ---------------------------------------------------------------------------
struct BlockLog {
    std::string                           server{};
    std::string                           tool{};
    std::string                           reason{};
    std::chrono::system_clock::time_point timestamp{};
};
