#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 감사 로거.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
//   spdlog 레지스트리에 등록하지 않으므로 한 프로세스(테스트 포함)에서
//   여러 인스턴스를 만들어도 이름 충돌이 없다.
// - 싱크: stderr (항상) + rotating file (log_path 가 비어 있지 않을 때).
//   stdout 은 MCP 프로토콜 채널이므로 절대 쓰지 않는다.
// - 한 이벤트 = 한 줄 JSON. jsoncpp 로 직렬화하므로 이스케이프가 안전하다.
//
// [JSON 스키마 일관성]
// 모든 구조체 필드를 snake_case JSON 키로 직렬화한다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <filesystem>
#include <memory>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

// ---------------------------------------------------------------------------
// StructuredLogger
//   ConnectionLog / CatalogLog / ToolCallLog / BlockLog 를 JSON 으로 기록한다.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 이벤트는 기록하지 않는다.
    //   log_path  : 감사 로그 파일 경로 (빈 경로면 stderr 만 사용)
    //   실패 시 std::runtime_error (파일 생성 불가 등)
    explicit StructuredLogger(LogLevel min_level,
                              const std::filesystem::path& log_path = {});

    ~StructuredLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    StructuredLogger(StructuredLogger&&)            = default;
    StructuredLogger& operator=(StructuredLogger&&) = default;

    // log_backend
    //   백엔드 기동/종료 (info).
    void log_backend(const ConnectionLog& entry);

    // log_catalog
    //   tools/list 필터링 결과 (info).
    void log_catalog(const CatalogLog& entry);

    // log_tool_call
    //   전달된 tools/call (info). [고빈도 호출 경로]
    void log_tool_call(const ToolCallLog& entry);

    // log_block
    //   차단된 tools/call (warn). 차단은 항상 warning 레벨이다.
    void log_block(const BlockLog& entry);

    void flush();

    [[nodiscard]] const std::filesystem::path& log_path() const noexcept { return log_path_; }

private:
    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
