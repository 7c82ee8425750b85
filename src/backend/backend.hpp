#pragma once

// ---------------------------------------------------------------------------
// backend.hpp
//
// 백엔드 MCP 세션 추상화 (릴레이가 클라이언트 역할을 하는 쪽).
//
// [설계 원칙]
// - Relay 는 이 인터페이스에만 의존한다. 실제 구현(StdioBackend)은 자식
//   프로세스 + 파이프를 사용하고, 테스트는 프로세스 없는 대역(double)을
//   주입한다. 릴레이의 정확성이 특정 전송 방식에 의존하지 않는다.
// - 모든 메서드는 단일 io_context 스레드에서 호출된다.
// - 실패는 std::expected 로 반환한다. 백엔드가 보낸 JSON-RPC error 는
//   code/message/data 를 보존한 RpcError 로 전달된다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "protocol/mcp_types.hpp"

#include <boost/asio/awaitable.hpp>

#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <string_view>

#include <json/json.h>

// RequestSent
//   request() 가 요청을 전송하기 직전에 백엔드 측 요청 id 로 호출된다.
//   Relay 는 이 id 로 호출자의 notifications/cancelled 를 백엔드 id 로 바꾼다.
using RequestSent = std::function<void(std::uint64_t request_id)>;

class Backend {
public:
    virtual ~Backend() = default;

    // -----------------------------------------------------------------------
    // start
    //   백엔드를 기동하고 MCP 핸드셰이크(initialize → initialized)를 수행한다.
    //   실패 시 운영자에게 보여줄 사유 문자열 (BackendUnavailable).
    //   실패하면 구현체는 스스로 정리(close)된 상태여야 한다.
    // -----------------------------------------------------------------------
    virtual auto start() -> boost::asio::awaitable<std::expected<PeerInfo, std::string>> = 0;

    // -----------------------------------------------------------------------
    // request
    //   요청을 보내고 응답 result 를 기다린다.
    //   - 백엔드 error 응답        -> 해당 RpcError
    //   - 전송 종료(대기 중 포함)  -> kConnectionClosed
    //   타임아웃은 없다. 멈춘 백엔드는 해당 요청만 멈춘다.
    //   on_sent 는 전송 시 한 번, 첫 suspend 이전에 호출된다 (닫힌 상태면 호출 안 됨).
    // -----------------------------------------------------------------------
    virtual auto request(std::string method, Json::Value params, RequestSent on_sent = {})
        -> boost::asio::awaitable<std::expected<Json::Value, RpcError>> = 0;

    // notify
    //   알림을 보낸다 (응답 없음). 닫힌 상태면 버린다.
    virtual void notify(std::string_view method, const Json::Value& params) = 0;

    // wait_closed
    //   백엔드 세션이 끝날 때(EOF, 크래시, close()) 반환한다.
    virtual auto wait_closed() -> boost::asio::awaitable<void> = 0;

    // close
    //   전송을 닫고 자원을 회수한다. 대기 중인 요청은 kConnectionClosed 로
    //   완료된다. 중복 호출은 no-op.
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const noexcept = 0;
};

// ---------------------------------------------------------------------------
// fetch_tool_catalog
//   tools/list 를 nextCursor 가 소진될 때까지 반복 호출하여 전체 카탈로그를
//   하나의 ToolPage 로 합친다 (next_cursor 는 항상 nullopt, dropped 는 합계).
//
//   같은 커서가 반복되면 무한 루프를 막기 위해 kInternalError 로 실패한다.
// ---------------------------------------------------------------------------
auto fetch_tool_catalog(Backend& backend)
    -> boost::asio::awaitable<std::expected<ToolPage, RpcError>>;
