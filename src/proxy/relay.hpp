#pragma once

#include "backend/backend.hpp"
#include "gate/allowed_name_cache.hpp"
#include "gate/effect_classifier.hpp"
#include "gate/tool_gate.hpp"
#include "logger/structured_logger.hpp"
#include "policy/rule.hpp"
#include "protocol/jsonrpc.hpp"
#include "protocol/mcp_types.hpp"
#include "stats/stats_collector.hpp"
#include "transport/json_channel.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// RelayState
//   Relay 의 생명주기 상태.
//
//   kDisconnected      : 생성 직후
//   kConnectingBackend : 백엔드 기동 + 핸드셰이크 진행 중
//   kBackendReady      : 백엔드 핸드셰이크 완료
//   kServing           : 호출자 요청 처리 중
//   kClosed            : 어느 한쪽 전송 종료 → 양쪽 정리 완료 (종료 상태)
// ---------------------------------------------------------------------------
enum class RelayState : std::uint8_t {
    kDisconnected      = 0,
    kConnectingBackend = 1,
    kBackendReady      = 2,
    kServing           = 3,
    kClosed            = 4,
};

[[nodiscard]] auto relay_state_to_string(RelayState state) noexcept -> const char*;

// ---------------------------------------------------------------------------
// RelayExit
//   run() 의 종료 사유. ProxyServer 가 프로세스 종료 코드로 변환한다.
// ---------------------------------------------------------------------------
enum class RelayExit : std::uint8_t {
    kNormal             = 0,  // 어느 한쪽이 정상 종료 또는 시그널
    kBackendUnavailable = 1,  // 백엔드 기동/핸드셰이크 실패
};

// ---------------------------------------------------------------------------
// Relay
//   호출자 세션 1개와 백엔드 세션 1개를 1:1 로 중계한다.
//
//   - tools/list : 백엔드 카탈로그 전체 조회 → 분류 → 필터 → 캐시 교체
//   - tools/call : 캐시 미조회면 한 번 지연 조회 → 허용 집합에 없으면
//                  백엔드에 보내지 않고 차단 결과로 응답
//   - resources/*, prompts/*, completion/complete, logging/setLevel :
//                  게이트 없이 그대로 전달
//   - initialize / ping : 릴레이가 직접 응답
//   - notifications/cancelled : 진행 중인 요청이면 requestId 를 백엔드 id 로
//                  바꿔 전달, 아니면 버림
//
//   스레드 안전성:
//     단일 io_context 스레드에서만 동작한다. 호출자 요청은 각각 별도
//     코루틴으로 처리되므로 멈춘 백엔드 요청은 해당 요청만 멈춘다.
//
//   수명:
//     코루틴이 shared_from_this() 를 보유하므로 make_shared 로 생성한다.
// ---------------------------------------------------------------------------
class Relay : public std::enable_shared_from_this<Relay> {
public:
    // -----------------------------------------------------------------------
    // 생성자
    //   executor   : 코루틴/타이머 실행 executor
    //   caller     : 호출자 방향 채널 (stdin/stdout)
    //   backend    : 백엔드 세션 (start() 는 run() 이 호출)
    //   policy     : 불변 정책 스냅샷
    //   classifier : 효과 분류기
    //   logger     : 감사 로거 (nullptr 허용)
    //   stats      : 통계 수집기 (nullptr 허용)
    // -----------------------------------------------------------------------
    Relay(boost::asio::any_io_executor            executor,
          std::shared_ptr<JsonChannel>            caller,
          std::shared_ptr<Backend>                backend,
          std::shared_ptr<const ServerPolicy>     policy,
          std::shared_ptr<const EffectClassifier> classifier,
          std::shared_ptr<StructuredLogger>       logger,
          std::shared_ptr<StatsCollector>         stats);

    ~Relay() = default;

    Relay(const Relay&)            = delete;
    Relay& operator=(const Relay&) = delete;
    Relay(Relay&&)                 = delete;
    Relay& operator=(Relay&&)      = delete;

    // -----------------------------------------------------------------------
    // run
    //   백엔드 기동 → 호출자 읽기 루프 + 백엔드 감시 → kClosed 까지 대기.
    //   어느 경로로 끝나든 반환 시점에는 양쪽 모두 정리되어 있다.
    // -----------------------------------------------------------------------
    auto run() -> boost::asio::awaitable<RelayExit>;

    // close
    //   kClosed 로 전이하고 양쪽을 닫는다. 중복 호출은 no-op.
    void close();

    [[nodiscard]] auto state() const noexcept -> RelayState { return state_; }
    [[nodiscard]] auto cache() const noexcept -> const AllowedNameCache& { return cache_; }
    [[nodiscard]] auto caller_initialized() const noexcept -> bool { return caller_initialized_; }

private:
    auto caller_loop(std::shared_ptr<Relay> self) -> boost::asio::awaitable<void>;
    auto watch_backend(std::shared_ptr<Relay> self) -> boost::asio::awaitable<void>;

    // 요청 하나를 처리하고 응답을 보낸다 (요청마다 별도 코루틴)
    auto handle_request(std::shared_ptr<Relay> self, Json::Value request)
        -> boost::asio::awaitable<void>;
    void handle_notification(const Json::Value& notification);

    auto handle_tools_list(const Json::Value& id) -> boost::asio::awaitable<Json::Value>;
    auto handle_tools_call(const Json::Value& id, const Json::Value& params)
        -> boost::asio::awaitable<Json::Value>;
    auto forward(const Json::Value& id, McpMethod method, const Json::Value& params)
        -> boost::asio::awaitable<Json::Value>;

    // request_backend
    //   backend_->request() 를 호출하면서 응답 대기 동안 호출자 id → 백엔드 id
    //   대응을 inflight_ 에 유지한다.
    auto request_backend(const Json::Value& caller_id, McpMethod method, const Json::Value& params)
        -> boost::asio::awaitable<std::expected<Json::Value, RpcError>>;

    // forward_cancellation
    //   notifications/cancelled 의 requestId 를 백엔드 id 로 바꿔 전달한다.
    //   대응하는 진행 중 요청이 없으면 (차단, 로컬 응답, 완료됨) 버린다.
    void forward_cancellation(const Json::Value& params);

    // refresh_catalog
    //   백엔드 전체 카탈로그 → build_allowed_tools → 캐시 교체 (병합 아님)
    auto refresh_catalog() -> boost::asio::awaitable<std::expected<GateResult, RpcError>>;

    void reply(const Json::Value& response);

    boost::asio::any_io_executor            executor_;
    std::shared_ptr<JsonChannel>            caller_;
    std::shared_ptr<Backend>                backend_;
    std::shared_ptr<const ServerPolicy>     policy_;
    std::shared_ptr<const EffectClassifier> classifier_;
    std::shared_ptr<StructuredLogger>       logger_;
    std::shared_ptr<StatsCollector>         stats_;

    RelayState                         state_{RelayState::kDisconnected};
    PeerInfo                           peer_{};
    AllowedNameCache                   cache_{};
    std::map<std::string, std::string> exclusion_reasons_{};  // 마지막 목록 기준
    std::map<std::string, std::uint64_t> inflight_{};  // 직렬화된 호출자 id → 백엔드 id
    bool                               caller_initialized_{false};
    boost::asio::steady_timer          closed_timer_;
};
