#pragma once

// ---------------------------------------------------------------------------
// stdio_backend.hpp
//
// 자식 프로세스로 띄운 MCP 서버와 stdio 파이프로 통신하는 Backend 구현.
//
// [요청/응답 상관관계]
// - 백엔드로 보내는 id 는 릴레이 고유의 단조 증가 정수다 (호출자 id 와 무관).
// - pending_ : id → PendingCall. 요청 코루틴은 PendingCall::timer 를 무한
//   만료로 대기하고, 읽기 루프가 응답을 채운 뒤 timer.cancel() 로 깨운다.
//   (Boost 1.74 에는 channel 이 없으므로 steady_timer 를 이벤트로 사용)
//
// [수명]
// - 읽기 루프 코루틴이 shared_from_this() 를 보유하므로 make_shared 로 생성.
// - close() 는 파이프를 닫고 자식을 종료/회수한 뒤 대기 중인 요청을 모두
//   kConnectionClosed 로 완료한다. 모든 종료 경로에서 호출된다
//   (핸드셰이크 실패, 백엔드 EOF, 릴레이 종료).
// ---------------------------------------------------------------------------

#include "backend/backend.hpp"
#include "backend/child_process.hpp"
#include "logger/structured_logger.hpp"
#include "policy/rule.hpp"
#include "transport/json_channel.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

class StdioBackend final : public Backend, public std::enable_shared_from_this<StdioBackend> {
public:
    // -----------------------------------------------------------------------
    // 생성자
    //   executor    : 모든 코루틴/타이머가 실행될 io_context executor
    //   server_name : 정책상의 서버 이름 (로그용)
    //   launch      : 실행 명령/인자/환경
    //   logger      : 감사 로거 (nullptr 허용)
    //   timeouts    : 종료 시 자식 회수 유예 시간
    // -----------------------------------------------------------------------
    StdioBackend(boost::asio::any_io_executor      executor,
                 std::string                       server_name,
                 LaunchSpec                        launch,
                 std::shared_ptr<StructuredLogger> logger,
                 ShutdownTimeouts                  timeouts = {});

    ~StdioBackend() override;

    StdioBackend(const StdioBackend&)            = delete;
    StdioBackend& operator=(const StdioBackend&) = delete;
    StdioBackend(StdioBackend&&)                 = delete;
    StdioBackend& operator=(StdioBackend&&)      = delete;

    auto start() -> boost::asio::awaitable<std::expected<PeerInfo, std::string>> override;

    auto request(std::string method, Json::Value params, RequestSent on_sent = {})
        -> boost::asio::awaitable<std::expected<Json::Value, RpcError>> override;

    void notify(std::string_view method, const Json::Value& params) override;

    auto wait_closed() -> boost::asio::awaitable<void> override;

    void close() override;

    [[nodiscard]] bool is_open() const noexcept override;

    // 실행 중인 자식 pid (기동 전/종료 후에는 nullopt)
    [[nodiscard]] std::optional<int> pid() const noexcept;

private:
    struct PendingCall {
        explicit PendingCall(boost::asio::any_io_executor ex)
            : timer{ex, boost::asio::steady_timer::time_point::max()}
        {}

        boost::asio::steady_timer                             timer;
        std::optional<std::expected<Json::Value, RpcError>> result{};
    };

    auto read_loop(std::shared_ptr<StdioBackend> self) -> boost::asio::awaitable<void>;

    void complete_pending(const Json::Value& response);
    void answer_backend_request(const Json::Value& message);
    void fail_all_pending();

    boost::asio::any_io_executor      executor_;
    std::string                       server_name_;
    LaunchSpec                        launch_;
    std::shared_ptr<StructuredLogger> logger_;
    ShutdownTimeouts                  timeouts_;

    std::unique_ptr<ChildProcess> child_{};
    std::shared_ptr<JsonChannel>  channel_{};

    std::uint64_t                                                next_id_{1};
    std::unordered_map<std::uint64_t, std::shared_ptr<PendingCall>> pending_{};

    boost::asio::steady_timer closed_timer_;
    bool                      started_{false};
    bool                      closed_{false};
};
