#pragma once

#include "logger/structured_logger.hpp"
#include "policy/policy_loader.hpp"
#include "proxy/relay.hpp"
#include "stats/stats_collector.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// 프로세스 종료 코드
// ---------------------------------------------------------------------------
inline constexpr int kExitOk                 = 0;
inline constexpr int kExitUsage              = 1;  // CLI 사용법 오류, 호출자 stdio 사용 불가
inline constexpr int kExitConfigError        = 2;  // 정책 로드 실패
inline constexpr int kExitBackendUnavailable = 3;  // 백엔드 기동/핸드셰이크 실패

// ---------------------------------------------------------------------------
// ProxyConfig
//   ProxyServer 의 모든 설정 값을 담는다.
//   하드코딩 금지: 값은 반드시 외부(CLI/환경변수)에서 읽어야 한다.
//
//   policy_path    : 정책 파일 경로 (YAML)
//   server_name    : 활성화할 servers.<name> 항목
//   log_level      : 감사 로그 레벨 ("debug","info","warn","error")
//   audit_log_path : 감사 로그 파일 경로 (비어 있으면 stderr 만)
// ---------------------------------------------------------------------------
struct ProxyConfig {
    std::string policy_path{};
    std::string server_name{};
    std::string log_level{};
    std::string audit_log_path{};
};

// ---------------------------------------------------------------------------
// ProxyServer
//   정책 로드 → 백엔드/호출자 세션 구성 → Relay 실행 → 종료 코드 결정.
//
//   사용 예:
//     ProxyServer server(config);
//     server.run(io_ctx);   // io_ctx.run() 은 호출자가 실행
//     return server.exit_code();
//
//   Graceful Shutdown:
//     SIGINT / SIGTERM → stop() → relay_->close() → 양쪽 세션 정리 후
//     io_context 중단.
// ---------------------------------------------------------------------------
class ProxyServer {
public:
    explicit ProxyServer(ProxyConfig config);

    ~ProxyServer() = default;

    // 복사/이동 금지
    ProxyServer(const ProxyServer&)            = delete;
    ProxyServer& operator=(const ProxyServer&) = delete;
    ProxyServer(ProxyServer&&)                 = delete;
    ProxyServer& operator=(ProxyServer&&)      = delete;

    // -----------------------------------------------------------------------
    // run
    //   io_ctx 위에 Relay 를 spawn 한다. 정책 로드 실패 시 아무것도 spawn
    //   하지 않고 exit_code() 를 kExitConfigError 로 설정한다 (세션 수립 전 종료).
    // -----------------------------------------------------------------------
    void run(boost::asio::io_context& io_ctx);

    // stop
    //   Graceful Shutdown 을 시작한다. 시그널 핸들러에서 호출된다.
    void stop();

    [[nodiscard]] int exit_code() const noexcept { return exit_code_; }

private:
    // finish: Relay 종료 처리 (통계 보고, 종료 코드, io_context 중단)
    void finish(RelayExit exit);

    ProxyConfig config_;
    int         exit_code_{kExitOk};
    bool        stopping_{false};

    std::shared_ptr<const ServerPolicy>      policy_{};
    std::shared_ptr<StructuredLogger>        logger_{};
    std::shared_ptr<StatsCollector>          stats_{};
    std::shared_ptr<Relay>                   relay_{};
    std::unique_ptr<boost::asio::signal_set> signals_{};

    boost::asio::io_context*                 io_ctx_{nullptr};
};
