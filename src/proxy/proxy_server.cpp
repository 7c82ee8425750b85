#include "proxy/proxy_server.hpp"

#include "backend/stdio_backend.hpp"
#include "gate/keyword_classifier.hpp"
#include "transport/json_channel.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/system/system_error.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <exception>
#include <stdexcept>

#include <fcntl.h>
#include <unistd.h>

// ---------------------------------------------------------------------------
// ProxyServer 구현
//
// run() 흐름:
//   1. io_ctx_ 저장
//   2. PolicyLoader::load(policy_path, server_name)  (실패 → exit 2)
//   3. logger_, stats_, classifier 생성
//   4. 호출자 채널: dup(stdin) / dup(stdout) → JsonChannel
//   5. StdioBackend + Relay 생성
//   6. SIGTERM/SIGINT 핸들러
//   7. co_spawn(relay_->run()) → 완료 콜백에서 finish()
//
// stop() 흐름:
//   1. stopping_ = true
//   2. relay_->close()  (호출자 채널 + 백엔드 프로세스 정리)
//   3. run() 코루틴이 반환되면 finish() 가 io_context 를 중단한다
// ---------------------------------------------------------------------------

ProxyServer::ProxyServer(ProxyConfig config)
    : config_{std::move(config)}
{}

// ---------------------------------------------------------------------------
// LogLevel 문자열 → LogLevel 변환
// ---------------------------------------------------------------------------
namespace {

LogLevel parse_log_level(const std::string& level_str)
{
    if (level_str == "debug" || level_str == "trace") { return LogLevel::kDebug; }
    if (level_str == "warn")  { return LogLevel::kWarn;  }
    if (level_str == "error") { return LogLevel::kError; }
    return LogLevel::kInfo;
}

// 표준 입출력을 복제한다. 실패 시 -1 (errno 유지).
int dup_stdio(int fd)
{
    return ::fcntl(fd, F_DUPFD_CLOEXEC, 0);
}

}  // namespace

// ---------------------------------------------------------------------------
// ProxyServer::run
// ---------------------------------------------------------------------------
void ProxyServer::run(boost::asio::io_context& io_ctx)
{
    io_ctx_ = &io_ctx;

    // -----------------------------------------------------------------------
    // 2. PolicyLoader::load
    //    실패는 ConfigError: 세션을 만들지 않고 종료한다 (fail-close).
    // -----------------------------------------------------------------------
    auto load_result = PolicyLoader::load(config_.policy_path, config_.server_name);
    if (!load_result) {
        spdlog::error("[proxy] cannot start: {}", load_result.error().message);
        exit_code_ = kExitConfigError;
        return;
    }
    policy_ = std::make_shared<const ServerPolicy>(std::move(*load_result));
    spdlog::info("[proxy] policy '{}' loaded from: {}", policy_->name, config_.policy_path);

    // -----------------------------------------------------------------------
    // 3. logger, stats, classifier 생성
    // -----------------------------------------------------------------------
    try {
        logger_ = std::make_shared<StructuredLogger>(parse_log_level(config_.log_level),
                                                     config_.audit_log_path);
    } catch (const std::runtime_error& e) {
        spdlog::error("[proxy] {}", e.what());
        exit_code_ = kExitConfigError;
        return;
    }
    stats_ = std::make_shared<StatsCollector>();
    auto classifier = std::make_shared<const KeywordClassifier>();

    // -----------------------------------------------------------------------
    // 4. 호출자 채널 (stdin / stdout 복제본)
    //    SIGPIPE 는 무시하고 EPIPE 를 쓰기 오류로 처리한다.
    // -----------------------------------------------------------------------
    std::signal(SIGPIPE, SIG_IGN);

    const int in_fd  = dup_stdio(STDIN_FILENO);
    const int out_fd = dup_stdio(STDOUT_FILENO);
    if (in_fd < 0 || out_fd < 0) {
        spdlog::error("[proxy] cannot duplicate stdio: {}", std::strerror(errno));
        if (in_fd >= 0)  { ::close(in_fd); }
        if (out_fd >= 0) { ::close(out_fd); }
        exit_code_ = kExitUsage;
        return;
    }

    std::shared_ptr<JsonChannel> caller;
    try {
        // 일반 파일은 epoll 에 등록할 수 없어 여기서 실패한다 (파이프/TTY 만 지원)
        JsonChannel::Descriptor input{io_ctx, in_fd};
        JsonChannel::Descriptor output{io_ctx, out_fd};
        caller = std::make_shared<JsonChannel>(std::move(input), std::move(output), "caller");
    } catch (const boost::system::system_error& e) {
        spdlog::error("[proxy] stdio is not usable as an MCP transport: {}", e.what());
        exit_code_ = kExitUsage;
        return;
    }

    // -----------------------------------------------------------------------
    // 5. Backend + Relay
    // -----------------------------------------------------------------------
    auto backend = std::make_shared<StdioBackend>(
        io_ctx.get_executor(), policy_->name, policy_->launch, logger_);

    relay_ = std::make_shared<Relay>(
        io_ctx.get_executor(),
        std::move(caller),
        std::move(backend),
        policy_,
        std::move(classifier),
        logger_,
        stats_
    );

    // -----------------------------------------------------------------------
    // 6. 시그널 핸들러
    //    SIGTERM / SIGINT → stop()
    // -----------------------------------------------------------------------
    signals_ = std::make_unique<boost::asio::signal_set>(io_ctx, SIGTERM, SIGINT);
    signals_->async_wait(
        [this](const boost::system::error_code& ec, int signum) {
            if (!ec) {
                spdlog::info("[proxy] signal {} received", signum);
                stop();
            }
        }
    );

    // -----------------------------------------------------------------------
    // 7. Relay 실행
    // -----------------------------------------------------------------------
    boost::asio::co_spawn(
        io_ctx,
        relay_->run(),
        [this](std::exception_ptr eptr, RelayExit exit) {
            if (eptr) {
                try { std::rethrow_exception(eptr); }
                catch (const std::exception& e) {
                    spdlog::error("[proxy] relay exception: {}", e.what());
                }
                relay_->close();
                exit = RelayExit::kBackendUnavailable;
            }
            finish(exit);
        }
    );
}

// ---------------------------------------------------------------------------
// ProxyServer::finish
// ---------------------------------------------------------------------------
void ProxyServer::finish(RelayExit exit)
{
    exit_code_ = (exit == RelayExit::kBackendUnavailable) ? kExitBackendUnavailable : kExitOk;

    const auto snap = stats_->snapshot();
    spdlog::info("[proxy] session summary: listings={} tools={}/{} calls={} (blocked={}, forwarded={}) passthrough={}",
                 snap.catalog_listings, snap.tools_retained, snap.tools_seen,
                 snap.tool_calls_total, snap.tool_calls_blocked, snap.tool_calls_forwarded,
                 snap.passthrough_requests);
    logger_->flush();

    if (signals_) {
        boost::system::error_code ec;
        signals_->cancel(ec);
    }
    if (io_ctx_ != nullptr) {
        io_ctx_->stop();
    }
}

// ---------------------------------------------------------------------------
// ProxyServer::stop
// ---------------------------------------------------------------------------
void ProxyServer::stop()
{
    if (stopping_) {
        return;
    }
    stopping_ = true;

    spdlog::info("[proxy] stopping");
    if (relay_) {
        relay_->close();
    }
}
