#include "backend/stdio_backend.hpp"

#include "protocol/jsonrpc.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>
#include <utility>

// ---------------------------------------------------------------------------
// StdioBackend 구현
//
// start() 흐름:
//   1. ChildProcess::spawn (실패 → BackendUnavailable)
//   2. 파이프 fd 를 stream_descriptor 로 감싸 JsonChannel 구성
//   3. read_loop co_spawn
//   4. initialize 요청 → 응답 해석 → notifications/initialized
//   실패 경로는 모두 close() 를 거쳐 자식을 회수한다.
//
// read_loop 메시지 분류:
//   kResponse     : pending_ 완료
//   kRequest      : ping → {}, 그 외 → -32601
//   kNotification : debug 로그 후 버림 (listChanged 를 광고하지 않음)
//   kInvalid      : warn 로그 후 버림
// ---------------------------------------------------------------------------

namespace {

RpcError connection_closed() {
    return RpcError{RpcErrorCode::kConnectionClosed, "Backend connection closed"};
}

}  // namespace

StdioBackend::StdioBackend(boost::asio::any_io_executor      executor,
                           std::string                       server_name,
                           LaunchSpec                        launch,
                           std::shared_ptr<StructuredLogger> logger,
                           ShutdownTimeouts                  timeouts)
    : executor_{std::move(executor)}
    , server_name_{std::move(server_name)}
    , launch_{std::move(launch)}
    , logger_{std::move(logger)}
    , timeouts_{timeouts}
    , closed_timer_{executor_, boost::asio::steady_timer::time_point::max()}
{}

StdioBackend::~StdioBackend() {
    close();
}

auto StdioBackend::start() -> boost::asio::awaitable<std::expected<PeerInfo, std::string>>
{
    if (started_ || closed_) {
        co_return std::unexpected(std::string{"backend already started"});
    }
    started_ = true;

    // -----------------------------------------------------------------------
    // 1. 프로세스 기동
    // -----------------------------------------------------------------------
    auto spawned = ChildProcess::spawn(launch_);
    if (!spawned) {
        close();
        co_return std::unexpected(spawned.error());
    }
    child_ = std::move(*spawned);

    // -----------------------------------------------------------------------
    // 2. 채널 구성 (자식 stdout → 입력, 자식 stdin → 출력)
    // -----------------------------------------------------------------------
    JsonChannel::Descriptor from_child{executor_, child_->take_stdout_fd()};
    JsonChannel::Descriptor to_child{executor_, child_->take_stdin_fd()};
    channel_ = std::make_shared<JsonChannel>(std::move(from_child), std::move(to_child), "backend");

    if (logger_) {
        logger_->log_backend(ConnectionLog{
            .server      = server_name_,
            .event       = "backend_start",
            .command     = launch_.command,
            .pid         = child_->pid(),
            .exit_status = std::nullopt,
            .timestamp   = std::chrono::system_clock::now(),
        });
    }

    // -----------------------------------------------------------------------
    // 3. 읽기 루프
    // -----------------------------------------------------------------------
    boost::asio::co_spawn(
        executor_,
        read_loop(shared_from_this()),
        [](std::exception_ptr eptr) {
            if (eptr) {
                try { std::rethrow_exception(eptr); }
                catch (const std::exception& e) {
                    spdlog::error("[backend] read loop error: {}", e.what());
                }
            }
        }
    );

    // -----------------------------------------------------------------------
    // 4. 핸드셰이크
    // -----------------------------------------------------------------------
    auto init = co_await request(std::string{method_name(McpMethod::kInitialize)},
                                 make_client_initialize_params());
    if (!init) {
        close();
        co_return std::unexpected(fmt::format("backend handshake failed: {} ({})",
                                              init.error().message, init.error().code));
    }

    auto peer = parse_initialize_result(*init);
    if (!peer) {
        close();
        co_return std::unexpected(fmt::format("backend handshake failed: {}",
                                              peer.error().message));
    }

    notify(method_name(McpMethod::kInitialized), Json::Value{});

    const Json::Value& server_info = peer->server_info;
    const auto info_field = [&server_info](const char* key) -> std::string {
        if (server_info.isObject() && server_info[key].isString()) {
            return server_info[key].asString();
        }
        return "?";
    };
    spdlog::info("[backend] '{}' ready: {} {} (protocol {})",
                 server_name_, info_field("name"), info_field("version"),
                 peer->protocol_version);
    co_return std::move(*peer);
}

auto StdioBackend::request(std::string method, Json::Value params, RequestSent on_sent)
    -> boost::asio::awaitable<std::expected<Json::Value, RpcError>>
{
    if (closed_ || !channel_) {
        co_return std::unexpected(connection_closed());
    }

    const std::uint64_t id = next_id_++;
    auto call = std::make_shared<PendingCall>(executor_);
    pending_.emplace(id, call);

    if (on_sent) {
        on_sent(id);
    }
    spdlog::debug("[backend] -> {} (id {})", method, id);
    channel_->send(make_request(Json::Value(static_cast<Json::UInt64>(id)), method, params));

    if (!call->result) {
        boost::system::error_code ec;
        co_await call->timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
    pending_.erase(id);

    if (!call->result) {
        co_return std::unexpected(connection_closed());
    }
    co_return std::move(*call->result);
}

void StdioBackend::notify(std::string_view method, const Json::Value& params) {
    if (closed_ || !channel_) {
        spdlog::debug("[backend] closed, dropping notification '{}'", method);
        return;
    }
    channel_->send(make_notification(method, params));
}

auto StdioBackend::wait_closed() -> boost::asio::awaitable<void>
{
    if (closed_) {
        co_return;
    }
    boost::system::error_code ec;
    co_await closed_timer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
}

bool StdioBackend::is_open() const noexcept {
    return started_ && !closed_ && channel_ && channel_->is_open();
}

std::optional<int> StdioBackend::pid() const noexcept {
    if (!child_ || child_->reaped()) {
        return std::nullopt;
    }
    return static_cast<int>(child_->pid());
}

// ---------------------------------------------------------------------------
// close
//   1. 채널 닫기 (자식 stdin EOF)
//   2. 대기 요청 실패 처리
//   3. 자식 종료/회수 (exit_wait → SIGTERM → SIGKILL)
//   4. wait_closed() 대기자 깨우기
// ---------------------------------------------------------------------------
void StdioBackend::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    if (channel_) {
        channel_->close();
    }
    fail_all_pending();

    if (child_) {
        const auto pid    = child_->pid();
        const int  status = child_->terminate(timeouts_);
        spdlog::info("[backend] '{}' stopped (pid {}, status {})", server_name_, pid, status);
        if (logger_) {
            logger_->log_backend(ConnectionLog{
                .server      = server_name_,
                .event       = "backend_stop",
                .command     = launch_.command,
                .pid         = pid,
                .exit_status = status,
                .timestamp   = std::chrono::system_clock::now(),
            });
        }
    }

    closed_timer_.cancel();
}

auto StdioBackend::read_loop(std::shared_ptr<StdioBackend> self) -> boost::asio::awaitable<void>
{
    while (true) {
        auto message = co_await self->channel_->read_message();
        if (!message) {
            if (message.error().is_transport_closed()) {
                break;
            }
            continue;  // 형식 오류 줄은 채널에서 이미 로그됨
        }

        switch (classify_message(*message)) {
            case MessageKind::kResponse:
                self->complete_pending(*message);
                break;
            case MessageKind::kRequest:
                self->answer_backend_request(*message);
                break;
            case MessageKind::kNotification:
                spdlog::debug("[backend] notification '{}' dropped",
                              (*message)["method"].asString());
                break;
            case MessageKind::kInvalid:
                spdlog::warn("[backend] ignoring invalid JSON-RPC message");
                break;
        }
    }

    if (!self->closed_) {
        spdlog::info("[backend] '{}' closed its output", self->server_name_);
    }
    self->close();
}

void StdioBackend::complete_pending(const Json::Value& response) {
    const Json::Value& id = response["id"];
    if (!id.isUInt64()) {
        spdlog::warn("[backend] response with foreign id {}", serialize_message(id));
        return;
    }

    const auto it = pending_.find(id.asUInt64());
    if (it == pending_.end()) {
        spdlog::warn("[backend] response for unknown request id {}", id.asUInt64());
        return;
    }
    auto call = it->second;
    pending_.erase(it);

    if (response.isMember("error")) {
        call->result = std::expected<Json::Value, RpcError>{
            std::unexpect, error_from_json(response["error"])};
    } else {
        call->result = std::expected<Json::Value, RpcError>{response["result"]};
    }
    call->timer.cancel();
}

void StdioBackend::answer_backend_request(const Json::Value& message) {
    const std::string method = message["method"].asString();
    const Json::Value& id    = message["id"];

    if (parse_method(method) == McpMethod::kPing) {
        channel_->send(make_result(id, Json::Value(Json::objectValue)));
        return;
    }
    spdlog::debug("[backend] rejecting backend request '{}'", method);
    channel_->send(make_error(id, RpcError{RpcErrorCode::kMethodNotFound,
                                           fmt::format("Method not found: {}", method)}));
}

void StdioBackend::fail_all_pending() {
    for (auto& [id, call] : pending_) {
        if (!call->result) {
            call->result = std::expected<Json::Value, RpcError>{std::unexpect, connection_closed()};
        }
        call->timer.cancel();
    }
    pending_.clear();
}
