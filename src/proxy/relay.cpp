#include "proxy/relay.hpp"

#include "policy/effect.hpp"
#include "policy/policy_loader.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>
#include <optional>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// Relay 구현
//
// run() 흐름:
//   1. kConnectingBackend: backend_->start() (기동 + 핸드셰이크)
//      실패 → close() → kBackendUnavailable
//   2. kBackendReady: 백엔드 PeerInfo 보관 (initialize 응답 미러링용)
//   3. kServing: caller_loop / watch_backend co_spawn
//   4. closed_timer_ 대기 → close() 가 cancel 하면 반환
//
// 종료 경로 (모두 close() 로 수렴):
//   - 호출자 EOF / 읽기 오류  → caller_loop 종료 → close()
//   - 백엔드 EOF / 크래시     → watch_backend 반환 → close()
//   - SIGINT / SIGTERM        → ProxyServer::stop() → close()
// ---------------------------------------------------------------------------

namespace {

void log_coroutine_error(const char* what, std::exception_ptr eptr) {
    if (eptr) {
        try { std::rethrow_exception(eptr); }
        catch (const std::exception& e) {
            spdlog::error("[relay] {} error: {}", what, e.what());
        }
    }
}

// 전송 종료는 호출자에게 -32603 으로 보고한다 (-32000 은 전송 계층 내부 코드).
RpcError to_caller_error(const RpcError& error) {
    if (error.is_transport_closed()) {
        return RpcError{RpcErrorCode::kInternalError, "Backend connection closed"};
    }
    return error;
}

bool is_tool_error(const Json::Value& result) {
    if (!result.isObject()) {
        return false;
    }
    const Json::Value& flag = result["isError"];
    return flag.isBool() && flag.asBool();
}

std::vector<std::string> to_vector(const EffectSet& effects) {
    return {effects.begin(), effects.end()};
}

}  // namespace

auto relay_state_to_string(RelayState state) noexcept -> const char* {
    switch (state) {
        case RelayState::kDisconnected:      return "disconnected";
        case RelayState::kConnectingBackend: return "connecting_backend";
        case RelayState::kBackendReady:      return "backend_ready";
        case RelayState::kServing:           return "serving";
        case RelayState::kClosed:            return "closed";
    }
    return "unknown";
}

Relay::Relay(boost::asio::any_io_executor            executor,
             std::shared_ptr<JsonChannel>            caller,
             std::shared_ptr<Backend>                backend,
             std::shared_ptr<const ServerPolicy>     policy,
             std::shared_ptr<const EffectClassifier> classifier,
             std::shared_ptr<StructuredLogger>       logger,
             std::shared_ptr<StatsCollector>         stats)
    : executor_{std::move(executor)}
    , caller_{std::move(caller)}
    , backend_{std::move(backend)}
    , policy_{std::move(policy)}
    , classifier_{std::move(classifier)}
    , logger_{std::move(logger)}
    , stats_{std::move(stats)}
    , closed_timer_{executor_, boost::asio::steady_timer::time_point::max()}
{}

// ---------------------------------------------------------------------------
// Relay::run
// ---------------------------------------------------------------------------
auto Relay::run() -> boost::asio::awaitable<RelayExit>
{
    auto self = shared_from_this();

    // -----------------------------------------------------------------------
    // 1. 백엔드 기동 + 핸드셰이크
    // -----------------------------------------------------------------------
    state_ = RelayState::kConnectingBackend;
    spdlog::info("[relay] starting backend '{}': {}", policy_->name, policy_->launch.command);

    auto peer = co_await backend_->start();
    if (state_ == RelayState::kClosed) {
        // 핸드셰이크 도중 stop() 이 호출됨
        co_return RelayExit::kNormal;
    }
    if (!peer) {
        spdlog::error("[relay] backend '{}' unavailable: {}", policy_->name, peer.error());
        close();
        co_return RelayExit::kBackendUnavailable;
    }

    // -----------------------------------------------------------------------
    // 2. kBackendReady
    // -----------------------------------------------------------------------
    peer_  = std::move(*peer);
    state_ = RelayState::kBackendReady;

    // -----------------------------------------------------------------------
    // 3. kServing: 호출자 루프 + 백엔드 감시
    // -----------------------------------------------------------------------
    boost::asio::co_spawn(executor_, caller_loop(self),
                          [](std::exception_ptr eptr) { log_coroutine_error("caller loop", eptr); });
    boost::asio::co_spawn(executor_, watch_backend(self),
                          [](std::exception_ptr eptr) { log_coroutine_error("backend watch", eptr); });
    state_ = RelayState::kServing;
    spdlog::info("[relay] serving '{}' (effective allowed: {})",
                 policy_->name, format_effects(compute_effective_allowed(*policy_)));

    // -----------------------------------------------------------------------
    // 4. 종료 대기
    // -----------------------------------------------------------------------
    if (state_ != RelayState::kClosed) {
        boost::system::error_code ec;
        co_await closed_timer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
    co_return RelayExit::kNormal;
}

// ---------------------------------------------------------------------------
// Relay::close
//   kClosed 전이는 한 번만 일어난다. 호출자 채널 → 백엔드 순으로 닫는다.
// ---------------------------------------------------------------------------
void Relay::close() {
    if (state_ == RelayState::kClosed) {
        return;
    }
    spdlog::debug("[relay] closing from state {}", relay_state_to_string(state_));
    state_ = RelayState::kClosed;

    caller_->close();
    backend_->close();
    closed_timer_.cancel();
}

auto Relay::watch_backend(std::shared_ptr<Relay> self) -> boost::asio::awaitable<void>
{
    co_await self->backend_->wait_closed();
    if (self->state_ != RelayState::kClosed) {
        spdlog::info("[relay] backend session ended");
    }
    self->close();
}

// ---------------------------------------------------------------------------
// caller_loop
//   호출자 메시지를 읽어 분류한다. 요청은 각각 co_spawn 으로 처리하여
//   느린 백엔드 요청이 다른 요청의 읽기를 막지 않게 한다.
// ---------------------------------------------------------------------------
auto Relay::caller_loop(std::shared_ptr<Relay> self) -> boost::asio::awaitable<void>
{
    while (self->state_ != RelayState::kClosed) {
        auto message = co_await self->caller_->read_message();
        if (!message) {
            if (message.error().is_transport_closed()) {
                break;
            }
            // 파싱 불가 / 객체 아님: id 를 알 수 없으므로 null id 로 응답
            self->reply(make_error(Json::Value{}, message.error()));
            continue;
        }

        switch (classify_message(*message)) {
            case MessageKind::kRequest:
                boost::asio::co_spawn(
                    self->executor_,
                    self->handle_request(self, std::move(*message)),
                    [](std::exception_ptr eptr) { log_coroutine_error("request", eptr); });
                break;

            case MessageKind::kNotification:
                self->handle_notification(*message);
                break;

            case MessageKind::kResponse:
                // 릴레이는 호출자에게 요청을 보내지 않는다
                spdlog::debug("[relay] ignoring response from caller");
                break;

            case MessageKind::kInvalid: {
                const Json::Value id = has_valid_id(*message) ? (*message)["id"] : Json::Value{};
                spdlog::warn("[relay] invalid JSON-RPC message from caller");
                self->reply(make_error(id, RpcError{RpcErrorCode::kInvalidRequest,
                                                    "Invalid Request"}));
                break;
            }
        }
    }

    if (self->state_ != RelayState::kClosed) {
        spdlog::info("[relay] caller session ended");
    }
    self->close();
}

// ---------------------------------------------------------------------------
// handle_request
//   McpMethod 위의 switch 가 디스패치 테이블이다.
// ---------------------------------------------------------------------------
auto Relay::handle_request(std::shared_ptr<Relay> self, Json::Value request)
    -> boost::asio::awaitable<void>
{
    const Json::Value id     = request["id"];
    const std::string name   = request["method"].asString();
    const Json::Value params = request.get("params", Json::Value{});
    const McpMethod   method = parse_method(name);

    Json::Value response;
    switch (method) {
        case McpMethod::kInitialize: {
            std::string requested;
            if (params.isObject() && params["protocolVersion"].isString()) {
                requested = params["protocolVersion"].asString();
            }
            response = make_result(id, make_server_initialize_result(requested, self->peer_));
            spdlog::info("[relay] caller initialize (requested protocol '{}')", requested);
            break;
        }

        case McpMethod::kPing:
            response = make_result(id, Json::Value(Json::objectValue));
            break;

        case McpMethod::kToolsList:
            response = co_await self->handle_tools_list(id);
            break;

        case McpMethod::kToolsCall:
            response = co_await self->handle_tools_call(id, params);
            break;

        case McpMethod::kResourcesList:
        case McpMethod::kResourceTemplatesList:
        case McpMethod::kResourcesRead:
        case McpMethod::kPromptsList:
        case McpMethod::kPromptsGet:
        case McpMethod::kCompletionComplete:
        case McpMethod::kLoggingSetLevel:
            response = co_await self->forward(id, method, params);
            break;

        case McpMethod::kInitialized:
        case McpMethod::kCancelled:
        case McpMethod::kUnknown:
            spdlog::debug("[relay] method not found: {}", name);
            response = make_error(id, RpcError{RpcErrorCode::kMethodNotFound,
                                               fmt::format("Method not found: {}", name)});
            break;
    }

    self->reply(response);
}

void Relay::handle_notification(const Json::Value& notification) {
    const std::string name   = notification["method"].asString();
    const Json::Value params = notification.get("params", Json::Value{});

    switch (parse_method(name)) {
        case McpMethod::kInitialized:
            // 백엔드에는 릴레이가 이미 자체 initialized 를 보냈다
            caller_initialized_ = true;
            spdlog::info("[relay] caller session initialized");
            return;
        case McpMethod::kCancelled:
            forward_cancellation(params);
            return;
        default:
            break;
    }
    spdlog::debug("[relay] forwarding notification '{}'", name);
    backend_->notify(name, params);
}

void Relay::forward_cancellation(const Json::Value& params) {
    const Json::Value request_id = params.isObject() ? params.get("requestId", Json::Value{})
                                                     : Json::Value{};
    if (!request_id.isString() && !request_id.isIntegral()) {
        spdlog::debug("[relay] dropping cancellation without a usable requestId");
        return;
    }

    const std::string key = serialize_message(request_id);
    const auto it = inflight_.find(key);
    if (it == inflight_.end()) {
        spdlog::debug("[relay] dropping cancellation for {}: not in flight at the backend", key);
        return;
    }

    Json::Value rewritten = params;
    rewritten["requestId"] = static_cast<Json::UInt64>(it->second);
    spdlog::debug("[relay] forwarding cancellation {} as backend id {}", key, it->second);
    backend_->notify(method_name(McpMethod::kCancelled), rewritten);
}

// ---------------------------------------------------------------------------
// refresh_catalog
// ---------------------------------------------------------------------------
auto Relay::refresh_catalog() -> boost::asio::awaitable<std::expected<GateResult, RpcError>>
{
    auto catalog = co_await fetch_tool_catalog(*backend_);
    if (!catalog) {
        spdlog::warn("[relay] backend tools/list failed: {} ({})",
                     catalog.error().message, catalog.error().code);
        co_return std::unexpected(catalog.error());
    }

    GateResult gate = build_allowed_tools(catalog->tools, *policy_, *classifier_);

    // 캐시 교체 (병합 아님) + 제외 사유 갱신
    cache_.replace(gate.allowed_names);
    exclusion_reasons_.clear();

    std::vector<std::string> excluded;
    for (const auto& verdict : gate.verdicts) {
        if (verdict.allowed) {
            spdlog::debug("[gate] retained '{}' {}", verdict.name, format_effects(verdict.effects));
            continue;
        }
        spdlog::info("[gate] excluded '{}': {}", verdict.name, verdict.reason);
        exclusion_reasons_[verdict.name] = verdict.reason;
        excluded.push_back(verdict.name);
    }

    if (stats_) {
        stats_->on_catalog_listing(catalog->tools.size(), gate.tools.size());
    }
    if (logger_) {
        logger_->log_catalog(CatalogLog{
            .server            = policy_->name,
            .total             = catalog->tools.size(),
            .retained          = gate.tools.size(),
            .excluded          = std::move(excluded),
            .effective_allowed = to_vector(gate.effective_allowed),
            .timestamp         = std::chrono::system_clock::now(),
        });
    }
    spdlog::info("[relay] tools/list: {} of {} tool(s) retained",
                 gate.tools.size(), catalog->tools.size());

    co_return gate;
}

auto Relay::handle_tools_list(const Json::Value& id) -> boost::asio::awaitable<Json::Value>
{
    auto gate = co_await refresh_catalog();
    if (!gate) {
        co_return make_error(id, to_caller_error(gate.error()));
    }
    co_return make_result(id, make_tool_list_result(gate->tools));
}

// ---------------------------------------------------------------------------
// handle_tools_call
//   1. params.name 검증 (-32602)
//   2. 캐시 미조회면 지연 목록 조회 한 번
//   3. 허용 집합에 없으면 차단 결과 (백엔드 미접촉)
//   4. 허용이면 params 를 그대로 전달하고 result 를 그대로 반환
// ---------------------------------------------------------------------------
auto Relay::handle_tools_call(const Json::Value& id, const Json::Value& params)
    -> boost::asio::awaitable<Json::Value>
{
    if (!params.isObject() || !params["name"].isString()) {
        co_return make_error(id, RpcError{RpcErrorCode::kInvalidParams,
                                          "tools/call requires a string 'name' parameter"});
    }
    const std::string tool = params["name"].asString();

    if (!cache_.populated()) {
        spdlog::info("[relay] tools/call '{}' before any tools/list, listing backend tools", tool);
        auto listed = co_await refresh_catalog();
        if (!listed) {
            co_return make_error(id, to_caller_error(listed.error()));
        }
    }

    const auto allowed = cache_.snapshot();
    if (!allowed || !is_tool_allowed(tool, *allowed)) {
        const auto it = exclusion_reasons_.find(tool);
        const std::string reason = it != exclusion_reasons_.end()
                                       ? it->second
                                       : std::string{"tool not in backend catalog"};

        spdlog::warn("[relay] blocked tools/call '{}': {}", tool, reason);
        if (stats_) {
            stats_->on_tool_call(true);
        }
        if (logger_) {
            logger_->log_block(BlockLog{
                .server    = policy_->name,
                .tool      = tool,
                .reason    = reason,
                .timestamp = std::chrono::system_clock::now(),
            });
        }
        co_return make_result(id, make_blocked_tool_result(tool));
    }

    if (stats_) {
        stats_->on_tool_call(false);
    }
    const auto started = std::chrono::steady_clock::now();
    auto result = co_await request_backend(id, McpMethod::kToolsCall, params);
    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    if (logger_) {
        logger_->log_tool_call(ToolCallLog{
            .server        = policy_->name,
            .tool          = tool,
            .backend_error = !result.has_value(),
            .tool_error    = result.has_value() && is_tool_error(*result),
            .timestamp     = std::chrono::system_clock::now(),
            .duration      = elapsed,
        });
    }

    if (!result) {
        co_return make_error(id, to_caller_error(result.error()));
    }
    co_return make_result(id, *result);
}

auto Relay::forward(const Json::Value& id, McpMethod method, const Json::Value& params)
    -> boost::asio::awaitable<Json::Value>
{
    if (stats_) {
        stats_->on_passthrough();
    }
    auto result = co_await request_backend(id, method, params);
    if (!result) {
        co_return make_error(id, to_caller_error(result.error()));
    }
    co_return make_result(id, *result);
}

auto Relay::request_backend(const Json::Value& caller_id, McpMethod method, const Json::Value& params)
    -> boost::asio::awaitable<std::expected<Json::Value, RpcError>>
{
    const std::string            key = serialize_message(caller_id);
    std::optional<std::uint64_t> backend_id;

    auto result = co_await backend_->request(
        std::string{method_name(method)}, params,
        [this, &key, &backend_id](std::uint64_t sent) {
            backend_id     = sent;
            inflight_[key] = sent;
        });

    // 같은 호출자 id 가 재사용되었으면 최신 항목은 남겨둔다
    if (backend_id) {
        const auto it = inflight_.find(key);
        if (it != inflight_.end() && it->second == *backend_id) {
            inflight_.erase(it);
        }
    }
    co_return result;
}

void Relay::reply(const Json::Value& response) {
    caller_->send(response);
}
