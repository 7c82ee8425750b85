// ---------------------------------------------------------------------------
// test_relay.cpp
//
// Relay 통합 테스트 (호출자 측은 실제 파이프, 백엔드는 프로세스 없는 대역).
//
// [테스트 범위]
// - initialize: 버전 협상, 백엔드 capability 미러링, initialized 알림 흡수
// - tools/list: 다중 페이지 카탈로그 → 정책 필터, nextCursor 미노출
// - tools/call: 차단 도구는 백엔드에 전달되지 않음, 지연 목록 조회,
//               재조회 시 캐시 교체(병합 아님), 카탈로그 밖 도구 차단
// - 게이트 없는 전달: resources/read, prompts/get (백엔드 오류 그대로)
// - notifications/cancelled: 진행 중 요청만 백엔드 id 로 바꿔 전달
// - 오류 응답: -32601 / -32602 / -32700(null id) / -32600
// - 수명: 백엔드 기동 실패, 호출자 EOF, 백엔드 종료
// ---------------------------------------------------------------------------

#include "backend/backend.hpp"
#include "proxy/relay.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace {

using RpcResult = std::expected<Json::Value, RpcError>;

Json::Value tool_json(const std::string& name) {
    Json::Value tool(Json::objectValue);
    tool["name"]        = name;
    tool["description"] = "test tool " + name;
    tool["inputSchema"]["type"] = "object";
    return tool;
}

// ---------------------------------------------------------------------------
// FakeBackend
//   handlers 에 method 별 응답을 등록한다. 받은 요청/알림은 모두 기록한다.
//   tools/list 기본 핸들러는 catalog 를 두 페이지로 나누어 돌려준다.
//   요청 id 는 100 부터 증가한다. stalled_methods 의 요청은 release_stalled()
//   또는 close() 까지 응답하지 않는다.
// ---------------------------------------------------------------------------
class FakeBackend final : public Backend {
public:
    explicit FakeBackend(boost::asio::any_io_executor ex)
        : closed_timer_{ex, boost::asio::steady_timer::time_point::max()}
        , release_timer_{ex, boost::asio::steady_timer::time_point::max()}
    {
        handlers["tools/list"] = [this](const Json::Value& params) -> RpcResult {
            const bool second_page = params.isObject() && params["cursor"].isString()
                                     && params["cursor"].asString() == "page-2";
            const std::size_t half  = (catalog.size() + 1) / 2;
            const std::size_t begin = second_page ? half : 0;
            const std::size_t end   = second_page ? catalog.size() : half;

            Json::Value result(Json::objectValue);
            result["tools"] = Json::Value(Json::arrayValue);
            for (std::size_t i = begin; i < end; ++i) {
                result["tools"].append(tool_json(catalog[i]));
            }
            if (!second_page && half < catalog.size()) {
                result["nextCursor"] = "page-2";
            }
            return result;
        };
    }

    auto start() -> boost::asio::awaitable<std::expected<PeerInfo, std::string>> override {
        if (!start_result) {
            close();
        }
        co_return start_result;
    }

    auto request(std::string method, Json::Value params, RequestSent on_sent)
        -> boost::asio::awaitable<RpcResult> override
    {
        requests.emplace_back(method, params);
        if (closed_) {
            co_return std::unexpected(RpcError{RpcErrorCode::kConnectionClosed,
                                               "Connection closed"});
        }
        last_request_id = next_id_++;
        if (on_sent) {
            on_sent(last_request_id);
        }
        if (stalled_methods.contains(method)) {
            boost::system::error_code ec;
            co_await release_timer_.async_wait(
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (closed_) {
                co_return std::unexpected(RpcError{RpcErrorCode::kConnectionClosed,
                                                   "Connection closed"});
            }
        }
        const auto it = handlers.find(method);
        if (it == handlers.end()) {
            co_return std::unexpected(RpcError{RpcErrorCode::kMethodNotFound, "no handler"});
        }
        co_return it->second(params);
    }

    void notify(std::string_view method, const Json::Value& params) override {
        notifications.emplace_back(method);
        notification_params.push_back(params);
    }

    void release_stalled() {
        release_timer_.cancel();
    }

    auto wait_closed() -> boost::asio::awaitable<void> override {
        if (!closed_) {
            boost::system::error_code ec;
            co_await closed_timer_.async_wait(
                boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }
    }

    void close() override {
        ++close_calls;
        closed_ = true;
        closed_timer_.cancel();
        release_timer_.cancel();
    }

    [[nodiscard]] bool is_open() const noexcept override { return !closed_; }

    std::size_t count_requests(const std::string& method) const {
        std::size_t n = 0;
        for (const auto& [m, p] : requests) {
            if (m == method) {
                ++n;
            }
        }
        return n;
    }

    std::expected<PeerInfo, std::string>                        start_result{};
    std::vector<std::string>                                    catalog{"read_file", "http_get", "log_message"};
    std::map<std::string, std::function<RpcResult(const Json::Value&)>> handlers{};
    std::vector<std::pair<std::string, Json::Value>>            requests{};
    std::vector<std::string>                                    notifications{};
    std::vector<Json::Value>                                    notification_params{};
    std::set<std::string>                                       stalled_methods{};
    std::uint64_t                                               last_request_id{0};
    int                                                         close_calls{0};

private:
    boost::asio::steady_timer closed_timer_;
    boost::asio::steady_timer release_timer_;
    std::uint64_t             next_id_{100};
    bool                      closed_{false};
};

// 고정 응답 분류기 더블
class FixedClassifier final : public EffectClassifier {
public:
    [[nodiscard]] EffectsByName classify(const std::vector<ToolDefinition>& tools,
                                         const EffectOverrides&             overrides) const override {
        static const std::map<std::string, EffectSet> kAnswers{
            {"read_file",   EffectSet{"FS"}},
            {"http_get",    EffectSet{"NET"}},
            {"log_message", EffectSet{"IO"}},
            {"get_time",    EffectSet{"TIME"}},
        };
        EffectsByName out;
        for (const auto& tool : tools) {
            if (const auto it = overrides.find(tool.name); it != overrides.end()) {
                out[tool.name] = EffectSet(it->second.begin(), it->second.end());
            } else if (const auto a = kAnswers.find(tool.name); a != kAnswers.end()) {
                out[tool.name] = a->second;
            }
        }
        return out;
    }
};

// ---------------------------------------------------------------------------
// RelayTest
//   to_relay_   : 테스트(호출자) → Relay
//   from_relay_ : Relay → 테스트 (non-blocking 읽기)
// ---------------------------------------------------------------------------
class RelayTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::signal(SIGPIPE, SIG_IGN);
        ASSERT_EQ(::pipe2(to_relay_, O_CLOEXEC), 0);
        ASSERT_EQ(::pipe2(from_relay_, O_CLOEXEC | O_NONBLOCK), 0);

        JsonChannel::Descriptor input{ioc_, to_relay_[0]};
        JsonChannel::Descriptor output{ioc_, from_relay_[1]};
        caller_ = std::make_shared<JsonChannel>(std::move(input), std::move(output), "caller");

        backend_ = std::make_shared<FakeBackend>(ioc_.get_executor());
        PeerInfo peer{};
        peer.protocol_version = "2025-06-18";
        peer.capabilities["tools"]["listChanged"] = true;
        peer.capabilities["resources"]["subscribe"] = true;
        peer.instructions = "backend instructions";
        backend_->start_result = peer;

        stats_ = std::make_shared<StatsCollector>();

        policy_.name           = "test";
        policy_.launch.command = "fake-backend";
        policy_.allow          = EffectSet{"FS", "IO"};
    }

    void TearDown() override {
        if (relay_) {
            relay_->close();
        }
        drain();
        close_fd(to_relay_[1]);
        close_fd(from_relay_[0]);
    }

    static void close_fd(int& fd) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    void start_relay() {
        relay_ = std::make_shared<Relay>(
            ioc_.get_executor(), caller_, backend_,
            std::make_shared<const ServerPolicy>(policy_),
            std::make_shared<const FixedClassifier>(),
            nullptr, stats_);

        boost::asio::co_spawn(
            ioc_, relay_->run(),
            [this](std::exception_ptr eptr, RelayExit exit) {
                if (eptr) {
                    ADD_FAILURE() << "relay run threw";
                }
                exit_ = exit;
            });
        run_for(std::chrono::milliseconds(20));
    }

    void run_for(std::chrono::milliseconds d) {
        if (ioc_.stopped()) {
            ioc_.restart();
        }
        ioc_.run_for(d);
    }

    void drain() {
        if (ioc_.stopped()) {
            ioc_.restart();
        }
        ioc_.poll();
    }

    void send_line(const std::string& line) {
        const std::string data = line + "\n";
        ASSERT_EQ(::write(to_relay_[1], data.data(), data.size()),
                  static_cast<ssize_t>(data.size()));
    }

    void send_request(int id, const std::string& method, const Json::Value& params = Json::Value{}) {
        send_line(serialize_message(make_request(Json::Value(id), method, params)));
    }

    // 다음 응답 한 줄을 기다린다 (최대 2초)
    Json::Value next_message() {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (std::chrono::steady_clock::now() < deadline) {
            if (const auto pos = out_buf_.find('\n'); pos != std::string::npos) {
                const std::string line = out_buf_.substr(0, pos);
                out_buf_.erase(0, pos + 1);
                auto parsed = parse_message(line);
                EXPECT_TRUE(parsed.has_value()) << "relay wrote invalid JSON: " << line;
                return parsed ? *parsed : Json::Value{};
            }
            run_for(std::chrono::milliseconds(5));
            char buf[4096];
            const ssize_t n = ::read(from_relay_[0], buf, sizeof(buf));
            if (n > 0) {
                out_buf_.append(buf, static_cast<std::size_t>(n));
            }
        }
        ADD_FAILURE() << "timed out waiting for relay output";
        return Json::Value{};
    }

    Json::Value call(int id, const std::string& method, const Json::Value& params = Json::Value{}) {
        send_request(id, method, params);
        return next_message();
    }

    Json::Value call_tool(int id, const std::string& name) {
        Json::Value params(Json::objectValue);
        params["name"]                 = name;
        params["arguments"]["path"]    = "/tmp/x";
        return call(id, "tools/call", params);
    }

    void wait_for_exit() {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (!exit_ && std::chrono::steady_clock::now() < deadline) {
            run_for(std::chrono::milliseconds(5));
        }
        ASSERT_TRUE(exit_.has_value()) << "relay did not finish";
    }

    static std::vector<std::string> tool_names(const Json::Value& response) {
        std::vector<std::string> names;
        for (const auto& tool : response["result"]["tools"]) {
            names.push_back(tool["name"].asString());
        }
        return names;
    }

    boost::asio::io_context         ioc_;
    int                             to_relay_[2]{-1, -1};
    int                             from_relay_[2]{-1, -1};
    std::string                     out_buf_;
    std::shared_ptr<JsonChannel>    caller_;
    std::shared_ptr<FakeBackend>    backend_;
    std::shared_ptr<StatsCollector> stats_;
    ServerPolicy                    policy_;
    std::shared_ptr<Relay>          relay_;
    std::optional<RelayExit>        exit_;
};

}  // namespace

// ===========================================================================
// initialize / ping
// ===========================================================================

TEST_F(RelayTest, Initialize_MirrorsBackendAndNegotiatesVersion) {
    start_relay();
    ASSERT_EQ(relay_->state(), RelayState::kServing);

    Json::Value params(Json::objectValue);
    params["protocolVersion"] = "2025-03-26";
    params["capabilities"]    = Json::Value(Json::objectValue);
    const auto response = call(1, "initialize", params);

    EXPECT_EQ(response["id"].asInt(), 1);
    const auto& result = response["result"];
    EXPECT_EQ(result["protocolVersion"].asString(), "2025-03-26");
    EXPECT_EQ(result["serverInfo"]["name"].asString(), "mcp-fw");
    EXPECT_FALSE(result["capabilities"]["tools"]["listChanged"].asBool());
    EXPECT_FALSE(result["capabilities"]["resources"].isMember("subscribe"));
    EXPECT_EQ(result["instructions"].asString(), "backend instructions");

    // initialized 알림은 백엔드로 전달되지 않는다
    send_line(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    const auto pong = call(2, "ping");
    EXPECT_TRUE(pong["result"].isObject());
    EXPECT_TRUE(relay_->caller_initialized());
    EXPECT_TRUE(backend_->notifications.empty());
    EXPECT_TRUE(backend_->requests.empty()) << "initialize and ping are answered locally";
}

TEST_F(RelayTest, OtherNotificationsAreForwarded) {
    start_relay();
    send_line(R"({"jsonrpc":"2.0","method":"notifications/roots/list_changed","params":{"n":3}})");
    call(1, "ping");

    ASSERT_EQ(backend_->notifications.size(), 1u);
    EXPECT_EQ(backend_->notifications[0], "notifications/roots/list_changed");
    EXPECT_EQ(backend_->notification_params[0]["n"].asInt(), 3);
}

// ===========================================================================
// notifications/cancelled
// ===========================================================================

TEST_F(RelayTest, Cancelled_InFlightCall_IsRewrittenToBackendId) {
    backend_->handlers["tools/call"] = [](const Json::Value&) -> RpcResult {
        Json::Value result(Json::objectValue);
        result["content"] = Json::Value(Json::arrayValue);
        return result;
    };
    backend_->stalled_methods.insert("tools/call");
    start_relay();
    call(1, "tools/list");

    Json::Value params(Json::objectValue);
    params["name"] = "read_file";
    send_request(7, "tools/call", params);
    run_for(std::chrono::milliseconds(20));
    ASSERT_EQ(backend_->count_requests("tools/call"), 1u);
    const std::uint64_t backend_id = backend_->last_request_id;
    ASSERT_NE(backend_id, 7u);

    send_line(R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":7,"reason":"user"}})");
    run_for(std::chrono::milliseconds(20));

    ASSERT_EQ(backend_->notifications.size(), 1u);
    EXPECT_EQ(backend_->notifications[0], "notifications/cancelled");
    const Json::Value& forwarded = backend_->notification_params[0];
    EXPECT_EQ(forwarded["requestId"].asUInt64(), backend_id);
    EXPECT_EQ(forwarded["reason"].asString(), "user");

    // 완료된 요청에 대한 취소는 버린다
    backend_->release_stalled();
    const auto response = next_message();
    EXPECT_EQ(response["id"].asInt(), 7);
    EXPECT_TRUE(response.isMember("result"));

    send_line(R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":7}})");
    call(8, "ping");
    EXPECT_EQ(backend_->notifications.size(), 1u);
}

TEST_F(RelayTest, Cancelled_StringIdIsDistinctFromNumericId) {
    backend_->stalled_methods.insert("resources/read");
    start_relay();

    send_line(R"({"jsonrpc":"2.0","id":"5","method":"resources/read","params":{"uri":"file:///a"}})");
    run_for(std::chrono::milliseconds(20));
    ASSERT_EQ(backend_->count_requests("resources/read"), 1u);

    send_line(R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":5}})");
    run_for(std::chrono::milliseconds(20));
    EXPECT_TRUE(backend_->notifications.empty());

    send_line(R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":"5"}})");
    run_for(std::chrono::milliseconds(20));
    ASSERT_EQ(backend_->notifications.size(), 1u);
    EXPECT_EQ(backend_->notification_params[0]["requestId"].asUInt64(), backend_->last_request_id);

    backend_->release_stalled();
    const auto response = next_message();
    EXPECT_EQ(response["id"].asString(), "5");
}

TEST_F(RelayTest, Cancelled_WithoutBackendCounterpart_IsDropped) {
    start_relay();
    call(1, "tools/list");

    const auto blocked = call_tool(3, "http_get");
    ASSERT_TRUE(blocked["result"]["isError"].asBool());

    send_line(R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":3}})");
    send_line(R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":99}})");
    send_line(R"({"jsonrpc":"2.0","method":"notifications/cancelled"})");
    send_line(R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":[1]})");
    call(4, "ping");

    EXPECT_TRUE(backend_->notifications.empty());
    EXPECT_EQ(relay_->state(), RelayState::kServing);
}

// ===========================================================================
// tools/list
// ===========================================================================

TEST_F(RelayTest, ToolsList_FiltersMultiPageCatalog) {
    start_relay();

    const auto response = call(1, "tools/list");
    EXPECT_EQ(tool_names(response), (std::vector<std::string>{"read_file", "log_message"}));
    EXPECT_FALSE(response["result"].isMember("nextCursor"));
    EXPECT_EQ(backend_->count_requests("tools/list"), 2u) << "both catalog pages must be fetched";

    ASSERT_TRUE(relay_->cache().populated());
    const auto snap = stats_->snapshot();
    EXPECT_EQ(snap.catalog_listings, 1u);
    EXPECT_EQ(snap.tools_seen, 3u);
    EXPECT_EQ(snap.tools_retained, 2u);
}

TEST_F(RelayTest, ToolsList_BackendFailureIsReportedToCaller) {
    backend_->handlers["tools/list"] = [](const Json::Value&) -> RpcResult {
        return std::unexpected(RpcError{RpcErrorCode::kConnectionClosed, "Connection closed"});
    };
    start_relay();

    const auto response = call(1, "tools/list");
    EXPECT_EQ(response["error"]["code"].asInt(), static_cast<int>(RpcErrorCode::kInternalError));
    EXPECT_EQ(response["error"]["message"].asString(), "Backend connection closed");
    EXPECT_FALSE(relay_->cache().populated());
}

TEST_F(RelayTest, ToolsList_RepeatedCursorFailsInsteadOfLooping) {
    backend_->handlers["tools/list"] = [](const Json::Value&) -> RpcResult {
        Json::Value result(Json::objectValue);
        result["tools"] = Json::Value(Json::arrayValue);
        result["tools"].append(tool_json("read_file"));
        result["nextCursor"] = "again";
        return result;
    };
    start_relay();

    const auto response = call(1, "tools/list");
    EXPECT_EQ(response["error"]["code"].asInt(), static_cast<int>(RpcErrorCode::kInternalError));
    EXPECT_NE(response["error"]["message"].asString().find("again"), std::string::npos);
    EXPECT_EQ(backend_->count_requests("tools/list"), 2u);
    EXPECT_FALSE(relay_->cache().populated());
}

// ===========================================================================
// tools/call
// ===========================================================================

TEST_F(RelayTest, BlockedCall_NeverReachesBackend) {
    start_relay();
    call(1, "tools/list");

    const auto response = call_tool(2, "http_get");
    EXPECT_EQ(response["id"].asInt(), 2);
    ASSERT_TRUE(response.isMember("result")) << "blocked call is a tool result, not an error";
    EXPECT_TRUE(response["result"]["isError"].asBool());
    EXPECT_EQ(response["result"]["content"][0]["text"].asString(),
              "Tool 'http_get' is blocked by firewall policy");

    EXPECT_EQ(backend_->count_requests("tools/call"), 0u);
    const auto snap = stats_->snapshot();
    EXPECT_EQ(snap.tool_calls_blocked, 1u);
    EXPECT_EQ(snap.tool_calls_forwarded, 0u);
}

TEST_F(RelayTest, AllowedCall_ForwardsParamsAndResultVerbatim) {
    backend_->handlers["tools/call"] = [](const Json::Value& params) -> RpcResult {
        Json::Value text(Json::objectValue);
        text["type"] = "text";
        text["text"] = "contents of " + params["arguments"]["path"].asString();
        Json::Value result(Json::objectValue);
        result["content"].append(text);
        result["structuredContent"]["size"] = 42;
        return result;
    };
    start_relay();
    call(1, "tools/list");

    const auto response = call_tool(2, "read_file");
    EXPECT_EQ(response["result"]["content"][0]["text"].asString(), "contents of /tmp/x");
    EXPECT_EQ(response["result"]["structuredContent"]["size"].asInt(), 42);

    ASSERT_EQ(backend_->count_requests("tools/call"), 1u);
    const auto& forwarded = backend_->requests.back().second;
    EXPECT_EQ(forwarded["name"].asString(), "read_file");
    EXPECT_EQ(forwarded["arguments"]["path"].asString(), "/tmp/x");
    EXPECT_EQ(stats_->snapshot().tool_calls_forwarded, 1u);
}

TEST_F(RelayTest, CallBeforeListing_TriggersLazyListingOnce) {
    backend_->handlers["tools/call"] = [](const Json::Value&) -> RpcResult {
        return Json::Value(Json::objectValue);
    };
    start_relay();

    const auto blocked = call_tool(1, "http_get");
    EXPECT_TRUE(blocked["result"]["isError"].asBool());
    EXPECT_EQ(backend_->count_requests("tools/list"), 2u);
    EXPECT_TRUE(relay_->cache().populated());

    const auto allowed = call_tool(2, "log_message");
    EXPECT_TRUE(allowed.isMember("result"));
    EXPECT_EQ(backend_->count_requests("tools/list"), 2u) << "populated cache must not relist";
    EXPECT_EQ(backend_->count_requests("tools/call"), 1u);
}

TEST_F(RelayTest, Relisting_ReplacesAllowedSet) {
    backend_->handlers["tools/call"] = [](const Json::Value&) -> RpcResult {
        return Json::Value(Json::objectValue);
    };
    start_relay();
    call(1, "tools/list");
    EXPECT_FALSE(call_tool(2, "log_message")["result"].isMember("isError"));

    backend_->catalog = {"read_file"};
    const auto relisted = call(3, "tools/list");
    EXPECT_EQ(tool_names(relisted), (std::vector<std::string>{"read_file"}));

    const auto response = call_tool(4, "log_message");
    EXPECT_TRUE(response["result"]["isError"].asBool()) << "stale names must not survive a relist";
    EXPECT_EQ(backend_->count_requests("tools/call"), 1u);
}

TEST_F(RelayTest, UnknownTool_IsBlocked) {
    start_relay();
    call(1, "tools/list");

    const auto response = call_tool(2, "does_not_exist");
    EXPECT_TRUE(response["result"]["isError"].asBool());
    EXPECT_EQ(backend_->count_requests("tools/call"), 0u);
}

TEST_F(RelayTest, OverrideCanUnblockTool) {
    policy_.tool_overrides["http_get"] = {"IO"};
    start_relay();

    const auto response = call(1, "tools/list");
    EXPECT_EQ(tool_names(response),
              (std::vector<std::string>{"read_file", "http_get", "log_message"}));
}

TEST_F(RelayTest, ToolsCallWithoutName_IsInvalidParams) {
    start_relay();

    Json::Value params(Json::objectValue);
    params["arguments"] = Json::Value(Json::objectValue);
    const auto response = call(1, "tools/call", params);
    EXPECT_EQ(response["error"]["code"].asInt(), static_cast<int>(RpcErrorCode::kInvalidParams));
    EXPECT_EQ(backend_->count_requests("tools/call"), 0u);
}

// ===========================================================================
// 게이트 없는 전달
// ===========================================================================

TEST_F(RelayTest, ResourcesRead_PassesThrough) {
    backend_->handlers["resources/read"] = [](const Json::Value& params) -> RpcResult {
        Json::Value content(Json::objectValue);
        content["uri"]  = params["uri"];
        content["text"] = "hello";
        Json::Value result(Json::objectValue);
        result["contents"].append(content);
        return result;
    };
    start_relay();

    Json::Value params(Json::objectValue);
    params["uri"] = "file:///etc/hosts";
    const auto response = call(7, "resources/read", params);
    EXPECT_EQ(response["id"].asInt(), 7);
    EXPECT_EQ(response["result"]["contents"][0]["uri"].asString(), "file:///etc/hosts");
    EXPECT_EQ(stats_->snapshot().passthrough_requests, 1u);
}

TEST_F(RelayTest, BackendError_RelayedUnchanged) {
    backend_->handlers["prompts/get"] = [](const Json::Value&) -> RpcResult {
        Json::Value data(Json::objectValue);
        data["prompt"] = "missing";
        return std::unexpected(RpcError{-32099, "prompt not found", data});
    };
    start_relay();

    const auto response = call(3, "prompts/get");
    EXPECT_EQ(response["error"]["code"].asInt(), -32099);
    EXPECT_EQ(response["error"]["message"].asString(), "prompt not found");
    EXPECT_EQ(response["error"]["data"]["prompt"].asString(), "missing");
}

// ===========================================================================
// 오류 응답
// ===========================================================================

TEST_F(RelayTest, UnknownMethod_IsMethodNotFound) {
    start_relay();

    const auto response = call(5, "sampling/createMessage");
    EXPECT_EQ(response["id"].asInt(), 5);
    EXPECT_EQ(response["error"]["code"].asInt(), static_cast<int>(RpcErrorCode::kMethodNotFound));
    EXPECT_EQ(response["error"]["message"].asString(), "Method not found: sampling/createMessage");
    EXPECT_TRUE(backend_->requests.empty());
}

TEST_F(RelayTest, ParseError_AnsweredWithNullId) {
    start_relay();

    send_line("{this is not json");
    const auto response = next_message();
    ASSERT_TRUE(response.isMember("id"));
    EXPECT_TRUE(response["id"].isNull());
    EXPECT_EQ(response["error"]["code"].asInt(), static_cast<int>(RpcErrorCode::kParseError));

    // 세션은 계속 유지된다
    EXPECT_TRUE(call(2, "ping")["result"].isObject());
}

TEST_F(RelayTest, InvalidRequest_EchoesId) {
    start_relay();

    send_line(R"({"jsonrpc":"2.0","id":4})");
    const auto response = next_message();
    EXPECT_EQ(response["id"].asInt(), 4);
    EXPECT_EQ(response["error"]["code"].asInt(), static_cast<int>(RpcErrorCode::kInvalidRequest));
}

// ===========================================================================
// 수명
// ===========================================================================

TEST_F(RelayTest, BackendStartFailure_ExitsUnavailable) {
    backend_->start_result = std::unexpected(std::string{"spawn failed"});
    start_relay();
    wait_for_exit();

    EXPECT_EQ(*exit_, RelayExit::kBackendUnavailable);
    EXPECT_EQ(relay_->state(), RelayState::kClosed);
    EXPECT_FALSE(caller_->is_open());
}

TEST_F(RelayTest, CallerEof_ClosesBackend) {
    start_relay();
    call(1, "ping");

    close_fd(to_relay_[1]);
    wait_for_exit();

    EXPECT_EQ(*exit_, RelayExit::kNormal);
    EXPECT_EQ(relay_->state(), RelayState::kClosed);
    EXPECT_FALSE(backend_->is_open());
}

TEST_F(RelayTest, BackendExit_ClosesCaller) {
    start_relay();
    call(1, "ping");

    backend_->close();
    wait_for_exit();

    EXPECT_EQ(*exit_, RelayExit::kNormal);
    EXPECT_FALSE(caller_->is_open());
}

TEST_F(RelayTest, CloseIsIdempotent) {
    start_relay();
    relay_->close();
    relay_->close();
    wait_for_exit();

    EXPECT_EQ(backend_->close_calls, 1);
    EXPECT_EQ(relay_state_to_string(relay_->state()), std::string{"closed"});
}
