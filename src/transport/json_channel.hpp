#pragma once

// ---------------------------------------------------------------------------
// json_channel.hpp
//
// 개행 구분 JSON(newline-delimited JSON) 양방향 채널.
// MCP stdio 전송 계층: 한 줄 = JSON-RPC 메시지 하나.
//
// 입력/출력은 서로 다른 파일 디스크립터다.
//   - 호출자 세션: stdin(dup) / stdout(dup)
//   - 백엔드 세션: 자식 프로세스 stdout 파이프 / stdin 파이프
//
// [스레드 안전성]
// 단일 io_context 스레드에서만 사용한다. send() 는 큐에 적재 후 즉시
// 반환하고, 쓰기 코루틴 하나가 큐를 순서대로 비운다. 따라서 여러 요청
// 코루틴이 동시에 send() 해도 줄 단위 메시지가 섞이지 않는다.
//
// [수명]
// 쓰기 코루틴이 shared_from_this() 를 보유하므로 반드시 make_shared 로
// 생성해야 한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include <cstddef>
#include <deque>
#include <expected>
#include <memory>
#include <string>

#include <json/json.h>

class JsonChannel : public std::enable_shared_from_this<JsonChannel> {
public:
    using Descriptor = boost::asio::posix::stream_descriptor;

    // 한 줄 최대 크기. 초과 시 채널을 닫는다 (무한 버퍼링 방지).
    static constexpr std::size_t kMaxLineBytes = 16 * 1024 * 1024;

    // name: 로그 태그 ("caller", "backend")
    JsonChannel(Descriptor input, Descriptor output, std::string name);
    ~JsonChannel() = default;

    JsonChannel(const JsonChannel&)            = delete;
    JsonChannel& operator=(const JsonChannel&) = delete;
    JsonChannel(JsonChannel&&)                 = delete;
    JsonChannel& operator=(JsonChannel&&)      = delete;

    // -----------------------------------------------------------------------
    // read_message
    //   다음 메시지 한 줄을 읽어 JSON 객체로 반환한다. 빈 줄은 건너뛴다.
    //
    //   실패:
    //     - kConnectionClosed : EOF, 읽기 오류, close(), 줄 크기 초과
    //                           (이후 호출도 계속 kConnectionClosed)
    //     - kParseError       : JSON 문법 오류 (채널은 계속 사용 가능)
    //     - kInvalidRequest   : 객체가 아닌 JSON (채널은 계속 사용 가능)
    //
    //   동시에 두 개의 read_message 를 진행하지 말 것 (읽기 루프는 하나).
    // -----------------------------------------------------------------------
    auto read_message() -> boost::asio::awaitable<std::expected<Json::Value, RpcError>>;

    // -----------------------------------------------------------------------
    // send
    //   메시지를 직렬화하여 쓰기 큐에 넣는다. 닫힌 채널이면 버린다.
    //   쓰기 오류가 발생하면 채널을 닫는다.
    // -----------------------------------------------------------------------
    void send(const Json::Value& message);

    // close
    //   두 디스크립터를 닫는다. 진행 중인 읽기/쓰기는 operation_aborted 로
    //   완료된다. 중복 호출은 no-op.
    void close();

    [[nodiscard]] bool is_open() const noexcept { return !closed_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    auto write_loop(std::shared_ptr<JsonChannel> self) -> boost::asio::awaitable<void>;

    Descriptor              input_;
    Descriptor              output_;
    std::string             name_;
    std::string             read_buf_{};
    std::deque<std::string> write_queue_{};
    bool                    writing_{false};
    bool                    closed_{false};
};
