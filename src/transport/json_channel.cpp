#include "transport/json_channel.hpp"

#include "protocol/jsonrpc.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

// ---------------------------------------------------------------------------
// JsonChannel 구현
//
// 읽기: async_read_until(dynamic_buffer(read_buf_, kMaxLineBytes), '\n')
//   read_buf_ 에 이미 완성된 줄이 남아 있으면 추가 읽기 없이 반환된다.
//   CRLF 입력을 허용하기 위해 줄 끝 '\r' 을 제거한다.
//
// 쓰기: write_queue_ + writing_ 플래그.
//   writing_ == false 일 때만 write_loop 를 co_spawn 한다.
// ---------------------------------------------------------------------------

JsonChannel::JsonChannel(Descriptor input, Descriptor output, std::string name)
    : input_{std::move(input)}
    , output_{std::move(output)}
    , name_{std::move(name)}
{}

auto JsonChannel::read_message()
    -> boost::asio::awaitable<std::expected<Json::Value, RpcError>>
{
    while (true) {
        if (closed_) {
            co_return std::unexpected(RpcError{RpcErrorCode::kConnectionClosed,
                                               "Connection closed"});
        }

        boost::system::error_code ec;
        const std::size_t n = co_await boost::asio::async_read_until(
            input_,
            boost::asio::dynamic_buffer(read_buf_, kMaxLineBytes),
            '\n',
            boost::asio::redirect_error(boost::asio::use_awaitable, ec)
        );

        if (ec) {
            if (ec == boost::asio::error::eof) {
                spdlog::debug("[{}] end of stream", name_);
            } else if (ec == boost::asio::error::not_found) {
                spdlog::error("[{}] message exceeds {} bytes, closing channel",
                              name_, kMaxLineBytes);
            } else if (ec != boost::asio::error::operation_aborted) {
                spdlog::warn("[{}] read error: {}", name_, ec.message());
            }
            close();
            co_return std::unexpected(RpcError{RpcErrorCode::kConnectionClosed,
                                               "Connection closed"});
        }

        std::string line = read_buf_.substr(0, n - 1);  // '\n' 제외
        read_buf_.erase(0, n);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        auto parsed = parse_message(line);
        if (!parsed) {
            spdlog::warn("[{}] malformed message ({}): {}",
                         name_, parsed.error().code, parsed.error().message);
        }
        co_return parsed;
    }
}

void JsonChannel::send(const Json::Value& message) {
    if (closed_) {
        spdlog::debug("[{}] channel closed, dropping outgoing message", name_);
        return;
    }

    std::string line = serialize_message(message);
    line.push_back('\n');
    write_queue_.push_back(std::move(line));

    if (writing_) {
        return;
    }
    writing_ = true;
    boost::asio::co_spawn(
        output_.get_executor(),
        write_loop(shared_from_this()),
        [](std::exception_ptr eptr) {
            if (eptr) {
                try { std::rethrow_exception(eptr); }
                catch (const std::exception& e) {
                    spdlog::error("[channel] write loop error: {}", e.what());
                }
            }
        }
    );
}

auto JsonChannel::write_loop(std::shared_ptr<JsonChannel> self)
    -> boost::asio::awaitable<void>
{
    while (!self->write_queue_.empty() && !self->closed_) {
        boost::system::error_code ec;
        co_await boost::asio::async_write(
            self->output_,
            boost::asio::buffer(self->write_queue_.front()),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec)
        );
        // close() 가 대기 중에 큐를 비웠을 수 있다
        if (self->closed_) {
            break;
        }
        if (ec) {
            if (ec != boost::asio::error::operation_aborted) {
                spdlog::warn("[{}] write error: {}", self->name_, ec.message());
            }
            self->close();
            break;
        }
        self->write_queue_.pop_front();
    }
    self->writing_ = false;
}

void JsonChannel::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    boost::system::error_code ec;
    input_.close(ec);
    if (ec) {
        spdlog::debug("[{}] input close: {}", name_, ec.message());
    }
    output_.close(ec);
    if (ec) {
        spdlog::debug("[{}] output close: {}", name_, ec.message());
    }
    write_queue_.clear();
}
