#pragma once

// ---------------------------------------------------------------------------
// stats_collector.hpp
//
// 릴레이 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - 갱신 메서드는 데이터패스에서 호출된다. 릴레이는 단일 io_context
//   스레드에서 동작하지만, snapshot() 은 다른 스레드(테스트, 종료 보고)에서
//   읽을 수 있도록 atomic 을 사용한다.
//
// [격리 원칙]
// - 통계 수집 실패가 데이터패스 실패로 전파되지 않도록
//   모든 갱신 메서드는 noexcept 로 선언한다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>

// ---------------------------------------------------------------------------
// StatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   tools_seen / tools_retained : 마지막 tools/list 기준
//   block_rate                  : tool_calls_blocked / tool_calls_total
//                                 (total == 0 이면 0.0)
// ---------------------------------------------------------------------------
struct StatsSnapshot {
    std::uint64_t                         catalog_listings{0};
    std::uint64_t                         tools_seen{0};
    std::uint64_t                         tools_retained{0};
    std::uint64_t                         tool_calls_total{0};
    std::uint64_t                         tool_calls_blocked{0};
    std::uint64_t                         tool_calls_forwarded{0};
    std::uint64_t                         passthrough_requests{0};
    double                                block_rate{0.0};
    std::chrono::system_clock::time_point captured_at{};
};

class StatsCollector {
public:
    StatsCollector() noexcept = default;
    ~StatsCollector()         = default;

    // 복사 금지 (atomic 은 복사 불가)
    StatsCollector(const StatsCollector&)            = delete;
    StatsCollector& operator=(const StatsCollector&) = delete;

    // 이동 금지 (atomic 소유권 명확화)
    StatsCollector(StatsCollector&&)            = delete;
    StatsCollector& operator=(StatsCollector&&) = delete;

    // on_catalog_listing
    //   tools/list 게이트 결과 반영. 마지막 값으로 덮어쓴다.
    void on_catalog_listing(std::size_t seen, std::size_t retained) noexcept {
        catalog_listings_.fetch_add(1, std::memory_order_relaxed);
        tools_seen_.store(seen, std::memory_order_relaxed);
        tools_retained_.store(retained, std::memory_order_relaxed);
    }

    // on_tool_call
    //   blocked: 정책에 의해 차단되어 백엔드에 전달되지 않았으면 true
    void on_tool_call(bool blocked) noexcept {
        tool_calls_total_.fetch_add(1, std::memory_order_relaxed);
        if (blocked) {
            tool_calls_blocked_.fetch_add(1, std::memory_order_relaxed);
        } else {
            tool_calls_forwarded_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    // on_passthrough
    //   게이트를 거치지 않고 전달된 요청 (resources/*, prompts/* 등)
    void on_passthrough() noexcept {
        passthrough_requests_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] StatsSnapshot snapshot() const noexcept {
        const auto total   = tool_calls_total_.load(std::memory_order_relaxed);
        const auto blocked = tool_calls_blocked_.load(std::memory_order_relaxed);

        double block_rate = 0.0;
        if (total > 0) {
            block_rate = static_cast<double>(blocked) / static_cast<double>(total);
        }

        return StatsSnapshot{
            .catalog_listings     = catalog_listings_.load(std::memory_order_relaxed),
            .tools_seen           = tools_seen_.load(std::memory_order_relaxed),
            .tools_retained       = tools_retained_.load(std::memory_order_relaxed),
            .tool_calls_total     = total,
            .tool_calls_blocked   = blocked,
            .tool_calls_forwarded = tool_calls_forwarded_.load(std::memory_order_relaxed),
            .passthrough_requests = passthrough_requests_.load(std::memory_order_relaxed),
            .block_rate           = block_rate,
            .captured_at          = std::chrono::system_clock::now(),
        };
    }

private:
    std::atomic<std::uint64_t> catalog_listings_{0};
    std::atomic<std::uint64_t> tools_seen_{0};
    std::atomic<std::uint64_t> tools_retained_{0};
    std::atomic<std::uint64_t> tool_calls_total_{0};
    std::atomic<std::uint64_t> tool_calls_blocked_{0};
    std::atomic<std::uint64_t> tool_calls_forwarded_{0};
    std::atomic<std::uint64_t> passthrough_requests_{0};
};
