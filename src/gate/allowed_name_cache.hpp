#pragma once

// ---------------------------------------------------------------------------
// allowed_name_cache.hpp
//
// 현재 허용된 도구 이름 집합. 릴레이 인스턴스가 소유하는 유일한 공유
// 가변 상태.
//
// [동시성]
// - 쓰기: tools/list 처리 경로 (replace). 목록 전체를 새 스냅샷으로 교체하며
//   기존 집합과 병합하지 않는다.
// - 읽기: tools/call 판정 경로 (snapshot). 판정 중에는 로컬 shared_ptr 로
//   스냅샷 수명을 유지하므로 동시 교체가 일어나도 반쯤 갱신된 집합을
//   관찰하지 않는다.
// - 릴레이는 단일 io_context 스레드에서 돌지만, 스냅샷 교체는
//   std::atomic<std::shared_ptr<const T>> 로 수행하여 실행 모델과 무관하게
//   안전하다.
//
// [staleness]
// 마지막으로 완료된 목록 조회가 이후 판정에 적용된다. 목록 갱신과 동시에
// 진행된 호출은 이전 스냅샷으로 판정될 수 있다 (허용된 성질).
// ---------------------------------------------------------------------------

#include <atomic>
#include <memory>

#include "gate/tool_gate.hpp"  // ToolNameSet

class AllowedNameCache {
public:
    AllowedNameCache()  = default;
    ~AllowedNameCache() = default;

    AllowedNameCache(const AllowedNameCache&)            = delete;
    AllowedNameCache& operator=(const AllowedNameCache&) = delete;
    AllowedNameCache(AllowedNameCache&&)                 = delete;
    AllowedNameCache& operator=(AllowedNameCache&&)      = delete;

    void replace(ToolNameSet names) {
        names_.store(std::make_shared<const ToolNameSet>(std::move(names)),
                     std::memory_order_release);
    }

    // snapshot
    //   목록 조회가 한 번도 없었으면 nullptr.
    [[nodiscard]] std::shared_ptr<const ToolNameSet> snapshot() const noexcept {
        return names_.load(std::memory_order_acquire);
    }

    // populated
    //   이번 세션에서 목록 조회가 한 번이라도 완료되었는지.
    [[nodiscard]] bool populated() const noexcept {
        return snapshot() != nullptr;
    }

private:
    std::atomic<std::shared_ptr<const ToolNameSet>> names_{};
};
