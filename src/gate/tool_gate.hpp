#pragma once

// ---------------------------------------------------------------------------
// tool_gate.hpp
//
// 분류기 출력 + ServerPolicy → (필터링된 카탈로그, 허용 도구 이름 집합).
//
// [fail-close 원칙]
// 1. 도구의 라벨이 모두 유효 허용 집합에 속할 때만 유지한다.
// 2. 라벨이 비어 있는 도구(부작용 없음)는 항상 유지한다.
// 3. 분류기가 어휘 밖 라벨을 돌려주면 그 도구는 제외한다.
// 4. 분류기 출력에 도구가 없으면 그 도구는 제외한다.
//
// build_allowed_tools 는 입력이 같으면 출력도 같다 (부작용 없음).
// 로깅·캐시 갱신은 호출자(Relay) 소관이다.
// ---------------------------------------------------------------------------

#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "gate/effect_classifier.hpp"
#include "policy/rule.hpp"
#include "protocol/mcp_types.hpp"

using ToolNameSet = std::set<std::string>;

// ---------------------------------------------------------------------------
// ToolVerdict
//   도구 하나에 대한 판정 (감사 로그 / --check 용).
//   reason 은 제외된 도구에만 채워진다.
// ---------------------------------------------------------------------------
struct ToolVerdict {
    std::string name{};
    EffectSet   effects{};
    bool        allowed{false};
    std::string reason{};
};

// ---------------------------------------------------------------------------
// GateResult
//   tools             : 유지된 도구 (카탈로그 순서 보존)
//   allowed_names     : 유지된 도구 이름 집합
//   verdicts          : 카탈로그 순서대로의 도구별 판정
//   effective_allowed : 판정에 사용한 유효 허용 집합
// ---------------------------------------------------------------------------
struct GateResult {
    std::vector<ToolDefinition> tools{};
    ToolNameSet                 allowed_names{};
    std::vector<ToolVerdict>    verdicts{};
    EffectSet                   effective_allowed{};
};

[[nodiscard]] GateResult build_allowed_tools(const std::vector<ToolDefinition>& catalog,
                                             const ServerPolicy&                policy,
                                             const EffectClassifier&            classifier);

// is_tool_allowed
//   순수 멤버십 검사.
[[nodiscard]] bool is_tool_allowed(std::string_view name, const ToolNameSet& allowed_names);
