#pragma once

// ---------------------------------------------------------------------------
// effect_classifier.hpp
//
// 도구 정의 → effect 라벨 집합 분류기 인터페이스.
//
// [계약]
// - 입력: 도구 정의 목록 + 도구별 명시 라벨(override) 맵.
// - 출력: 도구 이름 → EffectSet. override 가 있는 도구는 추론 없이
//   override 목록을 그대로 사용한다 (병합 아님).
// - 출력에 어휘 밖 라벨이 섞여 있으면 ToolGate 가 해당 도구를 차단한다
//   (분류기 결함은 fail-close 로 흡수).
// - 출력에 이름이 누락된 도구 역시 ToolGate 에서 차단된다.
//
// 릴레이/게이트의 정확성은 특정 추론 알고리즘에 의존하지 않는다.
// 테스트는 고정 응답 더블(FixedClassifier)로 대체한다.
// ---------------------------------------------------------------------------

#include <map>
#include <string>
#include <vector>

#include "policy/effect.hpp"
#include "protocol/mcp_types.hpp"  // ToolDefinition

using EffectOverrides = std::map<std::string, std::vector<std::string>>;
using EffectsByName   = std::map<std::string, EffectSet>;

class EffectClassifier {
public:
    virtual ~EffectClassifier() = default;

    [[nodiscard]] virtual EffectsByName classify(const std::vector<ToolDefinition>& tools,
                                                 const EffectOverrides&             overrides) const = 0;
};
