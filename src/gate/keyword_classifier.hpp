#pragma once

// ---------------------------------------------------------------------------
// keyword_classifier.hpp
//
// 정규식 키워드 규칙 기반 EffectClassifier 구현.
//
// [매칭 대상]
// 1. 도구 이름: '_', '-', '.' 와 camelCase 경계를 공백으로 치환
//    (read_file → "read file", fetchUrl → "fetch Url")
// 2. description
// 3. inputSchema.properties 의 키 이름 (1 과 동일하게 정규화)
//
// [판정]
// - 규칙 하나가 매칭될 때마다 해당 라벨을 추가한다.
// - 어떤 규칙도 매칭되지 않으면:
//   a) description 이 순수 함수임을 선언 ("pure", "no side effects") → 빈 집합
//   b) 그 외 → PURE 를 제외한 전체 라벨 (fail-close)
//   모호한 도구를 허용하려면 운영자가 tool_overrides 로 명시해야 한다.
//
// [오탐/미탐 트레이드오프]
// - 키워드가 넓을수록 안전한 도구가 차단된다 (false positive).
//   단, 차단은 항상 override 로 해제할 수 있으므로 넓은 쪽을 택한다.
// - "path" 처럼 여러 의미를 갖는 단어는 FS 로 간주한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "gate/effect_classifier.hpp"

// ---------------------------------------------------------------------------
// KeywordRule
//   label  : 매칭 시 부여할 effect 라벨 (어휘 내 값이어야 함)
//   pattern: ECMAScript regex (대소문자 무시로 컴파일)
// ---------------------------------------------------------------------------
struct KeywordRule {
    std::string label{};
    std::string pattern{};
};

class KeywordClassifier final : public EffectClassifier {
public:
    // 기본 규칙 집합 (FS, NET, PROC, IO, TIME, RAND)
    [[nodiscard]] static std::vector<KeywordRule> default_rules();

    KeywordClassifier();

    // 생성자: 규칙 목록을 받아 std::regex 로 컴파일한다.
    //   잘못된 패턴, 어휘 밖 라벨은 로깅 후 건너뛴다. 규칙이 빠지면 해당
    //   도구가 "미분류" 로 남아 전체 라벨을 받으므로 fail-open 이 아니다.
    explicit KeywordClassifier(std::vector<KeywordRule> rules);
    ~KeywordClassifier() override;

    // 복사 금지 (컴파일된 regex 재사용), 이동 허용
    KeywordClassifier(const KeywordClassifier&)            = delete;
    KeywordClassifier& operator=(const KeywordClassifier&) = delete;
    KeywordClassifier(KeywordClassifier&&) noexcept;
    KeywordClassifier& operator=(KeywordClassifier&&) noexcept;

    [[nodiscard]] EffectsByName classify(const std::vector<ToolDefinition>& tools,
                                         const EffectOverrides&             overrides) const override;

    // infer
    //   override 를 고려하지 않은 단일 도구 추론 결과.
    [[nodiscard]] EffectSet infer(const ToolDefinition& tool) const;

    // 컴파일에 성공한 규칙 수
    [[nodiscard]] std::size_t rule_count() const noexcept;

private:
    struct CompiledRule;
    std::vector<CompiledRule> compiled_rules_;
};

// normalize_identifier
//   식별자를 단어 단위 문자열로 바꾼다 (키워드 매칭용, 테스트 노출).
[[nodiscard]] std::string normalize_identifier(std::string_view identifier);
