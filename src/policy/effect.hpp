#pragma once

// ---------------------------------------------------------------------------
// effect.hpp
//
// 효과(effect) 라벨의 닫힌 어휘(closed vocabulary)와 검증 헬퍼.
//
// [설계 원칙]
// - 어휘는 컴파일 타임 상수다. 정책 파일·tool_overrides·분류기 출력 모두
//   이 어휘에 속해야 하며, 속하지 않는 라벨은 로드 시점 오류(정책) 또는
//   차단(분류기 출력, fail-close)으로 처리한다.
// - 라벨은 대소문자를 구분한다 ("fs" 는 유효하지 않다).
// - EffectSet 은 std::set 으로 정렬을 보장한다. 오류 메시지와 감사 로그의
//   출력 순서가 실행마다 달라지지 않도록 하기 위함이다.
// ---------------------------------------------------------------------------

#include <array>
#include <set>
#include <string>
#include <string_view>
#include <vector>

using EffectSet = std::set<std::string>;

// FS   : 파일시스템 접근
// IO   : 콘솔/로그 등 로컬 입출력
// NET  : 네트워크 접근
// PROC : 프로세스 생성/제어
// TIME : 시계 읽기, 지연
// RAND : 난수 사용
// PURE : 부작용 없음 (명시 라벨)
inline constexpr std::array<std::string_view, 7> kEffectVocabulary{
    "FS", "IO", "NET", "PROC", "TIME", "RAND", "PURE",
};

// valid_effects
//   어휘 전체를 EffectSet 으로 반환한다 (정적 인스턴스, 스레드 안전 초기화).
[[nodiscard]] const EffectSet& valid_effects();

[[nodiscard]] bool is_valid_effect(std::string_view label) noexcept;

// invalid_effects
//   labels 중 어휘에 속하지 않는 라벨만 골라 정렬된 집합으로 반환한다.
//   빈 집합이면 labels 전체가 유효하다.
[[nodiscard]] EffectSet invalid_effects(const std::vector<std::string>& labels);

// side_effect_labels
//   PURE 를 제외한 어휘 전체. 분류기가 판단할 수 없는 도구에 부여하는
//   보수적(fail-close) 라벨 집합이다.
[[nodiscard]] const EffectSet& side_effect_labels();

// format_effects
//   "[FS, IO]" 형태의 사람이 읽을 수 있는 문자열.
[[nodiscard]] std::string format_effects(const EffectSet& effects);
