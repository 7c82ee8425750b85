#pragma once

// ---------------------------------------------------------------------------
// rule.hpp
//
// 서버별 접근 정책 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 정책 파일의 servers.<name> 항목에서 로드된다.
//
// [설계 원칙]
// - 이 헤더는 effect.hpp 외의 다른 헤더에 의존하지 않는다.
// - 모든 컨테이너 멤버는 기본값을 명시하여 미초기화 동작을 방지한다.
// - 로드된 ServerPolicy 는 릴레이 프로세스 수명 동안 불변이다.
//   ProxyServer 는 std::shared_ptr<const ServerPolicy> 로만 공유한다
//   (Hot Reload 없음: 정책은 시작 시점의 스냅샷).
// - 판정 로직은 포함하지 않는다. compute_effective_allowed 는
//   policy_loader.hpp, 도구 판정은 gate/tool_gate.hpp 소관.
// ---------------------------------------------------------------------------

#include "policy/effect.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// LaunchSpec
//   백엔드 MCP 서버 실행 기술자.
//   env 는 부모 환경 위에 덮어쓰는 값만 담는다 (nullopt = 덮어쓰기 없음).
// ---------------------------------------------------------------------------
struct LaunchSpec {
    std::string                                       command{};
    std::vector<std::string>                          args{};
    std::optional<std::map<std::string, std::string>> env{};
};

// ---------------------------------------------------------------------------
// ServerPolicy
//   servers.<name> 항목 하나.
//
//   allow 가 비어 있으면 "어휘 전체 허용" 으로 해석한다.
//   deny 는 항상 allow 보다 우선한다 (양쪽에 같은 라벨이 있어도 차단).
//
//   tool_overrides: 도구 이름 → 명시 라벨 목록. 분류기의 추론 결과와
//   병합하지 않고 대체한다. 목록 순서는 정책 파일 그대로 보존한다.
// ---------------------------------------------------------------------------
struct ServerPolicy {
    std::string                                     name{};
    LaunchSpec                                      launch{};
    EffectSet                                       allow{};
    EffectSet                                       deny{};
    std::map<std::string, std::vector<std::string>> tool_overrides{};
};
