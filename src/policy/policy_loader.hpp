#pragma once

// ---------------------------------------------------------------------------
// policy_loader.hpp
//
// YAML 정책 파일에서 지정한 서버 항목 하나를 로드하여 ServerPolicy 로
// 반환하는 로더, 그리고 유효 허용 집합(effective allowed set) 계산.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(PolicyError) 반환. 호출자는 실패 시
//   어떤 세션도 시작하지 않고 프로세스를 종료해야 한다 (ConfigError).
// - All-or-nothing: 부분적으로 파싱된 정책을 반환하지 않는다.
// - 정책은 시작 시점에 한 번만 로드된다 (Hot Reload 없음).
//
// [순환 의존성]
// policy_loader.hpp → rule.hpp → effect.hpp (단방향만)
//
// [보안 고려사항]
// - 파싱 실패 원인은 로깅하되, YAML 파일 전체를 로그에 출력하지 말 것.
//   env 항목에 토큰/비밀번호가 들어갈 수 있다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include "policy/rule.hpp"

// ---------------------------------------------------------------------------
// PolicyErrorCode
//   정책 로드 실패 분류. 모두 ConfigError (종료 코드 2) 로 귀결된다.
// ---------------------------------------------------------------------------
enum class PolicyErrorCode : std::uint8_t {
    kMissingSource,   // 파일 없음 / 읽기 불가
    kMalformed,       // YAML 문법 오류, 최상위 mapping 아님, 필드 형태 오류
    kMissingServers,  // servers mapping 없음
    kServerNotFound,  // servers.<name> 없음
    kMissingCommand,  // command 누락 또는 빈 문자열
    kInvalidEffect,   // 어휘 밖의 effect 라벨
};

struct PolicyError {
    PolicyErrorCode code{PolicyErrorCode::kMalformed};
    std::string     message{};
};

[[nodiscard]] const char* policy_error_code_to_string(PolicyErrorCode code) noexcept;

// ---------------------------------------------------------------------------
// PolicyLoader
//   정적 로드 기능만 제공한다. 상태 없음.
// ---------------------------------------------------------------------------
class PolicyLoader {
public:
    PolicyLoader()  = default;
    ~PolicyLoader() = default;

    PolicyLoader(const PolicyLoader&)            = default;
    PolicyLoader& operator=(const PolicyLoader&) = default;
    PolicyLoader(PolicyLoader&&)                 = default;
    PolicyLoader& operator=(PolicyLoader&&)      = default;

    // load
    //   config_path 의 YAML 을 읽어 servers.<server_name> 항목을 파싱한다.
    //
    //   [fail-close 요구사항]
    //   파일 없음, 파싱 오류, 필드 형태 불일치, 어휘 밖 라벨 모두 실패로
    //   처리한다. 잘못된 라벨을 조용히 무시하면 allow/deny 의 의미가
    //   바뀌므로 경고로 격하하지 않는다.
    [[nodiscard]] static std::expected<ServerPolicy, PolicyError>
    load(const std::filesystem::path& config_path, std::string_view server_name);

    // load_from_string
    //   YAML 텍스트에서 직접 로드한다 (파일 이외의 설정 저장소, 테스트용).
    [[nodiscard]] static std::expected<ServerPolicy, PolicyError>
    load_from_string(std::string_view yaml_text, std::string_view server_name);
};

// ---------------------------------------------------------------------------
// compute_effective_allowed
//   allow 가 비어 있으면 전체 어휘에서, 아니면 allow 에서 출발하여
//   deny 를 뺀다. deny 는 항상 우선한다.
//   순수 함수. 문법적으로 유효한 모든 정책에 대해 정의된다.
// ---------------------------------------------------------------------------
[[nodiscard]] EffectSet compute_effective_allowed(const ServerPolicy& policy);

// is_effect_enabled
//   label 이 유효 허용 집합에 속하는지. --check 리포트에서 사용.
[[nodiscard]] bool is_effect_enabled(const ServerPolicy& policy, std::string_view label);
