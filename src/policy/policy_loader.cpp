// ---------------------------------------------------------------------------
// policy_loader.cpp
//
// YAML 정책 파일을 로드하여 ServerPolicy 구조체로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 정책을 반환하지 않는다.
// - 형태(shape) 검증은 "malformed mapping" 의 일부다. 잘못된 형태의 필드를
//   기본값으로 대체하지 않고 필드 경로를 명시하여 실패시킨다.
//   (예: allow 가 sequence 가 아니면 "servers.fs.allow must be a sequence")
// - YAML 파일 전체를 로그에 출력하지 않는다 (env 에 비밀값 가능).
// - 선택 필드(args, env, allow, deny, tool_overrides)는 누락 시 빈 값.
//
// [어휘 검증]
// allow → deny → tool_overrides.<tool> 순서로 검사하며, 첫 번째 위반에서
// 실패한다. 메시지에는 필드 경로, 정렬된 위반 라벨, 정렬된 전체 어휘를
// 모두 포함한다.
// ---------------------------------------------------------------------------

#include "policy/policy_loader.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

[[nodiscard]] std::unexpected<PolicyError> fail(PolicyErrorCode code, std::string message) {
    spdlog::error("{}", message);
    return std::unexpected(PolicyError{code, std::move(message)});
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 scalar string 벡터를 읽는다.
// 노드가 없거나 null 이면 빈 벡터. sequence 가 아니거나 원소가 scalar 가
// 아니면 nullopt (호출자가 필드 경로를 붙여 kMalformed 로 보고).
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<std::vector<std::string>>
read_string_sequence(const YAML::Node& node) {
    std::vector<std::string> result;
    if (!node || node.IsNull()) {
        return result;
    }
    if (!node.IsSequence()) {
        return std::nullopt;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            return std::nullopt;
        }
        result.push_back(item.as<std::string>());
    }
    return result;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string→string mapping 을 읽는다.
// 노드가 없거나 null 이면 nullopt 를 value 로 담아 반환 (env 미지정).
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<std::optional<std::map<std::string, std::string>>, std::monostate>
read_string_map(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return std::optional<std::map<std::string, std::string>>{};
    }
    if (!node.IsMap()) {
        return std::unexpected(std::monostate{});
    }
    std::map<std::string, std::string> result;
    for (const auto& kv : node) {
        if (!kv.first.IsScalar() || !kv.second.IsScalar()) {
            return std::unexpected(std::monostate{});
        }
        result.emplace(kv.first.as<std::string>(), kv.second.as<std::string>());
    }
    return std::optional<std::map<std::string, std::string>>{std::move(result)};
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 어휘 검증. 위반 시 kInvalidEffect 오류 메시지를 반환한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<std::string>
validate_effects(const std::vector<std::string>& labels, const std::string& field_path) {
    const EffectSet invalid = invalid_effects(labels);
    if (invalid.empty()) {
        return std::nullopt;
    }
    return fmt::format(
        "policy_loader: invalid effect(s) in {}: {}. valid effects: {}",
        field_path, format_effects(invalid), format_effects(valid_effects())
    );
}

// ---------------------------------------------------------------------------
// parse_server
//   이미 로드된 YAML 문서 루트에서 servers.<server_name> 을 파싱한다.
//   yaml-cpp 변환 예외(as<T>)는 호출자가 kMalformed 로 변환한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<ServerPolicy, PolicyError>
parse_server(const YAML::Node& root, std::string_view server_name, const std::string& origin) {
    if (!root || !root.IsMap()) {
        return fail(PolicyErrorCode::kMalformed, fmt::format(
            "policy_loader: '{}' must contain a YAML mapping (top-level)", origin));
    }

    const YAML::Node servers = root["servers"];
    if (!servers || !servers.IsMap()) {
        return fail(PolicyErrorCode::kMissingServers, fmt::format(
            "policy_loader: '{}' must contain a 'servers' mapping", origin));
    }

    const std::string name{server_name};
    const YAML::Node entry = servers[name];
    if (!entry) {
        std::vector<std::string> available;
        for (const auto& kv : servers) {
            available.push_back(kv.first.as<std::string>());
        }
        std::sort(available.begin(), available.end());
        return fail(PolicyErrorCode::kServerNotFound, fmt::format(
            "policy_loader: server '{}' not found in policy. available: [{}]",
            name, fmt::join(available, ", ")));
    }
    if (!entry.IsMap()) {
        return fail(PolicyErrorCode::kMalformed, fmt::format(
            "policy_loader: servers.{} must be a mapping", name));
    }

    ServerPolicy policy{};
    policy.name = name;

    // 1. command (필수)
    const YAML::Node command = entry["command"];
    if (!command || command.IsNull()) {
        return fail(PolicyErrorCode::kMissingCommand, fmt::format(
            "policy_loader: server '{}' is missing required 'command' field", name));
    }
    if (!command.IsScalar()) {
        return fail(PolicyErrorCode::kMalformed, fmt::format(
            "policy_loader: servers.{}.command must be a string", name));
    }
    policy.launch.command = command.as<std::string>();
    if (policy.launch.command.empty()) {
        return fail(PolicyErrorCode::kMissingCommand, fmt::format(
            "policy_loader: server '{}' has an empty 'command' field", name));
    }

    // 2. args / env
    auto args = read_string_sequence(entry["args"]);
    if (!args) {
        return fail(PolicyErrorCode::kMalformed, fmt::format(
            "policy_loader: servers.{}.args must be a sequence of strings", name));
    }
    policy.launch.args = std::move(*args);

    auto env = read_string_map(entry["env"]);
    if (!env) {
        return fail(PolicyErrorCode::kMalformed, fmt::format(
            "policy_loader: servers.{}.env must be a mapping of strings", name));
    }
    policy.launch.env = std::move(*env);

    // 3. allow / deny
    const std::string allow_path = fmt::format("servers.{}.allow", name);
    const std::string deny_path  = fmt::format("servers.{}.deny", name);

    auto allow = read_string_sequence(entry["allow"]);
    if (!allow) {
        return fail(PolicyErrorCode::kMalformed, fmt::format(
            "policy_loader: {} must be a sequence of effect labels", allow_path));
    }
    auto deny = read_string_sequence(entry["deny"]);
    if (!deny) {
        return fail(PolicyErrorCode::kMalformed, fmt::format(
            "policy_loader: {} must be a sequence of effect labels", deny_path));
    }
    if (auto err = validate_effects(*allow, allow_path)) {
        return fail(PolicyErrorCode::kInvalidEffect, std::move(*err));
    }
    if (auto err = validate_effects(*deny, deny_path)) {
        return fail(PolicyErrorCode::kInvalidEffect, std::move(*err));
    }
    policy.allow = EffectSet(allow->begin(), allow->end());
    policy.deny  = EffectSet(deny->begin(), deny->end());

    // 4. tool_overrides
    const YAML::Node overrides = entry["tool_overrides"];
    if (overrides && !overrides.IsNull()) {
        if (!overrides.IsMap()) {
            return fail(PolicyErrorCode::kMalformed, fmt::format(
                "policy_loader: servers.{}.tool_overrides must be a mapping", name));
        }
        for (const auto& kv : overrides) {
            const std::string tool = kv.first.as<std::string>();
            const std::string path = fmt::format("servers.{}.tool_overrides.{}", name, tool);

            auto labels = read_string_sequence(kv.second);
            if (!labels) {
                return fail(PolicyErrorCode::kMalformed, fmt::format(
                    "policy_loader: {} must be a sequence of effect labels", path));
            }
            if (auto err = validate_effects(*labels, path)) {
                return fail(PolicyErrorCode::kInvalidEffect, std::move(*err));
            }
            policy.tool_overrides[tool] = std::move(*labels);
        }
    }

    spdlog::info(
        "policy_loader: server '{}' loaded: command='{}', args={}, allow={}, deny={}, "
        "tool_overrides={}",
        policy.name, policy.launch.command, policy.launch.args.size(),
        format_effects(policy.allow), format_effects(policy.deny),
        policy.tool_overrides.size()
    );
    return policy;
}

// YAML 파싱 + parse_server 를 yaml-cpp 예외 경계로 감싼다.
template <typename LoadFn>
[[nodiscard]] std::expected<ServerPolicy, PolicyError>
load_guarded(LoadFn&& load_fn, std::string_view server_name, const std::string& origin) {
    YAML::Node root;
    try {
        root = load_fn();
    } catch (const YAML::BadFile& e) {
        return fail(PolicyErrorCode::kMissingSource, fmt::format(
            "policy_loader: cannot open file '{}': {}", origin, e.what()));
    } catch (const YAML::ParserException& e) {
        return fail(PolicyErrorCode::kMalformed, fmt::format(
            "policy_loader: YAML parse error in '{}' at line {}, col {}: {}",
            origin, e.mark.line + 1, e.mark.column + 1, e.msg));
    } catch (const YAML::Exception& e) {
        return fail(PolicyErrorCode::kMalformed, fmt::format(
            "policy_loader: YAML error in '{}': {}", origin, e.what()));
    }

    try {
        return parse_server(root, server_name, origin);
    } catch (const YAML::Exception& e) {
        // as<std::string>() 변환 실패 등 (예: servers 키가 scalar 가 아님)
        return fail(PolicyErrorCode::kMalformed, fmt::format(
            "policy_loader: error parsing servers.{} in '{}': {}",
            server_name, origin, e.what()));
    }
}

}  // namespace

const char* policy_error_code_to_string(PolicyErrorCode code) noexcept {
    switch (code) {
        case PolicyErrorCode::kMissingSource:  return "missing_source";
        case PolicyErrorCode::kMalformed:      return "malformed";
        case PolicyErrorCode::kMissingServers: return "missing_servers";
        case PolicyErrorCode::kServerNotFound: return "server_not_found";
        case PolicyErrorCode::kMissingCommand: return "missing_command";
        case PolicyErrorCode::kInvalidEffect:  return "invalid_effect";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// PolicyLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<ServerPolicy, PolicyError>
PolicyLoader::load(const std::filesystem::path& config_path, std::string_view server_name) {
    // 1. 경로 정규화. 존재하지 않으면 kMissingSource.
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        return fail(PolicyErrorCode::kMissingSource, fmt::format(
            "policy_loader: cannot resolve config path '{}': {}",
            config_path.string(), ec.message()));
    }

    spdlog::info("policy_loader: loading policy from '{}'", canonical_path.string());

    const std::string origin = canonical_path.string();
    return load_guarded([&origin] { return YAML::LoadFile(origin); }, server_name, origin);
}

std::expected<ServerPolicy, PolicyError>
PolicyLoader::load_from_string(std::string_view yaml_text, std::string_view server_name) {
    const std::string text{yaml_text};
    return load_guarded([&text] { return YAML::Load(text); }, server_name, "<string>");
}

// ---------------------------------------------------------------------------
// compute_effective_allowed / is_effect_enabled
// ---------------------------------------------------------------------------
EffectSet compute_effective_allowed(const ServerPolicy& policy) {
    EffectSet effective = policy.allow.empty() ? valid_effects() : policy.allow;
    for (const auto& label : policy.deny) {
        effective.erase(label);
    }
    return effective;
}

bool is_effect_enabled(const ServerPolicy& policy, std::string_view label) {
    return compute_effective_allowed(policy).contains(std::string{label});
}
