#include "gate/tool_gate.hpp"

#include <utility>

#include <fmt/format.h>

#include "policy/policy_loader.hpp"  // compute_effective_allowed

namespace {

// judge
//   라벨 집합 하나를 유효 허용 집합에 대해 판정한다.
//   차단이면 사유 문자열, 허용이면 빈 문자열을 반환한다.
[[nodiscard]] std::string judge(const EffectSet& effects, const EffectSet& effective_allowed) {
    for (const auto& label : effects) {
        if (!is_valid_effect(label)) {
            return fmt::format("classifier returned unknown effect '{}'", label);
        }
        if (!effective_allowed.contains(label)) {
            return fmt::format("effect {} not in allowed set {}",
                               label, format_effects(effective_allowed));
        }
    }
    return {};
}

}  // namespace

GateResult build_allowed_tools(const std::vector<ToolDefinition>& catalog,
                               const ServerPolicy&                policy,
                               const EffectClassifier&            classifier) {
    GateResult result{};
    result.effective_allowed = compute_effective_allowed(policy);

    const EffectsByName effects_by_name = classifier.classify(catalog, policy.tool_overrides);

    result.verdicts.reserve(catalog.size());
    for (const auto& tool : catalog) {
        ToolVerdict verdict{};
        verdict.name = tool.name;

        const auto it = effects_by_name.find(tool.name);
        if (it == effects_by_name.end()) {
            verdict.reason = "classifier returned no effects for tool";
        } else {
            verdict.effects = it->second;
            verdict.reason  = judge(verdict.effects, result.effective_allowed);
            verdict.allowed = verdict.reason.empty();
        }

        if (verdict.allowed) {
            result.tools.push_back(tool);
            result.allowed_names.insert(tool.name);
        }
        result.verdicts.push_back(std::move(verdict));
    }
    return result;
}

bool is_tool_allowed(std::string_view name, const ToolNameSet& allowed_names) {
    return allowed_names.find(std::string{name}) != allowed_names.end();
}
