#include "policy/effect.hpp"

#include <algorithm>

#include <fmt/format.h>
#include <fmt/ranges.h>

const EffectSet& valid_effects() {
    static const EffectSet kAll(kEffectVocabulary.begin(), kEffectVocabulary.end());
    return kAll;
}

bool is_valid_effect(std::string_view label) noexcept {
    return std::find(kEffectVocabulary.begin(), kEffectVocabulary.end(), label)
           != kEffectVocabulary.end();
}

EffectSet invalid_effects(const std::vector<std::string>& labels) {
    EffectSet invalid;
    for (const auto& label : labels) {
        if (!is_valid_effect(label)) {
            invalid.insert(label);
        }
    }
    return invalid;
}

const EffectSet& side_effect_labels() {
    static const EffectSet kSideEffects = [] {
        EffectSet s = valid_effects();
        s.erase("PURE");
        return s;
    }();
    return kSideEffects;
}

std::string format_effects(const EffectSet& effects) {
    return fmt::format("[{}]", fmt::join(effects, ", "));
}
