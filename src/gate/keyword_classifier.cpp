// ---------------------------------------------------------------------------
// keyword_classifier.cpp
//
// [CompiledRule 구현 주의사항]
// 헤더에서 전방 선언한 CompiledRule 을 여기서 정의한다.
// vector<CompiledRule> 의 특수 멤버(생성/소멸/이동)는 이 파일에서만
// 인스턴스화되도록 모두 out-of-line 으로 정의한다.
// ---------------------------------------------------------------------------

#include "gate/keyword_classifier.hpp"

#include <cctype>
#include <regex>
#include <utility>

#include <spdlog/spdlog.h>

struct KeywordClassifier::CompiledRule {
    std::string label;
    std::string pattern;
    std::regex  compiled;
};

namespace {

constexpr auto kRegexFlags = std::regex_constants::icase | std::regex_constants::ECMAScript;

// 순수 함수 선언 감지. 다른 규칙이 하나도 매칭되지 않았을 때만 사용된다.
const std::regex& pure_declaration() {
    static const std::regex kPure(
        R"(\b(pure|no[- ]side[- ]effects?|side[- ]effect[- ]free)\b)", kRegexFlags);
    return kPure;
}

}  // namespace

std::string normalize_identifier(std::string_view identifier) {
    std::string out;
    out.reserve(identifier.size() + 8);
    char prev = '\0';
    for (const char c : identifier) {
        const auto uc = static_cast<unsigned char>(c);
        if (c == '_' || c == '-' || c == '.' || c == '/') {
            out.push_back(' ');
        } else {
            // camelCase 경계: 소문자/숫자 뒤의 대문자
            if (std::isupper(uc) != 0 &&
                (std::islower(static_cast<unsigned char>(prev)) != 0 ||
                 std::isdigit(static_cast<unsigned char>(prev)) != 0)) {
                out.push_back(' ');
            }
            out.push_back(c);
        }
        prev = c;
    }
    return out;
}

std::vector<KeywordRule> KeywordClassifier::default_rules() {
    return {
        {"FS",   R"(\b(file|files|filename|filesystem|directory|directories|dir|folder|folders|path|paths|disk|mkdir|rmdir|fs)\b)"},
        {"NET",  R"(\b(http|https|url|urls|uri|fetch|download|upload|web|website|webpage|internet|network|api|socket|dns|email|smtp|webhook|browser|scrape)\b)"},
        {"PROC", R"(\b(exec|execute|shell|bash|spawn|subprocess|process|processes|command|commands|kill|script|pid)\b)"},
        {"IO",   R"(\b(log|logs|logging|print|console|stdout|stderr|stdin|display|notify|terminal)\b)"},
        {"TIME", R"(\b(time|times|timestamp|date|dates|clock|sleep|delay|timezone|datetime)\b)"},
        {"RAND", R"(\b(random|randomly|randomize|uuid|guid|shuffle|dice|nonce|entropy)\b)"},
    };
}

KeywordClassifier::KeywordClassifier()
    : KeywordClassifier(default_rules())
{}

KeywordClassifier::KeywordClassifier(std::vector<KeywordRule> rules) {
    compiled_rules_.reserve(rules.size());
    for (auto& rule : rules) {
        if (!is_valid_effect(rule.label)) {
            spdlog::warn("[gate] keyword rule label '{}' is not an effect label, skipping",
                         rule.label);
            continue;
        }
        try {
            std::regex re(rule.pattern, kRegexFlags);
            compiled_rules_.push_back(
                CompiledRule{std::move(rule.label), std::move(rule.pattern), std::move(re)});
        } catch (const std::regex_error& e) {
            spdlog::warn("[gate] invalid keyword regex for {} '{}', skipping: {}",
                         rule.label, rule.pattern, e.what());
        }
    }
    spdlog::debug("[gate] keyword classifier ready: {} rules", compiled_rules_.size());
}

KeywordClassifier::~KeywordClassifier()                                        = default;
KeywordClassifier::KeywordClassifier(KeywordClassifier&&) noexcept            = default;
KeywordClassifier& KeywordClassifier::operator=(KeywordClassifier&&) noexcept = default;

std::size_t KeywordClassifier::rule_count() const noexcept {
    return compiled_rules_.size();
}

EffectSet KeywordClassifier::infer(const ToolDefinition& tool) const {
    std::string text = normalize_identifier(tool.name);
    text += '\n';
    text += tool.description;
    text += '\n';
    if (tool.input_schema.isObject() && tool.input_schema["properties"].isObject()) {
        for (const auto& key : tool.input_schema["properties"].getMemberNames()) {
            text += normalize_identifier(key);
            text += ' ';
        }
    }

    EffectSet effects;
    for (const auto& rule : compiled_rules_) {
        if (std::regex_search(text, rule.compiled)) {
            effects.insert(rule.label);
        }
    }
    if (!effects.empty()) {
        return effects;
    }

    if (std::regex_search(tool.description, pure_declaration())) {
        return effects;
    }

    // 미분류: fail-close
    spdlog::debug("[gate] tool '{}' matched no keyword rule, assuming all side effects",
                  tool.name);
    return side_effect_labels();
}

EffectsByName KeywordClassifier::classify(const std::vector<ToolDefinition>& tools,
                                          const EffectOverrides&             overrides) const {
    EffectsByName result;
    for (const auto& tool : tools) {
        if (const auto it = overrides.find(tool.name); it != overrides.end()) {
            result[tool.name] = EffectSet(it->second.begin(), it->second.end());
            continue;
        }
        result[tool.name] = infer(tool);
    }
    return result;
}
