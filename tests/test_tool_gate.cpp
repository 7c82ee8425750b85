// ---------------------------------------------------------------------------
// test_tool_gate.cpp
//
// build_allowed_tools / is_tool_allowed / AllowedNameCache 단위 테스트.
//
// [테스트 범위]
// - 고정 응답 분류기 더블(FixedClassifier)로 추론 알고리즘과 분리
// - 시나리오: allow={FS,IO} / deny={NET} / override 로 NET 부여
// - 빈 라벨 도구는 항상 유지
// - override 는 병합이 아닌 대체
// - 어휘 밖 라벨, 분류기 출력 누락 → 제외 (fail-close)
// - 멱등성: 같은 입력 → 같은 출력
// - AllowedNameCache: 교체(병합 아님), 미조회 상태
// ---------------------------------------------------------------------------

#include "gate/allowed_name_cache.hpp"
#include "gate/tool_gate.hpp"
#include "policy/policy_loader.hpp"

#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

namespace {

// ---------------------------------------------------------------------------
// FixedClassifier
//   미리 정한 이름→라벨 응답을 돌려주는 분류기 더블.
//   override 는 계약대로 추론 결과를 대체한다.
// ---------------------------------------------------------------------------
class FixedClassifier final : public EffectClassifier {
public:
    explicit FixedClassifier(EffectsByName answers)
        : answers_(std::move(answers))
    {}

    [[nodiscard]] EffectsByName classify(const std::vector<ToolDefinition>& tools,
                                         const EffectOverrides&             overrides) const override {
        ++calls;
        EffectsByName out;
        for (const auto& tool : tools) {
            if (const auto it = overrides.find(tool.name); it != overrides.end()) {
                out[tool.name] = EffectSet(it->second.begin(), it->second.end());
            } else if (const auto a = answers_.find(tool.name); a != answers_.end()) {
                out[tool.name] = a->second;
            }
        }
        return out;
    }

    mutable int calls{0};

private:
    EffectsByName answers_;
};

ToolDefinition make_tool(const std::string& name) {
    ToolDefinition t{};
    t.name        = name;
    t.description = "test tool " + name;
    t.raw["name"] = name;
    return t;
}

ServerPolicy make_policy(EffectSet allow, EffectSet deny, EffectOverrides overrides = {}) {
    ServerPolicy p{};
    p.name           = "test";
    p.launch.command = "echo";
    p.allow          = std::move(allow);
    p.deny           = std::move(deny);
    p.tool_overrides = std::move(overrides);
    return p;
}

std::vector<ToolDefinition> three_tools() {
    return {make_tool("read_file"), make_tool("http_get"), make_tool("log_message")};
}

FixedClassifier three_tool_classifier() {
    return FixedClassifier(EffectsByName{
        {"read_file",   {"FS"}},
        {"http_get",    {"NET"}},
        {"log_message", {"IO"}},
    });
}

}  // namespace

// ===========================================================================
// 시나리오
// ===========================================================================

TEST(ToolGate, AllowFsIo_RetainsReadFileAndLogMessage) {
    const auto classifier = three_tool_classifier();
    const auto result =
        build_allowed_tools(three_tools(), make_policy({"FS", "IO"}, {}), classifier);

    EXPECT_EQ(result.allowed_names, (ToolNameSet{"read_file", "log_message"}));
    ASSERT_EQ(result.tools.size(), 2u);
    EXPECT_EQ(result.tools[0].name, "read_file");    // 카탈로그 순서 보존
    EXPECT_EQ(result.tools[1].name, "log_message");
    EXPECT_EQ(result.effective_allowed, (EffectSet{"FS", "IO"}));
}

TEST(ToolGate, EmptyAllowDenyNet_ExcludesOnlyHttpGet) {
    const auto classifier = three_tool_classifier();
    const auto result = build_allowed_tools(three_tools(), make_policy({}, {"NET"}), classifier);

    EXPECT_EQ(result.allowed_names, (ToolNameSet{"read_file", "log_message"}));
    EXPECT_FALSE(is_tool_allowed("http_get", result.allowed_names));
}

TEST(ToolGate, OverrideToNet_ExcludedDespiteFsAllowance) {
    const FixedClassifier classifier(EffectsByName{{"ambiguous_tool", {"FS"}}});
    const auto policy = make_policy({"FS"}, {}, {{"ambiguous_tool", {"NET"}}});
    const auto result = build_allowed_tools({make_tool("ambiguous_tool")}, policy, classifier);

    EXPECT_TRUE(result.allowed_names.empty());
    ASSERT_EQ(result.verdicts.size(), 1u);
    EXPECT_EQ(result.verdicts[0].effects, (EffectSet{"NET"}));
    EXPECT_FALSE(result.verdicts[0].allowed);
    EXPECT_NE(result.verdicts[0].reason.find("NET"), std::string::npos);
}

TEST(ToolGate, OverrideReplacesInferredSet) {
    // 추론은 {FS, NET} 이지만 override [FS] 로 FS 만으로 판정
    const FixedClassifier classifier(EffectsByName{{"sync_tool", {"FS", "NET"}}});
    const auto policy = make_policy({"FS"}, {}, {{"sync_tool", {"FS"}}});
    const auto result = build_allowed_tools({make_tool("sync_tool")}, policy, classifier);

    EXPECT_TRUE(is_tool_allowed("sync_tool", result.allowed_names));
}

TEST(ToolGate, EmptyEffectSet_AlwaysRetained) {
    const FixedClassifier classifier(EffectsByName{{"add", {}}});
    // 유효 허용 집합이 비어 있어도 유지
    const auto policy = make_policy({"FS"}, {"FS"});
    const auto result = build_allowed_tools({make_tool("add")}, policy, classifier);

    EXPECT_TRUE(compute_effective_allowed(policy).empty());
    EXPECT_TRUE(is_tool_allowed("add", result.allowed_names));
}

TEST(ToolGate, PureLabel_JudgedAsOrdinaryLabel) {
    const FixedClassifier classifier(EffectsByName{{"echo", {"PURE"}}});
    const auto allowed = build_allowed_tools({make_tool("echo")}, make_policy({}, {}), classifier);
    EXPECT_TRUE(is_tool_allowed("echo", allowed.allowed_names));

    const auto denied =
        build_allowed_tools({make_tool("echo")}, make_policy({}, {"PURE"}), classifier);
    EXPECT_FALSE(is_tool_allowed("echo", denied.allowed_names));
}

TEST(ToolGate, MultipleLabels_AllMustBeAllowed) {
    const FixedClassifier classifier(EffectsByName{{"sync", {"FS", "NET"}}});
    const auto result = build_allowed_tools({make_tool("sync")}, make_policy({"FS"}, {}), classifier);
    EXPECT_FALSE(is_tool_allowed("sync", result.allowed_names));
}

// ===========================================================================
// fail-close
// ===========================================================================

TEST(ToolGate, UnknownClassifierLabel_Excluded) {
    const FixedClassifier classifier(EffectsByName{{"weird", {"BOGUS"}}});
    // allow 비어 있음 = 전체 어휘 허용. 그래도 BOGUS 는 어휘 밖이므로 제외
    const auto result = build_allowed_tools({make_tool("weird")}, make_policy({}, {}), classifier);

    EXPECT_FALSE(is_tool_allowed("weird", result.allowed_names));
    ASSERT_EQ(result.verdicts.size(), 1u);
    EXPECT_NE(result.verdicts[0].reason.find("BOGUS"), std::string::npos);
}

TEST(ToolGate, ToolMissingFromClassifierOutput_Excluded) {
    const FixedClassifier classifier(EffectsByName{});
    const auto result = build_allowed_tools({make_tool("ghost")}, make_policy({}, {}), classifier);

    EXPECT_TRUE(result.allowed_names.empty());
    EXPECT_TRUE(result.tools.empty());
    ASSERT_EQ(result.verdicts.size(), 1u);
    EXPECT_FALSE(result.verdicts[0].allowed);
}

TEST(ToolGate, EmptyCatalog_EmptyResult) {
    const FixedClassifier classifier(EffectsByName{});
    const auto result = build_allowed_tools({}, make_policy({}, {}), classifier);
    EXPECT_TRUE(result.tools.empty());
    EXPECT_TRUE(result.allowed_names.empty());
}

// ===========================================================================
// 멱등성
// ===========================================================================

TEST(ToolGate, Idempotent_SameInputsSameOutputs) {
    const auto classifier = three_tool_classifier();
    const auto catalog    = three_tools();
    const auto policy     = make_policy({"FS", "IO"}, {"NET"});

    const auto first  = build_allowed_tools(catalog, policy, classifier);
    const auto second = build_allowed_tools(catalog, policy, classifier);

    EXPECT_EQ(first.allowed_names, second.allowed_names);
    ASSERT_EQ(first.tools.size(), second.tools.size());
    for (std::size_t i = 0; i < first.tools.size(); ++i) {
        EXPECT_EQ(first.tools[i].name, second.tools[i].name);
        EXPECT_EQ(first.tools[i].raw, second.tools[i].raw);
    }
    ASSERT_EQ(first.verdicts.size(), second.verdicts.size());
    for (std::size_t i = 0; i < first.verdicts.size(); ++i) {
        EXPECT_EQ(first.verdicts[i].effects, second.verdicts[i].effects);
        EXPECT_EQ(first.verdicts[i].reason, second.verdicts[i].reason);
    }
    EXPECT_EQ(classifier.calls, 2);
}

TEST(ToolGate, IsToolAllowed_PureMembership) {
    const ToolNameSet names{"a", "b"};
    EXPECT_TRUE(is_tool_allowed("a", names));
    EXPECT_FALSE(is_tool_allowed("c", names));
    EXPECT_FALSE(is_tool_allowed("", names));
    EXPECT_FALSE(is_tool_allowed("a", ToolNameSet{}));
}

// ===========================================================================
// AllowedNameCache
// ===========================================================================

TEST(AllowedNameCache, InitiallyNotPopulated) {
    AllowedNameCache cache;
    EXPECT_FALSE(cache.populated());
    EXPECT_EQ(cache.snapshot(), nullptr);
}

TEST(AllowedNameCache, ReplaceOverwritesNotMerges) {
    AllowedNameCache cache;
    cache.replace({"read_file", "http_get"});
    cache.replace({"log_message"});

    const auto snap = cache.snapshot();
    ASSERT_NE(snap, nullptr);
    EXPECT_EQ(*snap, (ToolNameSet{"log_message"}));
}

TEST(AllowedNameCache, EmptyReplacementStillPopulated) {
    AllowedNameCache cache;
    cache.replace({});
    EXPECT_TRUE(cache.populated());
    EXPECT_TRUE(cache.snapshot()->empty());
}

TEST(AllowedNameCache, SnapshotSurvivesReplacement) {
    AllowedNameCache cache;
    cache.replace({"a"});
    const auto old_snap = cache.snapshot();
    cache.replace({"b"});

    EXPECT_TRUE(is_tool_allowed("a", *old_snap));
    EXPECT_FALSE(is_tool_allowed("a", *cache.snapshot()));
}
