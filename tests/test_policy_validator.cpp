// ---------------------------------------------------------------------------
// test_policy_validator.cpp
//
// PolicyValidator (정책 수준 집계) 단위 테스트.
//
// [테스트 범위]
// - 정상 정책 통과 (privileged 컨테이너 금지 정책)
// - rule 이름 중복: 첫 중복 1건, 마지막에 보고
// - rule 내 보고 순서: rule type → match → exclude → pattern → anchors
// - rule 간 누적 + rule 이름 태깅
// - anyPattern 원소마다 anchor 검사
// - strict 모드: generate / patches 추가 검사
// - 같은 정책을 두 번 검증해도 결과 동일
// ---------------------------------------------------------------------------

#include "policy/policy_validator.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

Value privileged_pattern() {
    return Value::Map{
        {"spec", Value::Map{
            {"^(containers)", Value::Array{
                Value::Map{{"=(securityContext)", Value::Map{{"privileged", "false"}}}},
            }},
        }},
    };
}

Rule validate_rule(const char* name, Value pattern) {
    Rule rule;
    rule.name = name;
    rule.match_resources.kinds = std::vector<std::string>{"Pod"};
    rule.validation.message    = "privileged mode is not allowed";
    rule.validation.pattern    = std::move(pattern);
    return rule;
}

ClusterPolicy policy_with(std::vector<Rule> rules) {
    ClusterPolicy policy;
    policy.name  = "disallow-privileged";
    policy.rules = std::move(rules);
    return policy;
}

std::vector<ValidationErrorCode> codes_of(const ValidationErrors& errors) {
    std::vector<ValidationErrorCode> codes;
    for (const auto& err : errors) {
        codes.push_back(err.code);
    }
    return codes;
}

}  // namespace

// ---------------------------------------------------------------------------
// 1. 정상 정책
// ---------------------------------------------------------------------------
TEST(PolicyValidator, WellFormedPolicy_Passes) {
    const PolicyValidator validator;
    const auto policy = policy_with({validate_rule("deny-privileged", privileged_pattern())});
    EXPECT_TRUE(validator.validate(policy).has_value());
}

TEST(PolicyValidator, NoRules_Passes) {
    const PolicyValidator validator;
    EXPECT_TRUE(validator.validate(ClusterPolicy{}).has_value());
}

// ---------------------------------------------------------------------------
// 2. rule 이름 중복
// ---------------------------------------------------------------------------
TEST(PolicyValidator, DuplicateRuleName_Reported) {
    const PolicyValidator validator;
    const auto policy = policy_with({
        validate_rule("r1", privileged_pattern()),
        validate_rule("r1", privileged_pattern()),
    });

    const auto result = validator.validate(policy);
    ASSERT_FALSE(result.has_value());
    ASSERT_EQ(result.error().size(), 1u);
    EXPECT_EQ(result.error()[0].code, ValidationErrorCode::kDuplicateRuleName);
    EXPECT_EQ(result.error()[0].rule, "r1");
}

TEST(PolicyValidator, DuplicateRuleName_OnlyFirstDuplicate) {
    const auto policy = policy_with({
        validate_rule("a", privileged_pattern()),
        validate_rule("a", privileged_pattern()),
        validate_rule("b", privileged_pattern()),
        validate_rule("b", privileged_pattern()),
    });

    const auto result = PolicyValidator::validate_unique_rule_names(policy);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().rule, "a");
    EXPECT_EQ(result.error().message, "duplicate rule name: 'a'");
}

TEST(PolicyValidator, DuplicateRuleName_ReportedAfterRuleErrors) {
    const PolicyValidator validator;
    Rule empty;
    empty.name = "r1";
    const auto policy = policy_with({validate_rule("r1", privileged_pattern()), empty});

    const auto result = validator.validate(policy);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(codes_of(result.error()),
              (std::vector<ValidationErrorCode>{ValidationErrorCode::kNoRuleTypeDefined,
                                                ValidationErrorCode::kDuplicateRuleName}));
}

// ---------------------------------------------------------------------------
// 3. 보고 순서 / 누적
// ---------------------------------------------------------------------------
TEST(PolicyValidator, RuleErrors_FixedOrder) {
    const PolicyValidator validator;

    Rule rule = validate_rule("messy", Value::Map{{"spec", Value::Map{{"^(containers)", "x"}}}});
    rule.mutation.overlay           = Value::Map{};             // rule type 중복
    rule.match_resources.kinds.reset();
    rule.match_resources.name       = "nginx";                  // match kinds 누락
    rule.exclude_resources.namespaces = std::vector<std::string>{"kube-system"};  // exclude kinds 누락
    rule.validation.any_pattern     = std::vector<Value>{Value::Map{{"a", 1}}};  // pattern 충돌

    const auto errors = validator.validate_rule(rule);
    EXPECT_EQ(codes_of(errors),
              (std::vector<ValidationErrorCode>{
                  ValidationErrorCode::kMultipleRuleTypesDefined,
                  ValidationErrorCode::kMissingResourceKind,
                  ValidationErrorCode::kMissingResourceKind,
                  ValidationErrorCode::kConflictingPatternFields,
                  ValidationErrorCode::kAnchorNotOnArray,
              }));
    for (const auto& err : errors) {
        EXPECT_EQ(err.rule, "messy");
    }
}

TEST(PolicyValidator, ErrorsAccumulateAcrossRules) {
    const PolicyValidator validator;
    const auto policy = policy_with({
        validate_rule("bad-anchor",
                      Value::Map{{"spec", Value::Map{{"containers", Value::Map{{"^(name)", "nginx"}}}}}}),
        validate_rule("ok", privileged_pattern()),
        validate_rule("empty-array", Value::Map{{"spec", Value::Map{{"containers", Value::Array{}}}}}),
    });

    const auto result = validator.validate(policy);
    ASSERT_FALSE(result.has_value());
    ASSERT_EQ(result.error().size(), 2u);

    EXPECT_EQ(result.error()[0].code, ValidationErrorCode::kAnchorNotOnArray);
    EXPECT_EQ(result.error()[0].path, "/spec/containers/");
    EXPECT_EQ(result.error()[0].rule, "bad-anchor");

    EXPECT_EQ(result.error()[1].code, ValidationErrorCode::kEmptyPatternArray);
    EXPECT_EQ(result.error()[1].path, "/spec/containers/");
    EXPECT_EQ(result.error()[1].rule, "empty-array");

    EXPECT_EQ(join_errors(result.error()),
              result.error()[0].message + "; " + result.error()[1].message);
}

TEST(PolicyValidator, AnyPattern_EachElementChecked) {
    const PolicyValidator validator;
    Rule rule;
    rule.name = "any";
    rule.validation.any_pattern = std::vector<Value>{
        Value::Map{{"^(a)", 1}},
        privileged_pattern(),
        Value::Map{{"b", Value::Array{}}},
    };

    const auto errors = validator.validate_existing_anchors(rule);
    EXPECT_EQ(codes_of(errors),
              (std::vector<ValidationErrorCode>{ValidationErrorCode::kAnchorNotOnArray,
                                                ValidationErrorCode::kEmptyPatternArray}));
}

TEST(PolicyValidator, MaxDepthOption_Applied) {
    const PolicyValidator validator{ValidatorOptions{.max_pattern_depth = 2, .strict = false}};
    const auto policy = policy_with({validate_rule("deep", privileged_pattern())});

    const auto result = validator.validate(policy);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error()[0].code, ValidationErrorCode::kPatternTooDeep);
}

TEST(PolicyValidator, EmptyPatchList_CountsAsMutateBlock) {
    const PolicyValidator validator;

    Rule rule = validate_rule("patch-and-validate", privileged_pattern());
    rule.mutation.patches = std::vector<Patch>{};  // "mutate: {patches: []}"

    const auto errors = validator.validate_rule(rule);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].code, ValidationErrorCode::kMultipleRuleTypesDefined);
    EXPECT_EQ(errors[0].rule, "patch-and-validate");
}

TEST(PolicyValidator, ExplicitEmptyKinds_MissingResourceKind) {
    const PolicyValidator validator;

    Rule rule = validate_rule("no-kinds", privileged_pattern());
    rule.match_resources.kinds = std::vector<std::string>{};  // "kinds: []"

    const auto result = validator.validate(policy_with({rule}));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(codes_of(result.error()),
              (std::vector<ValidationErrorCode>{ValidationErrorCode::kMissingResourceKind}));
}

// ---------------------------------------------------------------------------
// 4. strict 모드
// ---------------------------------------------------------------------------
TEST(PolicyValidator, GenerationAndPatches_CheckedOnlyInStrictMode) {
    Rule generate;
    generate.name            = "gen";
    generate.generation.kind = "ConfigMap";  // data / clone 모두 없음

    Rule mutate;
    mutate.name = "patch";
    mutate.mutation.patches = std::vector<Patch>{Patch{"/spec/replicas", "add", std::nullopt}};

    const auto policy = policy_with({generate, mutate});

    EXPECT_TRUE(PolicyValidator{}.validate(policy).has_value());

    const PolicyValidator strict{ValidatorOptions{.max_pattern_depth = 64, .strict = true}};
    const auto result = strict.validate(policy);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(codes_of(result.error()),
              (std::vector<ValidationErrorCode>{ValidationErrorCode::kMissingGenerationSource,
                                                ValidationErrorCode::kMissingPatchValue}));
    EXPECT_EQ(result.error()[0].rule, "gen");
    EXPECT_EQ(result.error()[1].rule, "patch");
}

// ---------------------------------------------------------------------------
// 5. 멱등성
// ---------------------------------------------------------------------------
TEST(PolicyValidator, SamePolicyTwice_IdenticalResult) {
    const PolicyValidator validator;
    Rule empty;
    empty.name = "r2";
    const auto policy = policy_with({
        validate_rule("r1", Value::Map{{"^(x)", 1}}),
        empty,
        validate_rule("r1", privileged_pattern()),
    });

    const auto first  = validator.validate(policy);
    const auto second = validator.validate(policy);
    ASSERT_FALSE(first.has_value());
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(first.error(), second.error());
}
