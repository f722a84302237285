// ---------------------------------------------------------------------------
// policy_validator.cpp
//
// ClusterPolicy 구조 검증 집계 구현.
//
// [누적 원칙]
// - 하위 검증기 하나가 실패해도 나머지를 계속 실행한다.
// - 정책 작성자가 한 번의 제출로 모든 문제를 볼 수 있어야 한다.
// - rule 이름 중복 검사만 첫 중복에서 멈춘다.
// ---------------------------------------------------------------------------

#include "policy/policy_validator.hpp"

#include <iterator>
#include <string>
#include <unordered_set>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "policy/field_validators.hpp"

namespace {

// append_if_error
//   단일 결과 검증기의 오류를 rule 이름으로 태깅하여 누적한다.
void append_if_error(ValidationErrors& errors,
                     std::expected<void, ValidationError> result,
                     const std::string& rule_name) {
    if (result) {
        return;
    }
    ValidationError err = std::move(result.error());
    err.rule = rule_name;
    errors.push_back(std::move(err));
}

}  // namespace

PolicyValidator::PolicyValidator(ValidatorOptions options) noexcept
    : options_(options)
    , anchor_validator_(options.max_pattern_depth)
{}

std::expected<void, ValidationErrors>
PolicyValidator::validate(const ClusterPolicy& policy) const {
    ValidationErrors errors;

    for (const auto& rule : policy.rules) {
        ValidationErrors rule_errors = validate_rule(rule);
        errors.insert(errors.end(),
                      std::make_move_iterator(rule_errors.begin()),
                      std::make_move_iterator(rule_errors.end()));
    }

    if (auto unique = validate_unique_rule_names(policy); !unique) {
        errors.push_back(std::move(unique.error()));
    }

    if (!errors.empty()) {
        return std::unexpected(std::move(errors));
    }
    return {};
}

ValidationErrors PolicyValidator::validate_rule(const Rule& rule) const {
    ValidationErrors errors;

    // 1. rule type: mutate / validate / generate 중 정확히 하나
    append_if_error(errors, validate_rule_type(rule), rule.name);

    // 2. resource description: match, exclude 순
    append_if_error(errors, validate_resource_description(rule.match_resources), rule.name);
    append_if_error(errors, validate_resource_description(rule.exclude_resources), rule.name);

    // 3. validate 블록: pattern / anyPattern 배타성
    append_if_error(errors, validate_overlay_pattern(rule), rule.name);

    // 4. existence anchor 배치 (pattern 별 fail-fast, pattern 간 누적)
    ValidationErrors anchor_errors = validate_existing_anchors(rule);
    errors.insert(errors.end(),
                  std::make_move_iterator(anchor_errors.begin()),
                  std::make_move_iterator(anchor_errors.end()));

    if (options_.strict) {
        // 5. generate 블록: data / clone 배타성
        if (rule.has_generate()) {
            append_if_error(errors, validate_generation(rule.generation), rule.name);
        }

        // 6. mutate.patches: 패치 순서대로
        if (rule.mutation.patches) {
            for (const auto& patch : *rule.mutation.patches) {
                append_if_error(errors, validate_patch(patch), rule.name);
            }
        }
    }

    return errors;
}

ValidationErrors PolicyValidator::validate_existing_anchors(const Rule& rule) const {
    ValidationErrors errors;
    const Validation& validation = rule.validation;

    if (validation.pattern) {
        append_if_error(errors, anchor_validator_.validate(*validation.pattern), rule.name);
    }

    if (validation.has_any_pattern()) {
        for (const auto& pattern : *validation.any_pattern) {
            append_if_error(errors, anchor_validator_.validate(pattern), rule.name);
        }
    }

    return errors;
}

std::expected<void, ValidationError>
PolicyValidator::validate_unique_rule_names(const ClusterPolicy& policy) {
    std::unordered_set<std::string> seen;
    seen.reserve(policy.rules.size());

    for (const auto& rule : policy.rules) {
        if (!seen.insert(rule.name).second) {
            return std::unexpected(ValidationError{
                .code    = ValidationErrorCode::kDuplicateRuleName,
                .message = fmt::format("duplicate rule name: '{}'", rule.name),
                .rule    = rule.name,
            });
        }
    }
    return {};
}
