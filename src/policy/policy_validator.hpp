#pragma once

// ---------------------------------------------------------------------------
// policy_validator.hpp
//
// ClusterPolicy 전체의 구조 검증을 조율하는 집계기.
//
// [누적 vs Fail-fast]
// 1. rule 수준: 하위 검증기를 모두 실행하고 오류를 전부 모은다.
// 2. 정책 수준: 모든 rule 의 오류를 rule 순서대로 모은다.
// 3. rule 이름 중복 검사: 첫 중복에서 즉시 중단 (오류 1개).
// 4. existence anchor 검사: pattern 1개당 첫 위반만 보고한다.
//
// [보고 순서]
//   rule 별: rule type → match → exclude → overlay pattern → existence anchors
//            (→ strict 모드: generate → patches)
//   마지막: rule 이름 중복
//
// [스레드 안전성]
// PolicyValidator 는 옵션 외의 상태를 갖지 않는다. validate() 는 const 이며
// 같은 인스턴스를 여러 스레드에서 동시에 호출해도 안전하다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <expected>

#include "common/types.hpp"               // ValidationError(s)
#include "pattern/anchor_validator.hpp"   // ExistenceAnchorValidator
#include "rule.hpp"                       // ClusterPolicy, Rule

// ---------------------------------------------------------------------------
// ValidatorOptions
//   max_pattern_depth: pattern 트리 재귀 상한
//   strict           : generate 의 data/clone 과 mutate.patches 도 검사
// ---------------------------------------------------------------------------
struct ValidatorOptions {
    std::size_t max_pattern_depth{ExistenceAnchorValidator::kDefaultMaxDepth};
    bool        strict{false};
};

class PolicyValidator {
public:
    explicit PolicyValidator(ValidatorOptions options = {}) noexcept;

    ~PolicyValidator() = default;

    PolicyValidator(const PolicyValidator&)            = default;
    PolicyValidator& operator=(const PolicyValidator&) = default;
    PolicyValidator(PolicyValidator&&)                 = default;
    PolicyValidator& operator=(PolicyValidator&&)      = default;

    // validate
    //   정책 전체를 검증한다.
    //   성공: 값 없음
    //   실패: 비어 있지 않은 오류 목록 (보고 순서는 헤더 주석 참고)
    [[nodiscard]] std::expected<void, ValidationErrors>
    validate(const ClusterPolicy& policy) const;

    // validate_rule
    //   rule 하나의 모든 오류를 모아 반환한다. 각 오류의 rule 필드가 채워진다.
    [[nodiscard]] ValidationErrors validate_rule(const Rule& rule) const;

    // validate_existing_anchors
    //   validate.pattern 1회 + anyPattern 원소마다 1회 검사한다.
    //   호출마다 최대 1개의 오류.
    [[nodiscard]] ValidationErrors validate_existing_anchors(const Rule& rule) const;

    // validate_unique_rule_names
    //   첫 번째로 중복된 이름에서 kDuplicateRuleName 을 반환한다.
    [[nodiscard]] static std::expected<void, ValidationError>
    validate_unique_rule_names(const ClusterPolicy& policy);

    [[nodiscard]] const ValidatorOptions& options() const noexcept { return options_; }

private:
    ValidatorOptions         options_;
    ExistenceAnchorValidator anchor_validator_;
};
