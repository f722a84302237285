#pragma once

// ---------------------------------------------------------------------------
// field_validators.hpp
//
// 필드 그룹 하나씩을 검사하는 단일 목적 검증 함수 모음.
//
// [반환 규약]
// - 각 함수는 최대 1개의 오류를 반환한다 (std::expected<void, ValidationError>).
// - 오류 누적은 상위 PolicyValidator 의 책임이다.
// - 모든 함수는 순수 함수이며 입력을 변경하지 않고, 로그도 남기지 않는다.
//
// [순환 의존성]
// field_validators.hpp → rule.hpp, common/types.hpp (단방향)
// ---------------------------------------------------------------------------

#include <expected>

#include "common/types.hpp"  // ValidationError
#include "rule.hpp"          // Rule, ResourceDescription, Generation, Patch

// validate_resource_description
//   빈 description 은 통과.
//   그 외에는 kinds 가 필요하고, selector 가 있으면 requirement 가 1개 이상이어야 한다.
[[nodiscard]] std::expected<void, ValidationError>
validate_resource_description(const ResourceDescription& rd);

// validate_overlay_pattern
//   validation 이 설정된 rule 은 pattern / anyPattern 중 정확히 하나를 가져야 한다.
[[nodiscard]] std::expected<void, ValidationError>
validate_overlay_pattern(const Rule& rule);

// validate_rule_type
//   mutate / validate / generate 중 정확히 하나만 설정되어야 한다.
[[nodiscard]] std::expected<void, ValidationError>
validate_rule_type(const Rule& rule);

// validate_generation
//   data / clone 중 정확히 하나만 있어야 한다.
[[nodiscard]] std::expected<void, ValidationError>
validate_generation(const Generation& generation);

// validate_patch
//   path 필수. add/replace 는 value 필수, remove 는 value 무시.
[[nodiscard]] std::expected<void, ValidationError>
validate_patch(const Patch& patch);
