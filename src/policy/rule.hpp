#pragma once

// ---------------------------------------------------------------------------
// rule.hpp
//
// ClusterPolicy 설정 구조체 정의.
// yaml-cpp 를 통해 정책 문서(YAML)에서 로드된다 (PolicyLoader).
//
// [설계 원칙]
// - 이 헤더는 pattern/value.hpp 외에 다른 프로젝트 헤더에 의존하지 않는다.
// - 모든 컨테이너 멤버는 기본값을 명시하여 미초기화 동작을 방지한다.
// - "설정됨" 판정은 구조체 전체 비교가 아닌 필드 그룹별 술어
//   (is_empty / is_set) 로 한다. YAML null 은 "없음" 으로 취급한다.
// - 이 구조체 자체는 검증 로직을 포함하지 않는다 (field_validators 소관).
// ---------------------------------------------------------------------------

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "pattern/value.hpp"

// ---------------------------------------------------------------------------
// LabelSelectorRequirement
//   matchExpressions 항목 1개.
//   op: "In" | "NotIn" | "Exists" | "DoesNotExist" (YAML 키: operator)
//   허용되지 않는 op 는 로드 시가 아니라 selector 컴파일 시 거부된다.
// ---------------------------------------------------------------------------
struct LabelSelectorRequirement {
    std::string              key{};
    std::string              op{};
    std::vector<std::string> values{};
};

// ---------------------------------------------------------------------------
// LabelSelector
//   match_labels 는 문서 순서를 보존한다.
//   둘 다 비어 있으면 "모든 대상" selector 이며 requirement 가 0개다.
// ---------------------------------------------------------------------------
struct LabelSelector {
    std::vector<std::pair<std::string, std::string>> match_labels{};
    std::vector<LabelSelectorRequirement>            match_expressions{};
};

// ---------------------------------------------------------------------------
// ResourceDescription
//   rule 이 매칭/제외할 리소스 필터.
//   selector 가 std::nullopt 이면 selector 필드 자체가 없는 것이고,
//   빈 LabelSelector 이면 "selector: {}" 처럼 명시된 것이다.
//   kinds / namespaces 도 같은 규칙: "kinds: []" 는 명시된 빈 목록이며
//   is_empty() 를 false 로 만든다.
// ---------------------------------------------------------------------------
struct ResourceDescription {
    std::optional<std::vector<std::string>> kinds{};
    std::string                             name{};
    std::optional<std::vector<std::string>> namespaces{};
    std::optional<LabelSelector>            selector{};

    [[nodiscard]] bool is_empty() const noexcept {
        return !kinds.has_value() && name.empty() && !namespaces.has_value() &&
               !selector.has_value();
    }
};

// ---------------------------------------------------------------------------
// Patch
//   JSONPatch 연산 1개. YAML 키: path, op, value
// ---------------------------------------------------------------------------
struct Patch {
    std::string          path{};
    std::string          operation{};
    std::optional<Value> value{};
};

// ---------------------------------------------------------------------------
// Mutation
//   overlay (pattern 트리) 또는 patches 목록.
//   "patches: []" 도 mutate 블록이 있는 것으로 본다.
// ---------------------------------------------------------------------------
struct Mutation {
    std::optional<Value>              overlay{};
    std::optional<std::vector<Patch>> patches{};

    [[nodiscard]] bool is_set() const noexcept {
        return overlay.has_value() || patches.has_value();
    }
};

// ---------------------------------------------------------------------------
// Validation
//   pattern 과 anyPattern 중 정확히 하나가 있어야 한다 (검증기 소관).
//
//   [anyPattern 의 "있음" 판정]
//   - any_pattern == std::nullopt : 키 자체가 없음
//   - any_pattern == 빈 vector    : "anyPattern: []" 로 명시됨.
//     validation 은 설정된 것으로 보되, anyPattern 은 없는 것으로 본다.
// ---------------------------------------------------------------------------
struct Validation {
    std::string                       message{};
    std::optional<Value>              pattern{};
    std::optional<std::vector<Value>> any_pattern{};

    [[nodiscard]] bool has_pattern() const noexcept { return pattern.has_value(); }

    [[nodiscard]] bool has_any_pattern() const noexcept {
        return any_pattern.has_value() && !any_pattern->empty();
    }

    [[nodiscard]] bool is_set() const noexcept {
        return !message.empty() || pattern.has_value() || any_pattern.has_value();
    }
};

// ---------------------------------------------------------------------------
// CloneFrom
//   generate 의 복제 원본 참조. YAML 키: namespace, name
// ---------------------------------------------------------------------------
struct CloneFrom {
    std::string namespace_name{};
    std::string name{};

    [[nodiscard]] bool is_set() const noexcept {
        return !namespace_name.empty() || !name.empty();
    }
};

// ---------------------------------------------------------------------------
// Generation
//   kind 는 설명용이며 오류 메시지에만 쓰인다.
//   data 와 clone 중 정확히 하나가 있어야 한다 (검증기 소관).
// ---------------------------------------------------------------------------
struct Generation {
    std::string          kind{};
    std::string          name{};
    std::optional<Value> data{};
    CloneFrom            clone{};

    [[nodiscard]] bool is_set() const noexcept {
        return !kind.empty() || !name.empty() || data.has_value() || clone.is_set();
    }
};

// ---------------------------------------------------------------------------
// Rule
//   match / exclude 는 YAML 의 match.resources / exclude.resources.
//   mutate / validate / generate 중 정확히 하나만 설정되어야 한다.
// ---------------------------------------------------------------------------
struct Rule {
    std::string         name{};
    ResourceDescription match_resources{};
    ResourceDescription exclude_resources{};
    Mutation            mutation{};
    Validation          validation{};
    Generation          generation{};

    [[nodiscard]] bool has_mutate() const noexcept   { return mutation.is_set(); }
    [[nodiscard]] bool has_validate() const noexcept { return validation.is_set(); }
    [[nodiscard]] bool has_generate() const noexcept { return generation.is_set(); }
};

// ---------------------------------------------------------------------------
// ValidationFailureAction
//   정책 위반 시 admission 런타임의 동작. 이 프로젝트는 값만 보존한다.
// ---------------------------------------------------------------------------
enum class ValidationFailureAction : std::uint8_t {
    kAudit   = 0,
    kEnforce = 1,
};

// ---------------------------------------------------------------------------
// ClusterPolicy
//   PolicyLoader::load 가 반환하는 최종 결과물.
//   PolicyValidator 가 읽기 전용으로 참조한다.
// ---------------------------------------------------------------------------
struct ClusterPolicy {
    std::string             name{};
    ValidationFailureAction validation_failure_action{ValidationFailureAction::kAudit};
    bool                    background{true};
    std::vector<Rule>       rules{};
};
