#pragma once

// ---------------------------------------------------------------------------
// label_selector.hpp
//
// LabelSelector (matchLabels + matchExpressions) 를 requirement 목록으로
// 컴파일한다. Kubernetes LabelSelectorAsSelector 와 같은 규칙을 따른다.
//
// [컴파일 규칙]
// - matchLabels 항목       → key Equals value
// - In / NotIn             → values 1개 이상 필요
// - Exists / DoesNotExist  → values 가 비어 있어야 함
// - 그 외 operator         → 오류
// - key  : qualified name ([prefix/]name, prefix 는 DNS subdomain ≤253,
//          name 은 ≤63 자, 영숫자로 시작/끝, 내부에 '-', '_', '.' 허용)
// - value: 빈 문자열 또는 name 과 같은 문자 규칙 ≤63 자
// - 결과는 key 기준 정렬 (동일 key 는 입력 순서 유지), 각 values 도 정렬.
//
// [한계]
// - selector 를 실제 라벨 집합에 매칭하는 기능은 없다 (비목표).
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"  // ValidationError
#include "rule.hpp"          // LabelSelector

enum class SelectorOperator : std::uint8_t {
    kEquals       = 0,
    kIn           = 1,
    kNotIn        = 2,
    kExists       = 3,
    kDoesNotExist = 4,
};

struct SelectorRequirement {
    std::string              key{};
    SelectorOperator         op{SelectorOperator::kEquals};
    std::vector<std::string> values{};
};

// compile_selector
//   성공: requirement 목록 (빈 selector 면 빈 목록)
//   실패: kInvalidSelector 오류 (메시지에 원인 포함)
[[nodiscard]] std::expected<std::vector<SelectorRequirement>, ValidationError>
compile_selector(const LabelSelector& selector);

// check_label_key / check_label_value
//   컴파일 규칙의 key/value 검사를 단독으로 노출한다.
//   실패 시 사유 문자열, 성공 시 빈 문자열.
[[nodiscard]] std::string check_label_key(std::string_view key);
[[nodiscard]] std::string check_label_value(std::string_view value);

[[nodiscard]] std::string_view to_string(SelectorOperator op) noexcept;
