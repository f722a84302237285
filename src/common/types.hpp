#pragma once

// ---------------------------------------------------------------------------
// types.hpp
//
// pattern / policy / logger 레이어가 공유하는 검증 오류 타입.
//
// [순환 의존성 방지]
// - 이 헤더는 다른 프로젝트 헤더를 include 하지 않는다.
// - Value, ClusterPolicy 등 모델 타입을 알지 못한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// ValidationErrorCode
//   정책 구조 검증 단계에서 발생 가능한 오류 분류.
//   값은 로그(JSON)에 문자열로 기록되므로 순서를 바꾸어도 무방하나,
//   to_string() 결과는 안정적으로 유지해야 한다.
// ---------------------------------------------------------------------------
enum class ValidationErrorCode : std::uint8_t {
    kDuplicateRuleName           = 0,   // 정책 내 rule 이름 중복
    kNoRuleTypeDefined           = 1,   // mutate/validate/generate 모두 없음
    kMultipleRuleTypesDefined    = 2,   // 둘 이상 정의됨
    kMissingResourceKind         = 3,   // 비어있지 않은 resource description 에 kinds 없음
    kInvalidSelector             = 4,   // label selector 컴파일 실패
    kEmptySelectorRequirements   = 5,   // selector 는 있으나 requirement 0개
    kMissingPattern              = 6,   // validate 에 pattern/anyPattern 모두 없음
    kConflictingPatternFields    = 7,   // pattern 과 anyPattern 동시 정의
    kAnchorNotOnArray            = 8,   // ^() anchor 가 array 가 아닌 값에 바인딩
    kEmptyPatternArray           = 9,   // pattern 내 빈 array
    kUnknownTreeNodeType         = 10,  // 문서 노드 타입 판별 불가 (로더)
    kMissingPatchPath            = 11,  // JSONPatch path 누락
    kMissingPatchValue           = 12,  // add/replace 에 value 누락
    kUnsupportedPatchOperation   = 13,  // add/replace/remove 외 op
    kConflictingGenerationSource = 14,  // data 와 clone 동시 정의
    kMissingGenerationSource     = 15,  // data/clone 모두 없음
    kPatternTooDeep              = 16,  // pattern 중첩 깊이 상한 초과
    kMalformedDocument           = 17,  // 문서 구조 오류 (비 scalar key, 중복 key)
};

// ---------------------------------------------------------------------------
// ValidationError
//   검증 실패 1건.
//   path : pattern 트리 내부 위치 ("/spec/containers/"). 트리와 무관한
//          오류는 빈 문자열.
//   rule : 오류가 발생한 rule 이름. 정책 수준 오류는 빈 문자열.
// ---------------------------------------------------------------------------
struct ValidationError {
    ValidationErrorCode code{ValidationErrorCode::kUnknownTreeNodeType};
    std::string         message{};
    std::string         path{};
    std::string         rule{};

    bool operator==(const ValidationError&) const = default;
};

using ValidationErrors = std::vector<ValidationError>;

// to_string
//   오류 코드를 CamelCase 이름으로 변환한다 ("AnchorNotOnArray").
[[nodiscard]] std::string_view to_string(ValidationErrorCode code) noexcept;

// join_errors
//   여러 오류를 "; " 로 연결한 단일 메시지로 만든다.
//   빈 목록이면 빈 문자열.
[[nodiscard]] std::string join_errors(const ValidationErrors& errors);
