#pragma once

// ---------------------------------------------------------------------------
// anchor_validator.hpp
//
// pattern 트리 전체를 깊이 우선(전위, 왼쪽→오른쪽)으로 순회하며
// existence anchor "^(key)" 가 Array 값에만 바인딩되는지 검사한다.
//
// [Fail-fast]
// validate() 1회 호출은 첫 번째 위반에서 즉시 반환한다.
// 여러 pattern(anyPattern)의 위반을 모두 모으는 것은 호출자(PolicyValidator)
// 의 책임이다.
//
// [경로 표기]
// - 루트는 "/".
// - Map 진입 시 "<path><장식 제거 key>/", Array 원소 진입 시 "<path><index>/".
// - ValidationError::path 에는 위반이 발견된 컨테이너 경로를 기록하고,
//   메시지에는 항상 anchor 원문을 덧붙인다.
//
// [자원 상한]
// pattern 트리는 admission 요청 경로에서 외부 입력으로 들어오므로
// 재귀 깊이를 max_depth 로 제한한다. 초과 시 kPatternTooDeep.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

#include "common/types.hpp"    // ValidationError
#include "pattern/value.hpp"   // Value

// ---------------------------------------------------------------------------
// ExistenceAnchorValidator
//   상태 없는 검사기. max_depth 외의 멤버를 갖지 않으므로 여러 스레드에서
//   동시에 같은 인스턴스를 사용해도 안전하다.
// ---------------------------------------------------------------------------
class ExistenceAnchorValidator {
public:
    static constexpr std::size_t kDefaultMaxDepth = 64;

    explicit ExistenceAnchorValidator(std::size_t max_depth = kDefaultMaxDepth) noexcept
        : max_depth_(max_depth) {}

    // validate
    //   root 부터 순회하여 첫 번째 위반을 반환한다. 위반이 없으면 성공.
    //   path 는 root 의 경로이며 '/' 로 끝나야 한다.
    [[nodiscard]] std::expected<void, ValidationError>
    validate(const Value& root, std::string_view path = "/") const;

    [[nodiscard]] std::size_t max_depth() const noexcept { return max_depth_; }

private:
    [[nodiscard]] std::expected<void, ValidationError>
    validate_node(const Value& node, const std::string& path, std::size_t depth) const;

    [[nodiscard]] std::expected<void, ValidationError>
    validate_map(const Value::Map& map, const std::string& path, std::size_t depth) const;

    [[nodiscard]] std::expected<void, ValidationError>
    validate_array(const Value::Array& array, const std::string& path, std::size_t depth) const;

    [[nodiscard]] static std::expected<void, ValidationError>
    validate_scalar(const Value& scalar, const std::string& path);

    std::size_t max_depth_;
};
