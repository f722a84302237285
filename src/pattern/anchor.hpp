#pragma once

// ---------------------------------------------------------------------------
// anchor.hpp
//
// pattern Map key 에 붙는 anchor 장식 분류기.
//
// [지원 형식]
//   (key)    : condition
//   =(key)   : equality
//   ^(key)   : existence   ← 이 프로젝트에서 배치 규칙을 강제하는 유일한 종류
//   X(key)   : negation
//   +(key)   : add-if-not-present
//
// 분류는 순수 문자열 검사이며 key 당 O(1) 이다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// AnchorKind
//   kNone 은 장식이 없는 일반 key.
// ---------------------------------------------------------------------------
enum class AnchorKind : std::uint8_t {
    kNone            = 0,
    kCondition       = 1,
    kEquality        = 2,
    kExistence       = 3,
    kNegation        = 4,
    kAddIfNotPresent = 5,
};

// ---------------------------------------------------------------------------
// AnchorKey
//   분류 결과. key 는 장식을 제거한 이름 (kNone 이면 원문 그대로).
// ---------------------------------------------------------------------------
struct AnchorKey {
    AnchorKind  kind{AnchorKind::kNone};
    std::string key{};
};

// classify_anchor
//   Map key 문자열을 분류하고 장식을 벗긴 key 를 함께 반환한다.
[[nodiscard]] AnchorKey classify_anchor(std::string_view raw_key);

// has_existence_anchor
//   str 이 "^(" 로 시작하고 ")" 로 끝나면 true. 빈 이름 "^()" 도 포함.
[[nodiscard]] bool has_existence_anchor(std::string_view str) noexcept;

// to_string
//   로그용 anchor 종류 이름.
[[nodiscard]] std::string_view to_string(AnchorKind kind) noexcept;
