// ---------------------------------------------------------------------------
// anchor_validator.cpp
//
// existence anchor 배치 규칙 검사 구현.
//
// [검사 규칙]
// 1. Map   : "^(key)" 의 값은 반드시 Array. 위반 시 즉시 반환 (형제 key 미검사).
// 2. Array : 빈 Array 는 위치와 무관하게 오류 (anchor 바인딩 여부 무관).
// 3. Scalar: 문자열 값 자체가 "^(...)" 형식이면 오류. anchor 는 key 에만 허용.
// 4. 깊이  : root 를 깊이 1 로 보고 max_depth 를 초과하면 오류.
// ---------------------------------------------------------------------------

#include "pattern/anchor_validator.hpp"

#include <type_traits>

#include <spdlog/fmt/fmt.h>

#include "pattern/anchor.hpp"

namespace {

template <typename>
inline constexpr bool kAlwaysFalse = false;

[[nodiscard]] ValidationError make_anchor_error(const std::string& path,
                                                std::string_view   anchor,
                                                std::string_view   found_type) {
    return ValidationError{
        .code    = ValidationErrorCode::kAnchorNotOnArray,
        .message = fmt::format("existing anchor at {}{} must be of type array, found: {}",
                               path, anchor, found_type),
        .path    = path,
    };
}

}  // namespace

std::expected<void, ValidationError>
ExistenceAnchorValidator::validate(const Value& root, std::string_view path) const {
    return validate_node(root, std::string{path}, 1);
}

std::expected<void, ValidationError>
ExistenceAnchorValidator::validate_node(const Value& node, const std::string& path,
                                        std::size_t depth) const {
    if (depth > max_depth_) {
        return std::unexpected(ValidationError{
            .code    = ValidationErrorCode::kPatternTooDeep,
            .message = fmt::format("pattern at {} exceeds maximum nesting depth {}",
                                   path, max_depth_),
            .path    = path,
        });
    }

    return node.visit([&](const auto& alternative) -> std::expected<void, ValidationError> {
        using T = std::decay_t<decltype(alternative)>;
        if constexpr (std::is_same_v<T, Value::Map>) {
            return validate_map(alternative, path, depth);
        } else if constexpr (std::is_same_v<T, Value::Array>) {
            return validate_array(alternative, path, depth);
        } else if constexpr (std::is_same_v<T, Scalar>) {
            return validate_scalar(node, path);
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled Value alternative");
        }
    });
}

std::expected<void, ValidationError>
ExistenceAnchorValidator::validate_map(const Value::Map& map, const std::string& path,
                                       std::size_t depth) const {
    for (const auto& [raw_key, element] : map) {
        const AnchorKey anchor = classify_anchor(raw_key);

        if (anchor.kind == AnchorKind::kExistence && !element.is_array()) {
            return std::unexpected(make_anchor_error(path, raw_key, element.type_name()));
        }

        // existence 외의 anchor 는 일반 key 로 취급하되 경로에는 장식을 제거한 이름을 쓴다.
        auto result = validate_node(element, path + anchor.key + "/", depth + 1);
        if (!result) {
            return result;
        }
    }
    return {};
}

std::expected<void, ValidationError>
ExistenceAnchorValidator::validate_array(const Value::Array& array, const std::string& path,
                                         std::size_t depth) const {
    if (array.empty()) {
        return std::unexpected(ValidationError{
            .code    = ValidationErrorCode::kEmptyPatternArray,
            .message = fmt::format("pattern array at {} is empty", path),
            .path    = path,
        });
    }

    for (std::size_t i = 0; i < array.size(); ++i) {
        auto result = validate_node(array[i], fmt::format("{}{}/", path, i), depth + 1);
        if (!result) {
            return result;
        }
    }
    return {};
}

std::expected<void, ValidationError>
ExistenceAnchorValidator::validate_scalar(const Value& scalar, const std::string& path) {
    const std::string* text = scalar.as_string();
    if (text != nullptr && has_existence_anchor(*text)) {
        return std::unexpected(make_anchor_error(path, *text, "string"));
    }
    return {};
}
