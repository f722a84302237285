// ---------------------------------------------------------------------------
// anchor.cpp
//
// [알려진 한계]
// - 중첩 장식 "^(=(key))" 은 바깥 장식만 분류한다. 안쪽은 key 의 일부로 남는다.
// - "(" 만 있고 ")" 로 끝나지 않는 key 는 일반 key 로 취급한다.
// ---------------------------------------------------------------------------

#include "pattern/anchor.hpp"

namespace {

// 장식 prefix 목록. "(" 는 다른 prefix 의 접미와 겹치므로 마지막에 검사한다.
struct AnchorPrefix {
    std::string_view prefix;
    AnchorKind       kind;
};

constexpr AnchorPrefix kPrefixes[] = {
    {"^(", AnchorKind::kExistence},
    {"=(", AnchorKind::kEquality},
    {"X(", AnchorKind::kNegation},
    {"+(", AnchorKind::kAddIfNotPresent},
    {"(",  AnchorKind::kCondition},
};

constexpr std::string_view kSuffix = ")";

}  // namespace

AnchorKey classify_anchor(std::string_view raw_key) {
    for (const auto& [prefix, kind] : kPrefixes) {
        if (raw_key.size() < prefix.size() + kSuffix.size()) {
            continue;
        }
        if (raw_key.starts_with(prefix) && raw_key.ends_with(kSuffix)) {
            const auto inner = raw_key.substr(
                prefix.size(), raw_key.size() - prefix.size() - kSuffix.size());
            return AnchorKey{kind, std::string{inner}};
        }
    }
    return AnchorKey{AnchorKind::kNone, std::string{raw_key}};
}

bool has_existence_anchor(std::string_view str) noexcept {
    constexpr std::string_view kPrefix = "^(";
    return str.size() >= kPrefix.size() + kSuffix.size() &&
           str.starts_with(kPrefix) && str.ends_with(kSuffix);
}

std::string_view to_string(AnchorKind kind) noexcept {
    switch (kind) {
        case AnchorKind::kNone:            return "none";
        case AnchorKind::kCondition:       return "condition";
        case AnchorKind::kEquality:        return "equality";
        case AnchorKind::kExistence:       return "existence";
        case AnchorKind::kNegation:        return "negation";
        case AnchorKind::kAddIfNotPresent: return "add-if-not-present";
        default:                           return "unknown";
    }
}
