// ---------------------------------------------------------------------------
// label_selector.cpp
//
// LabelSelector → SelectorRequirement 목록 컴파일.
//
// [오류 메시지]
// Kubernetes apimachinery 의 메시지 형식을 따르되, 정규식 원문은 생략한다.
// 사용자는 정책 작성자이므로 어느 key/value 가 잘못됐는지가 우선이다.
// ---------------------------------------------------------------------------

#include "policy/label_selector.hpp"

#include <algorithm>
#include <optional>
#include <regex>
#include <utility>

#include <spdlog/fmt/fmt.h>

namespace {

constexpr std::size_t kMaxNameLength      = 63;
constexpr std::size_t kMaxSubdomainLength = 253;

const std::regex& name_regex() {
    static const std::regex re{"([A-Za-z0-9][-A-Za-z0-9_.]*)?[A-Za-z0-9]"};
    return re;
}

const std::regex& subdomain_regex() {
    static const std::regex re{
        "[a-z0-9]([-a-z0-9]*[a-z0-9])?(\\.[a-z0-9]([-a-z0-9]*[a-z0-9])?)*"};
    return re;
}

[[nodiscard]] bool full_match(std::string_view text, const std::regex& re) {
    return std::regex_match(text.begin(), text.end(), re);
}

[[nodiscard]] std::optional<SelectorOperator> parse_operator(std::string_view op) {
    if (op == "In") {
        return SelectorOperator::kIn;
    }
    if (op == "NotIn") {
        return SelectorOperator::kNotIn;
    }
    if (op == "Exists") {
        return SelectorOperator::kExists;
    }
    if (op == "DoesNotExist") {
        return SelectorOperator::kDoesNotExist;
    }
    return std::nullopt;
}

[[nodiscard]] ValidationError invalid_selector(std::string message) {
    return ValidationError{
        .code    = ValidationErrorCode::kInvalidSelector,
        .message = std::move(message),
    };
}

// make_requirement
//   operator 별 values 개수 규칙과 key/value 문자 규칙을 검사한다.
[[nodiscard]] std::expected<SelectorRequirement, ValidationError>
make_requirement(const std::string& key, SelectorOperator op, std::vector<std::string> values) {
    if (auto reason = check_label_key(key); !reason.empty()) {
        return std::unexpected(invalid_selector(
            fmt::format("invalid label key \"{}\": {}", key, reason)));
    }

    switch (op) {
        case SelectorOperator::kIn:
        case SelectorOperator::kNotIn:
            if (values.empty()) {
                return std::unexpected(invalid_selector(
                    "for 'in', 'notin' operators, values set can't be empty"));
            }
            break;
        case SelectorOperator::kEquals:
            if (values.size() != 1) {
                return std::unexpected(invalid_selector(
                    "exact-match compatibility requires one single value"));
            }
            break;
        case SelectorOperator::kExists:
        case SelectorOperator::kDoesNotExist:
            if (!values.empty()) {
                return std::unexpected(invalid_selector(
                    "values set must be empty for exists and does not exist"));
            }
            break;
    }

    for (const auto& value : values) {
        if (auto reason = check_label_value(value); !reason.empty()) {
            return std::unexpected(invalid_selector(
                fmt::format("invalid label value: \"{}\": at key: \"{}\": {}", value, key, reason)));
        }
    }

    std::sort(values.begin(), values.end());
    return SelectorRequirement{key, op, std::move(values)};
}

}  // namespace

std::string check_label_key(std::string_view key) {
    std::string_view name = key;

    const auto slash = key.find('/');
    if (slash != std::string_view::npos) {
        const std::string_view prefix = key.substr(0, slash);
        name = key.substr(slash + 1);

        if (name.find('/') != std::string_view::npos) {
            return "a qualified name must consist of an optional prefix and a name "
                   "separated by a single '/'";
        }
        if (prefix.empty()) {
            return "prefix part must be non-empty";
        }
        if (prefix.size() > kMaxSubdomainLength) {
            return fmt::format("prefix part must be no more than {} characters",
                               kMaxSubdomainLength);
        }
        if (!full_match(prefix, subdomain_regex())) {
            return "prefix part must be a lowercase RFC 1123 subdomain";
        }
    }

    if (name.empty()) {
        return "name part must be non-empty";
    }
    if (name.size() > kMaxNameLength) {
        return fmt::format("name part must be no more than {} characters", kMaxNameLength);
    }
    if (!full_match(name, name_regex())) {
        return "name part must consist of alphanumeric characters, '-', '_' or '.', "
               "and must start and end with an alphanumeric character";
    }
    return {};
}

std::string check_label_value(std::string_view value) {
    if (value.empty()) {
        return {};
    }
    if (value.size() > kMaxNameLength) {
        return fmt::format("must be no more than {} characters", kMaxNameLength);
    }
    if (!full_match(value, name_regex())) {
        return "a valid label must be an empty string or consist of alphanumeric characters, "
               "'-', '_' or '.', and must start and end with an alphanumeric character";
    }
    return {};
}

std::expected<std::vector<SelectorRequirement>, ValidationError>
compile_selector(const LabelSelector& selector) {
    std::vector<SelectorRequirement> requirements;
    requirements.reserve(selector.match_labels.size() + selector.match_expressions.size());

    for (const auto& [key, value] : selector.match_labels) {
        auto requirement = make_requirement(key, SelectorOperator::kEquals, {value});
        if (!requirement) {
            return std::unexpected(std::move(requirement.error()));
        }
        requirements.push_back(std::move(*requirement));
    }

    for (const auto& expr : selector.match_expressions) {
        const auto op = parse_operator(expr.op);
        if (!op) {
            return std::unexpected(invalid_selector(
                fmt::format("\"{}\" is not a valid pod selector operator", expr.op)));
        }
        auto requirement = make_requirement(expr.key, *op, expr.values);
        if (!requirement) {
            return std::unexpected(std::move(requirement.error()));
        }
        requirements.push_back(std::move(*requirement));
    }

    std::stable_sort(requirements.begin(), requirements.end(),
                     [](const SelectorRequirement& a, const SelectorRequirement& b) {
                         return a.key < b.key;
                     });
    return requirements;
}

std::string_view to_string(SelectorOperator op) noexcept {
    switch (op) {
        case SelectorOperator::kEquals:       return "=";
        case SelectorOperator::kIn:           return "in";
        case SelectorOperator::kNotIn:        return "notin";
        case SelectorOperator::kExists:       return "exists";
        case SelectorOperator::kDoesNotExist: return "!";
        default:                              return "unknown";
    }
}
