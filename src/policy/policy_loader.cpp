// ---------------------------------------------------------------------------
// policy_loader.cpp
//
// YAML 정책 문서를 ClusterPolicy 구조체로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 정책을 반환하지 않는다.
// - 필드 누락 / YAML null 은 "없음" (구조체 기본값) 으로 처리한다.
// - 필드 타입 불일치는 필드 경로를 포함한 오류로 반환한다
//   (예: "spec.rules[0].match.resources.kinds must be a sequence").
// - 문서 전체를 로그에 출력하지 않는다.
//
// [내부 오류 전파]
// 섹션 파서 헬퍼는 SchemaError 를 던지고, parse_document() 한 곳에서 잡아
// std::unexpected 로 변환한다. yaml-cpp 예외도 같은 위치에서 변환한다.
//
// [알려진 한계]
// - 다중 문서 YAML ("---" 구분) 은 첫 번째 문서만 읽는다.
// - plain scalar 의 bool 판정은 YAML 1.1 규칙(yes/no/on/off 포함)을 따른다.
//   pattern 에서 문자열로 비교하려면 따옴표로 감싸야 한다.
// ---------------------------------------------------------------------------

#include "policy/policy_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

// ---------------------------------------------------------------------------
// SchemaError
//   필드 타입 불일치. 이 파일 밖으로 나가지 않는다.
// ---------------------------------------------------------------------------
class SchemaError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

[[nodiscard]] bool is_absent(const YAML::Node& node) {
    return !node || node.IsNull();
}

void require_map(const YAML::Node& node, const std::string& field) {
    if (!node.IsMap()) {
        throw SchemaError(fmt::format("{} must be a map", field));
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: scalar 타입 결정
//   따옴표 scalar 는 yaml-cpp 가 non-specific tag "!" 를 붙인다.
// ---------------------------------------------------------------------------
[[nodiscard]] Scalar scalar_from_yaml(const YAML::Node& node) {
    const std::string& text = node.Scalar();
    if (node.Tag() == "!") {
        return text;
    }

    bool b{false};
    if (YAML::convert<bool>::decode(node, b)) {
        return b;
    }
    std::int64_t i{0};
    if (YAML::convert<std::int64_t>::decode(node, i)) {
        return i;
    }
    double d{0.0};
    if (YAML::convert<double>::decode(node, d)) {
        return d;
    }
    return text;
}

[[nodiscard]] ValidationError document_error(ValidationErrorCode code, std::string message,
                                             const std::string& path) {
    return ValidationError{
        .code    = code,
        .message = std::move(message),
        .path    = path,
    };
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: yaml-cpp 노드 → Value (재귀, 깊이 제한)
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<Value, ValidationError>
convert_node(const YAML::Node& node, const std::string& path, std::size_t depth,
             std::size_t max_depth) {
    if (depth > max_depth) {
        return std::unexpected(document_error(
            ValidationErrorCode::kPatternTooDeep,
            fmt::format("document at {} exceeds maximum nesting depth {}", path, max_depth),
            path));
    }

    if (!node.IsDefined()) {
        return std::unexpected(document_error(
            ValidationErrorCode::kUnknownTreeNodeType,
            fmt::format("pattern contains unknown type, path: {}", path), path));
    }

    switch (node.Type()) {
        case YAML::NodeType::Null:
            return Value{nullptr};

        case YAML::NodeType::Scalar:
            return Value{scalar_from_yaml(node)};

        case YAML::NodeType::Sequence: {
            Value::Array array;
            array.reserve(node.size());
            std::size_t index = 0;
            for (const auto& item : node) {
                auto element = convert_node(item, fmt::format("{}{}/", path, index), depth + 1,
                                            max_depth);
                if (!element) {
                    return std::unexpected(std::move(element.error()));
                }
                array.push_back(std::move(*element));
                ++index;
            }
            return Value{std::move(array)};
        }

        case YAML::NodeType::Map: {
            Value::Map map;
            map.reserve(node.size());
            std::unordered_set<std::string> seen;
            for (const auto& kv : node) {
                if (!kv.first.IsScalar()) {
                    return std::unexpected(document_error(
                        ValidationErrorCode::kMalformedDocument,
                        fmt::format("map key at {} must be a scalar", path), path));
                }
                const std::string& key = kv.first.Scalar();
                if (!seen.insert(key).second) {
                    return std::unexpected(document_error(
                        ValidationErrorCode::kMalformedDocument,
                        fmt::format("duplicate key '{}' at {}", key, path), path));
                }
                auto element = convert_node(kv.second, path + key + "/", depth + 1, max_depth);
                if (!element) {
                    return std::unexpected(std::move(element.error()));
                }
                map.emplace_back(key, std::move(*element));
            }
            return Value{std::move(map)};
        }

        case YAML::NodeType::Undefined:
        default:
            return std::unexpected(document_error(
                ValidationErrorCode::kUnknownTreeNodeType,
                fmt::format("pattern contains unknown type, path: {}", path), path));
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 필드 읽기. 없음/null 이면 기본값, 타입 불일치면 SchemaError.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& field) {
    if (is_absent(node)) {
        return {};
    }
    if (!node.IsScalar()) {
        throw SchemaError(fmt::format("{} must be a string", field));
    }
    return node.Scalar();
}

[[nodiscard]] bool read_bool(const YAML::Node& node, const std::string& field, bool fallback) {
    if (is_absent(node)) {
        return fallback;
    }
    bool value{fallback};
    if (!node.IsScalar() || !YAML::convert<bool>::decode(node, value)) {
        throw SchemaError(fmt::format("{} must be a boolean", field));
    }
    return value;
}

[[nodiscard]] std::vector<std::string>
read_string_sequence(const YAML::Node& node, const std::string& field) {
    std::vector<std::string> result;
    if (is_absent(node)) {
        return result;
    }
    if (!node.IsSequence()) {
        throw SchemaError(fmt::format("{} must be a sequence", field));
    }
    result.reserve(node.size());
    std::size_t index = 0;
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            throw SchemaError(fmt::format("{}[{}] must be a string", field, index));
        }
        result.push_back(item.Scalar());
        ++index;
    }
    return result;
}

// 키가 없거나 null 이면 std::nullopt, "[]" 는 빈 vector (명시된 빈 목록)
[[nodiscard]] std::optional<std::vector<std::string>>
read_optional_string_sequence(const YAML::Node& node, const std::string& field) {
    if (is_absent(node)) {
        return std::nullopt;
    }
    return read_string_sequence(node, field);
}

[[nodiscard]] Value read_value(const YAML::Node& node, const std::string& field,
                               std::size_t max_depth) {
    auto value = PolicyLoader::to_value(node, max_depth);
    if (!value) {
        throw SchemaError(fmt::format("{}: {} ({})", field, value.error().message,
                                      to_string(value.error().code)));
    }
    return std::move(*value);
}

[[nodiscard]] std::optional<Value>
read_optional_value(const YAML::Node& node, const std::string& field, std::size_t max_depth) {
    if (is_absent(node)) {
        return std::nullopt;
    }
    return read_value(node, field, max_depth);
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: LabelSelector 파싱
// selector YAML:
//   matchLabels:      { app: nginx }
//   matchExpressions: [ { key: tier, operator: In, values: [web] } ]
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<LabelSelector>
parse_selector(const YAML::Node& node, const std::string& field) {
    if (is_absent(node)) {
        return std::nullopt;
    }
    require_map(node, field);

    LabelSelector selector{};

    const YAML::Node labels = node["matchLabels"];
    if (!is_absent(labels)) {
        require_map(labels, field + ".matchLabels");
        for (const auto& kv : labels) {
            if (!kv.first.IsScalar()) {
                throw SchemaError(fmt::format("{}.matchLabels keys must be strings", field));
            }
            const std::string key = kv.first.Scalar();
            selector.match_labels.emplace_back(
                key, read_string(kv.second, fmt::format("{}.matchLabels.{}", field, key)));
        }
    }

    const YAML::Node expressions = node["matchExpressions"];
    if (!is_absent(expressions)) {
        if (!expressions.IsSequence()) {
            throw SchemaError(fmt::format("{}.matchExpressions must be a sequence", field));
        }
        std::size_t index = 0;
        for (const auto& item : expressions) {
            const std::string item_field = fmt::format("{}.matchExpressions[{}]", field, index);
            require_map(item, item_field);

            LabelSelectorRequirement req{};
            req.key    = read_string(item["key"], item_field + ".key");
            req.op     = read_string(item["operator"], item_field + ".operator");
            req.values = read_string_sequence(item["values"], item_field + ".values");
            selector.match_expressions.push_back(std::move(req));
            ++index;
        }
    }

    return selector;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: match / exclude 블록 파싱 (resources 하위만 사용)
// ---------------------------------------------------------------------------
[[nodiscard]] ResourceDescription
parse_resource_description(const YAML::Node& block, const std::string& field) {
    ResourceDescription rd{};
    if (is_absent(block)) {
        return rd;
    }
    require_map(block, field);

    const YAML::Node resources = block["resources"];
    if (is_absent(resources)) {
        return rd;
    }
    const std::string res_field = field + ".resources";
    require_map(resources, res_field);

    rd.kinds      = read_optional_string_sequence(resources["kinds"], res_field + ".kinds");
    rd.name       = read_string(resources["name"], res_field + ".name");
    rd.namespaces =
        read_optional_string_sequence(resources["namespaces"], res_field + ".namespaces");
    rd.selector   = parse_selector(resources["selector"], res_field + ".selector");
    return rd;
}

[[nodiscard]] Patch parse_patch(const YAML::Node& node, const std::string& field,
                                std::size_t max_depth) {
    require_map(node, field);

    Patch patch{};
    patch.path      = read_string(node["path"], field + ".path");
    patch.operation = read_string(node["op"], field + ".op");
    patch.value     = read_optional_value(node["value"], field + ".value", max_depth);
    return patch;
}

[[nodiscard]] Mutation parse_mutation(const YAML::Node& node, const std::string& field,
                                      std::size_t max_depth) {
    Mutation mutation{};
    if (is_absent(node)) {
        return mutation;
    }
    require_map(node, field);

    mutation.overlay = read_optional_value(node["overlay"], field + ".overlay", max_depth);

    const YAML::Node patches = node["patches"];
    if (!is_absent(patches)) {
        if (!patches.IsSequence()) {
            throw SchemaError(fmt::format("{}.patches must be a sequence", field));
        }
        std::vector<Patch> parsed;
        parsed.reserve(patches.size());
        std::size_t index = 0;
        for (const auto& item : patches) {
            parsed.push_back(
                parse_patch(item, fmt::format("{}.patches[{}]", field, index), max_depth));
            ++index;
        }
        mutation.patches = std::move(parsed);
    }
    return mutation;
}

[[nodiscard]] Validation parse_validation(const YAML::Node& node, const std::string& field,
                                          std::size_t max_depth) {
    Validation validation{};
    if (is_absent(node)) {
        return validation;
    }
    require_map(node, field);

    validation.message = read_string(node["message"], field + ".message");
    validation.pattern = read_optional_value(node["pattern"], field + ".pattern", max_depth);

    const YAML::Node any_pattern = node["anyPattern"];
    if (!is_absent(any_pattern)) {
        if (!any_pattern.IsSequence()) {
            throw SchemaError(fmt::format("{}.anyPattern must be a sequence", field));
        }
        std::vector<Value> patterns;
        patterns.reserve(any_pattern.size());
        std::size_t index = 0;
        for (const auto& item : any_pattern) {
            patterns.push_back(
                read_value(item, fmt::format("{}.anyPattern[{}]", field, index), max_depth));
            ++index;
        }
        validation.any_pattern = std::move(patterns);
    }
    return validation;
}

[[nodiscard]] Generation parse_generation(const YAML::Node& node, const std::string& field,
                                          std::size_t max_depth) {
    Generation generation{};
    if (is_absent(node)) {
        return generation;
    }
    require_map(node, field);

    generation.kind = read_string(node["kind"], field + ".kind");
    generation.name = read_string(node["name"], field + ".name");
    generation.data = read_optional_value(node["data"], field + ".data", max_depth);

    const YAML::Node clone = node["clone"];
    if (!is_absent(clone)) {
        require_map(clone, field + ".clone");
        generation.clone.namespace_name = read_string(clone["namespace"], field + ".clone.namespace");
        generation.clone.name           = read_string(clone["name"], field + ".clone.name");
    }
    return generation;
}

[[nodiscard]] Rule parse_rule(const YAML::Node& node, const std::string& field,
                              std::size_t max_depth) {
    require_map(node, field);

    Rule rule{};
    rule.name              = read_string(node["name"], field + ".name");
    rule.match_resources   = parse_resource_description(node["match"], field + ".match");
    rule.exclude_resources = parse_resource_description(node["exclude"], field + ".exclude");
    rule.mutation          = parse_mutation(node["mutate"], field + ".mutate", max_depth);
    rule.validation        = parse_validation(node["validate"], field + ".validate", max_depth);
    rule.generation        = parse_generation(node["generate"], field + ".generate", max_depth);
    return rule;
}

[[nodiscard]] ValidationFailureAction parse_failure_action(const std::string& raw) {
    std::string lowered = raw;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered.empty() || lowered == "audit") {
        return ValidationFailureAction::kAudit;
    }
    if (lowered == "enforce") {
        return ValidationFailureAction::kEnforce;
    }
    throw SchemaError(fmt::format(
        "spec.validationFailureAction '{}' is not 'enforce' or 'audit'", raw));
}

[[nodiscard]] ClusterPolicy parse_policy(const YAML::Node& root, std::size_t max_depth) {
    ClusterPolicy policy{};

    const YAML::Node metadata = root["metadata"];
    if (!is_absent(metadata)) {
        require_map(metadata, "metadata");
        policy.name = read_string(metadata["name"], "metadata.name");
    }

    const YAML::Node spec = root["spec"];
    if (is_absent(spec)) {
        return policy;
    }
    require_map(spec, "spec");

    policy.validation_failure_action = parse_failure_action(
        read_string(spec["validationFailureAction"], "spec.validationFailureAction"));
    policy.background = read_bool(spec["background"], "spec.background", policy.background);

    const YAML::Node rules = spec["rules"];
    if (!is_absent(rules)) {
        if (!rules.IsSequence()) {
            throw SchemaError("spec.rules must be a sequence");
        }
        policy.rules.reserve(rules.size());
        std::size_t index = 0;
        for (const auto& item : rules) {
            policy.rules.push_back(
                parse_rule(item, fmt::format("spec.rules[{}]", index), max_depth));
            ++index;
        }
    }

    return policy;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 최상위 노드 → ClusterPolicy (예외 → std::unexpected 변환 지점)
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<ClusterPolicy, std::string>
parse_document(const YAML::Node& root, std::string_view source, std::size_t max_depth) {
    if (!root || !root.IsMap()) {
        const std::string err = fmt::format(
            "policy_loader: '{}' is not a valid YAML map (top-level)", source);
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    try {
        ClusterPolicy policy = parse_policy(root, max_depth);
        spdlog::info("policy_loader: policy '{}' loaded from '{}', rules={}",
                     policy.name, source, policy.rules.size());
        return policy;
    } catch (const SchemaError& e) {
        const std::string err = fmt::format(
            "policy_loader: invalid policy document '{}': {}", source, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "policy_loader: YAML error in '{}': {}", source, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }
}

}  // namespace

// ---------------------------------------------------------------------------
// PolicyLoader::to_value 구현
// ---------------------------------------------------------------------------
std::expected<Value, ValidationError>
PolicyLoader::to_value(const YAML::Node& node, std::size_t max_depth) {
    return convert_node(node, "/", 1, max_depth);
}

// ---------------------------------------------------------------------------
// PolicyLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<ClusterPolicy, std::string>
PolicyLoader::load(const std::filesystem::path& policy_path, std::size_t max_depth) {
    // 1. 경로 정규화 (path traversal 방지 목적)
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(policy_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "policy_loader: cannot resolve policy path '{}': {}",
            policy_path.string(), ec.message()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::debug("policy_loader: loading policy from '{}'", canonical_path.string());

    // 2. YAML 파일 로드 (yaml-cpp 예외 처리)
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "policy_loader: cannot open file '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        // 라인 번호 포함한 상세 에러 메시지
        const std::string err = fmt::format(
            "policy_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(),
            e.mark.line + 1,   // yaml-cpp는 0-based
            e.mark.column + 1,
            e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "policy_loader: YAML error in '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    // 3. 정책 구조 파싱
    return parse_document(root, canonical_path.string(), max_depth);
}

// ---------------------------------------------------------------------------
// PolicyLoader::parse 구현
// ---------------------------------------------------------------------------
std::expected<ClusterPolicy, std::string>
PolicyLoader::parse(std::string_view yaml_text, std::string_view source,
                    std::size_t max_depth) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string{yaml_text});
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "policy_loader: YAML parse error in '{}' at line {}, col {}: {}",
            source, e.mark.line + 1, e.mark.column + 1, e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "policy_loader: YAML error in '{}': {}", source, e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    return parse_document(root, source, max_depth);
}
