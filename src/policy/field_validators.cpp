// ---------------------------------------------------------------------------
// field_validators.cpp
//
// [오류 메시지]
// 메시지는 정책 작성자에게 그대로 노출되므로 rule 이름 / kind / op 를
// 작은따옴표로 감싸 포함한다. rule 태깅(ValidationError::rule)은
// PolicyValidator 가 수행한다.
// ---------------------------------------------------------------------------

#include "policy/field_validators.hpp"

#include <string>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "policy/label_selector.hpp"

namespace {

[[nodiscard]] std::unexpected<ValidationError> fail(ValidationErrorCode code, std::string message) {
    return std::unexpected(ValidationError{
        .code    = code,
        .message = std::move(message),
    });
}

}  // namespace

std::expected<void, ValidationError>
validate_resource_description(const ResourceDescription& rd) {
    if (rd.is_empty()) {
        return {};
    }

    if (!rd.kinds || rd.kinds->empty()) {
        return fail(ValidationErrorCode::kMissingResourceKind, "field Kind is not specified");
    }

    if (rd.selector) {
        auto requirements = compile_selector(*rd.selector);
        if (!requirements) {
            return std::unexpected(std::move(requirements.error()));
        }
        if (requirements->empty()) {
            return fail(ValidationErrorCode::kEmptySelectorRequirements,
                        "the requirements are not specified in selector");
        }
    }

    return {};
}

std::expected<void, ValidationError>
validate_overlay_pattern(const Rule& rule) {
    const Validation& validation = rule.validation;
    if (!validation.is_set()) {
        return {};
    }

    const bool has_pattern     = validation.has_pattern();
    const bool has_any_pattern = validation.has_any_pattern();

    if (!has_pattern && !has_any_pattern) {
        return fail(ValidationErrorCode::kMissingPattern,
                    fmt::format("neither pattern nor anyPattern found in rule '{}'", rule.name));
    }

    if (has_pattern && has_any_pattern) {
        return fail(ValidationErrorCode::kConflictingPatternFields,
                    fmt::format("either pattern or anyPattern is allowed in rule '{}'", rule.name));
    }

    return {};
}

std::expected<void, ValidationError>
validate_rule_type(const Rule& rule) {
    const int defined = static_cast<int>(rule.has_mutate()) +
                        static_cast<int>(rule.has_validate()) +
                        static_cast<int>(rule.has_generate());

    if (defined == 0) {
        return fail(ValidationErrorCode::kNoRuleTypeDefined,
                    fmt::format("no rule defined in '{}'", rule.name));
    }

    if (defined > 1) {
        return fail(ValidationErrorCode::kMultipleRuleTypesDefined,
                    fmt::format("multiple types of rule defined in rule '{}', "
                                "only one type of rule is allowed per rule",
                                rule.name));
    }

    return {};
}

std::expected<void, ValidationError>
validate_generation(const Generation& generation) {
    const bool has_data  = generation.data.has_value();
    const bool has_clone = generation.clone.is_set();

    if (!has_data && !has_clone) {
        return fail(ValidationErrorCode::kMissingGenerationSource,
                    fmt::format("Neither data nor clone (source) of {} is specified",
                                generation.kind));
    }

    if (has_data && has_clone) {
        return fail(ValidationErrorCode::kConflictingGenerationSource,
                    fmt::format("Both data and clone (source) of {} are specified",
                                generation.kind));
    }

    return {};
}

std::expected<void, ValidationError>
validate_patch(const Patch& patch) {
    if (patch.path.empty()) {
        return fail(ValidationErrorCode::kMissingPatchPath, "JSONPatch field 'path' is mandatory");
    }

    if (patch.operation == "add" || patch.operation == "replace") {
        if (!patch.value) {
            return fail(ValidationErrorCode::kMissingPatchValue,
                        fmt::format("JSONPatch field 'value' is mandatory for operation '{}'",
                                    patch.operation));
        }
        return {};
    }

    if (patch.operation == "remove") {
        return {};
    }

    return fail(ValidationErrorCode::kUnsupportedPatchOperation,
                fmt::format("Unsupported JSONPatch operation '{}'", patch.operation));
}
