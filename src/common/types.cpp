// ---------------------------------------------------------------------------
// types.cpp
//
// ValidationErrorCode 문자열 변환 및 오류 목록 결합.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

std::string_view to_string(ValidationErrorCode code) noexcept {
    switch (code) {
        case ValidationErrorCode::kDuplicateRuleName:           return "DuplicateRuleName";
        case ValidationErrorCode::kNoRuleTypeDefined:           return "NoRuleTypeDefined";
        case ValidationErrorCode::kMultipleRuleTypesDefined:    return "MultipleRuleTypesDefined";
        case ValidationErrorCode::kMissingResourceKind:         return "MissingResourceKind";
        case ValidationErrorCode::kInvalidSelector:             return "InvalidSelector";
        case ValidationErrorCode::kEmptySelectorRequirements:   return "EmptySelectorRequirements";
        case ValidationErrorCode::kMissingPattern:              return "MissingPattern";
        case ValidationErrorCode::kConflictingPatternFields:    return "ConflictingPatternFields";
        case ValidationErrorCode::kAnchorNotOnArray:            return "AnchorNotOnArray";
        case ValidationErrorCode::kEmptyPatternArray:           return "EmptyPatternArray";
        case ValidationErrorCode::kUnknownTreeNodeType:         return "UnknownTreeNodeType";
        case ValidationErrorCode::kMissingPatchPath:            return "MissingPatchPath";
        case ValidationErrorCode::kMissingPatchValue:           return "MissingPatchValue";
        case ValidationErrorCode::kUnsupportedPatchOperation:   return "UnsupportedPatchOperation";
        case ValidationErrorCode::kConflictingGenerationSource: return "ConflictingGenerationSource";
        case ValidationErrorCode::kMissingGenerationSource:     return "MissingGenerationSource";
        case ValidationErrorCode::kPatternTooDeep:              return "PatternTooDeep";
        case ValidationErrorCode::kMalformedDocument:           return "MalformedDocument";
        default:                                                return "Unknown";
    }
}

std::string join_errors(const ValidationErrors& errors) {
    std::string joined;
    for (std::size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) {
            joined += "; ";
        }
        joined += errors[i].message;
    }
    return joined;
}
