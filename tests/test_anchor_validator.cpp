// ---------------------------------------------------------------------------
// test_anchor_validator.cpp
//
// ExistenceAnchorValidator 단위 테스트.
//
// [테스트 범위]
// - ^() anchor 가 array 에 바인딩되면 통과
// - array 가 아닌 값에 바인딩되면 kAnchorNotOnArray (경로 + 메시지)
// - 빈 array 는 kEmptyPatternArray
// - 다른 anchor 종류는 경로에서 장식이 제거된다
// - 첫 위반에서 중단
// - 깊이 상한 kPatternTooDeep
// ---------------------------------------------------------------------------

#include "pattern/anchor_validator.hpp"

#include <gtest/gtest.h>

namespace {

// privileged 컨테이너 금지 pattern
Value privileged_pattern() {
    return Value::Map{
        {"spec", Value::Map{
            {"^(containers)", Value::Array{
                Value::Map{
                    {"=(securityContext)", Value::Map{
                        {"privileged", "false"},
                    }},
                },
            }},
        }},
    };
}

// depth 개의 Map 이 중첩된 트리 (leaf 포함 depth + 1 노드)
Value nested_maps(std::size_t depth) {
    Value node = "leaf";
    for (std::size_t i = 0; i < depth; ++i) {
        node = Value::Map{{"a", node}};
    }
    return node;
}

}  // namespace

// ---------------------------------------------------------------------------
// 1. 정상 pattern
// ---------------------------------------------------------------------------
TEST(ExistenceAnchorValidator, WellFormedPattern_Passes) {
    const ExistenceAnchorValidator validator;
    EXPECT_TRUE(validator.validate(privileged_pattern()).has_value());
}

TEST(ExistenceAnchorValidator, ScalarsAndPlainMaps_Pass) {
    const ExistenceAnchorValidator validator;
    EXPECT_TRUE(validator.validate(Value{nullptr}).has_value());
    EXPECT_TRUE(validator.validate(Value{"nginx"}).has_value());
    EXPECT_TRUE(validator.validate(Value::Map{}).has_value());
    EXPECT_TRUE(validator.validate(Value::Map{{"replicas", 3}}).has_value());
}

// ---------------------------------------------------------------------------
// 2. kAnchorNotOnArray
// ---------------------------------------------------------------------------
TEST(ExistenceAnchorValidator, AnchorOnMap_ReportsContainerPath) {
    const ExistenceAnchorValidator validator;
    const Value pattern = Value::Map{
        {"spec", Value::Map{
            {"containers", Value::Map{{"^(name)", "nginx"}}},
        }},
    };

    const auto result = validator.validate(pattern);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::kAnchorNotOnArray);
    EXPECT_EQ(result.error().path, "/spec/containers/");
    EXPECT_EQ(result.error().message,
              "existing anchor at /spec/containers/^(name) must be of type array, found: string");
}

TEST(ExistenceAnchorValidator, AnchorOnMapValue_ReportsMapType) {
    const ExistenceAnchorValidator validator;
    const Value pattern = Value::Map{
        {"^(volumes)", Value::Map{{"hostPath", "*"}}},
    };

    const auto result = validator.validate(pattern);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::kAnchorNotOnArray);
    EXPECT_EQ(result.error().path, "/");
    EXPECT_NE(result.error().message.find("found: map"), std::string::npos);
}

TEST(ExistenceAnchorValidator, AnchorOnNull_ReportsNullType) {
    const ExistenceAnchorValidator validator;
    const auto result = validator.validate(Value::Map{{"^(volumes)", nullptr}});
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("found: null"), std::string::npos);
}

TEST(ExistenceAnchorValidator, AnchorTextAsScalarValue_Rejected) {
    const ExistenceAnchorValidator validator;
    const Value pattern = Value::Map{
        {"spec", Value::Map{{"containers", "^(name)"}}},
    };

    const auto result = validator.validate(pattern);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::kAnchorNotOnArray);
    EXPECT_EQ(result.error().path, "/spec/containers/");
}

// ---------------------------------------------------------------------------
// 3. kEmptyPatternArray
// ---------------------------------------------------------------------------
TEST(ExistenceAnchorValidator, EmptyArray_Rejected) {
    const ExistenceAnchorValidator validator;
    const Value pattern = Value::Map{
        {"spec", Value::Map{{"containers", Value::Array{}}}},
    };

    const auto result = validator.validate(pattern);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::kEmptyPatternArray);
    EXPECT_EQ(result.error().path, "/spec/containers/");
}

TEST(ExistenceAnchorValidator, EmptyArrayUnderExistenceAnchor_Rejected) {
    const ExistenceAnchorValidator validator;
    const auto result = validator.validate(Value::Map{{"^(containers)", Value::Array{}}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::kEmptyPatternArray);
    EXPECT_EQ(result.error().path, "/containers/");
}

// ---------------------------------------------------------------------------
// 4. 경로 구성
// ---------------------------------------------------------------------------
TEST(ExistenceAnchorValidator, NestedAnchorInArrayElement_UsesIndexAndStrippedKeys) {
    const ExistenceAnchorValidator validator;
    const Value pattern = Value::Map{
        {"spec", Value::Map{
            {"^(containers)", Value::Array{
                Value::Map{{"=(securityContext)", Value::Map{{"^(capabilities)", "NET_ADMIN"}}}},
            }},
        }},
    };

    const auto result = validator.validate(pattern);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::kAnchorNotOnArray);
    EXPECT_EQ(result.error().path, "/spec/containers/0/securityContext/");
}

TEST(ExistenceAnchorValidator, CustomRootPath_IsPrefix) {
    const ExistenceAnchorValidator validator;
    const auto result = validator.validate(Value::Map{{"^(a)", 1}}, "/root/");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().path, "/root/");
}

// ---------------------------------------------------------------------------
// 5. 첫 위반에서 중단
// ---------------------------------------------------------------------------
TEST(ExistenceAnchorValidator, StopsAtFirstViolationInDocumentOrder) {
    const ExistenceAnchorValidator validator;
    const Value pattern = Value::Map{
        {"first", Value::Array{}},
        {"second", Value::Map{{"^(x)", 1}}},
    };

    const auto result = validator.validate(pattern);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::kEmptyPatternArray);
    EXPECT_EQ(result.error().path, "/first/");
}

// ---------------------------------------------------------------------------
// 6. 깊이 상한
// ---------------------------------------------------------------------------
TEST(ExistenceAnchorValidator, DepthAtLimit_Passes) {
    // Map 4개 + leaf = 깊이 5
    const ExistenceAnchorValidator validator{5};
    EXPECT_TRUE(validator.validate(nested_maps(4)).has_value());
}

TEST(ExistenceAnchorValidator, DepthOverLimit_PatternTooDeep) {
    const ExistenceAnchorValidator validator{5};
    const auto result = validator.validate(nested_maps(5));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationErrorCode::kPatternTooDeep);
    EXPECT_EQ(result.error().path, "/a/a/a/a/a/");
}

TEST(ExistenceAnchorValidator, DefaultMaxDepth) {
    const ExistenceAnchorValidator validator;
    EXPECT_EQ(validator.max_depth(), ExistenceAnchorValidator::kDefaultMaxDepth);
    EXPECT_TRUE(validator.validate(nested_maps(63)).has_value());
    EXPECT_FALSE(validator.validate(nested_maps(64)).has_value());
}
