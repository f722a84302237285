#pragma once

// ---------------------------------------------------------------------------
// policy_loader.hpp
//
// YAML 정책 문서를 로드하여 ClusterPolicy 와 pattern Value 트리로 변환하는 로더.
//
// [설계 원칙]
// - load()/parse() 실패 시 std::unexpected(error_message) 반환.
//   부분적으로 파싱된 정책을 반환하지 않는다 (all-or-nothing).
// - 필드 이름은 정책 문서 스키마의 일부이므로 그대로 유지한다
//   (match.resources.kinds, validate.pattern, validate.anyPattern,
//    generate.data, generate.clone ...).
// - 구조 검증(anchor 배치, rule type 배타성 등)은 하지 않는다.
//   타입 불일치(예: kinds 가 sequence 가 아님)만 로드 오류로 처리한다.
//   의미 검증은 PolicyValidator 소관.
//
// [순환 의존성]
// policy_loader.hpp → rule.hpp, pattern/value.hpp (단방향만)
// ❌ rule.hpp → policy_loader.hpp 금지
//
// [보안 고려사항]
// - 정책 문서는 외부 입력이다. pattern 트리 변환 깊이를 max_depth 로 제한한다.
// - 파싱 실패 원인은 로깅하되, 문서 전체를 로그에 출력하지 말 것.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include <yaml-cpp/yaml.h>

#include "common/types.hpp"   // ValidationError
#include "pattern/value.hpp"  // Value
#include "rule.hpp"           // ClusterPolicy

// ---------------------------------------------------------------------------
// PolicyLoader
//   상태 없는 정적 로더.
// ---------------------------------------------------------------------------
class PolicyLoader {
public:
    static constexpr std::size_t kDefaultMaxDocumentDepth = 128;

    PolicyLoader()  = default;
    ~PolicyLoader() = default;

    PolicyLoader(const PolicyLoader&)            = default;
    PolicyLoader& operator=(const PolicyLoader&) = default;
    PolicyLoader(PolicyLoader&&)                 = default;
    PolicyLoader& operator=(PolicyLoader&&)      = default;

    // load
    //   지정된 경로의 YAML 파일을 읽어 ClusterPolicy 로 파싱한다.
    //
    //   성공: ClusterPolicy
    //   실패: "policy_loader: ..." 형식의 오류 메시지
    //         파일 없음, YAML 문법 오류, 스키마 타입 불일치 모두 실패로 처리한다.
    //   max_depth 는 pattern / overlay / data 트리 변환 깊이 상한 (to_value 와 동일).
    [[nodiscard]] static std::expected<ClusterPolicy, std::string>
    load(const std::filesystem::path& policy_path,
         std::size_t max_depth = kDefaultMaxDocumentDepth);

    // parse
    //   메모리 상의 YAML 문서를 파싱한다. source 는 오류 메시지용 이름.
    [[nodiscard]] static std::expected<ClusterPolicy, std::string>
    parse(std::string_view yaml_text, std::string_view source = "<memory>",
          std::size_t max_depth = kDefaultMaxDocumentDepth);

    // to_value
    //   yaml-cpp 노드를 Value 트리로 변환한다.
    //
    //   [scalar 타입 결정]
    //   - 따옴표로 감싼 scalar 는 항상 문자열
    //   - plain scalar 는 null → bool → int64 → double → 문자열 순으로 시도
    //
    //   실패:
    //   - kUnknownTreeNodeType : 정의되지 않은 노드
    //   - kMalformedDocument   : scalar 가 아닌 map key, 중복 key
    //   - kPatternTooDeep      : max_depth 초과
    [[nodiscard]] static std::expected<Value, ValidationError>
    to_value(const YAML::Node& node, std::size_t max_depth = kDefaultMaxDocumentDepth);
};
