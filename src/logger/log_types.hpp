#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - ClusterPolicy, Rule 을 직접 include 하지 않는다.
//   호출자가 정책 이름 / rule 개수만 추출해서 채운다.
// - ValidationError 는 common/types.hpp 에만 의존한다.
//
// [민감정보 취급 주의]
// - pattern 원문이나 문서 전체를 로그 구조체에 담지 않는다.
//   오류 메시지와 트리 경로만 기록한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"  // ValidationErrors

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// ValidationLog
//   정책 1건의 검증 결과 로그.
//   accepted == true 이면 errors 는 비어 있다.
// ---------------------------------------------------------------------------
struct ValidationLog {
    std::string                                source{};       // 파일 경로 또는 "<memory>"
    std::string                                policy{};       // metadata.name
    std::size_t                                rules{0};       // rule 개수
    bool                                       accepted{false};
    ValidationErrors                           errors{};
    std::chrono::system_clock::time_point      timestamp{};
    std::chrono::microseconds                  duration{0};    // 검증 소요 시간
};

// ---------------------------------------------------------------------------
// LoadFailureLog
//   YAML 로드/스키마 파싱 실패 로그.
//   reason: PolicyLoader 가 반환한 "policy_loader: ..." 메시지
// ---------------------------------------------------------------------------
struct LoadFailureLog {
    std::string                                source{};
    std::string                                reason{};
    std::chrono::system_clock::time_point      timestamp{};
};
