#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 로거 인터페이스.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
// - 로그 1건 = JSON 1줄. 필드명은 snake_case 로 고정한다.
// - 동일 이름("polguard")으로 spdlog 레지스트리에 등록하므로
//   동시에 두 인스턴스를 만들지 않는다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

// ---------------------------------------------------------------------------
// StructuredLogger
//   ValidationLog / LoadFailureLog 를 JSON 포맷으로 기록한다.
//   내부 진단용 debug/info/warn/error 메서드도 제공한다.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    static constexpr std::string_view kLoggerName = "polguard";

    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   실패: sink 생성 실패 시 std::runtime_error
    explicit StructuredLogger(LogLevel min_level,
                              const std::filesystem::path& log_path);

    ~StructuredLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    // 이동 생성만 허용. 레지스트리 이름 "polguard" 는 한 번에 하나만 존재하므로
    // 살아 있는 두 로거 사이의 이동 대입은 성립하지 않는다.
    StructuredLogger(StructuredLogger&&)            = default;
    StructuredLogger& operator=(StructuredLogger&&) = delete;

    // log_validation
    //   검증 결과를 JSON 으로 기록한다.
    //   accepted 이면 info, 거부되면 warn 레벨.
    void log_validation(const ValidationLog& entry);

    // log_load_failure
    //   로드 실패를 error 레벨 JSON 으로 기록한다.
    void log_load_failure(const LoadFailureLog& entry);

    // JSON 직렬화 (로그 출력 없이 문자열만 생성)
    [[nodiscard]] static std::string to_json(const ValidationLog& entry);
    [[nodiscard]] static std::string to_json(const LoadFailureLog& entry);

    // 내부 진단용 spdlog 래퍼
    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    [[nodiscard]] LogLevel min_level() const noexcept { return min_level_; }

private:
    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;

    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};

// parse_log_level
//   "debug" | "info" | "warn" | "error" (대소문자 무시) → LogLevel.
//   그 외 값은 std::nullopt.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text);
