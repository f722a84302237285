// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷 (UTC, 밀리초)
// ---------------------------------------------------------------------------
std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

// ---------------------------------------------------------------------------
// Helper: JSON 문자열 이스케이프
// ---------------------------------------------------------------------------
std::string escape_json_string(std::string_view str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (const unsigned char ch : str) {
        switch (ch) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (ch < 0x20) {
                    result += fmt::format("\\u{:04x}", static_cast<unsigned int>(ch));
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }

    return result;
}

}  // namespace

// ---------------------------------------------------------------------------
// parse_log_level
// ---------------------------------------------------------------------------
std::optional<LogLevel> parse_log_level(std::string_view text) {
    std::string lowered{text};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Helper: spdlog 로그 레벨 변환
// ---------------------------------------------------------------------------
spdlog::level::level_enum StructuredLogger::to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::kDebug:
            return spdlog::level::debug;
        case LogLevel::kInfo:
            return spdlog::level::info;
        case LogLevel::kWarn:
            return spdlog::level::warn;
        case LogLevel::kError:
            return spdlog::level::err;
        default:
            return spdlog::level::info;
    }
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        // 로그 디렉터리 생성
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        // 싱크 생성: stdout + rotating file
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());

        // Rotating file sink (10MB, 3개 파일 유지)
        const std::size_t max_file_size = 10 * 1024 * 1024;
        const std::size_t max_files     = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), max_file_size, max_files));

        // 로거 생성 (스레드 안전)
        logger_ = std::make_shared<spdlog::logger>(std::string{kLoggerName},
                                                   sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level));

        // 기본 패턴: 타임스탬프만 (구조화 로그는 각 메서드에서 JSON으로 생성)
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");

        // 매 로그마다 파일을 플러시
        logger_->flush_on(spdlog::level::trace);

        spdlog::register_logger(logger_);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (!logger_) {
        return;  // 이동된 객체
    }
    // 소멸자에서 예외를 전파하지 않는다. spdlog 오류는 stderr 로만 알린다.
    try {
        logger_->flush();
        spdlog::drop(std::string{kLoggerName});
    } catch (const std::exception& ex) {
        std::fprintf(stderr, "structured_logger: shutdown failed: %s\n", ex.what());
    }
}

// ---------------------------------------------------------------------------
// to_json(ValidationLog)
// ---------------------------------------------------------------------------
std::string StructuredLogger::to_json(const ValidationLog& entry) {
    std::ostringstream json;
    json << R"({"event":"policy_validated","source":")" << escape_json_string(entry.source)
         << R"(","policy":")" << escape_json_string(entry.policy)
         << R"(","rules":)" << entry.rules
         << R"(,"accepted":)" << (entry.accepted ? "true" : "false")
         << R"(,"errors":[)";

    for (std::size_t i = 0; i < entry.errors.size(); ++i) {
        const auto& err = entry.errors[i];
        if (i > 0) {
            json << ',';
        }
        json << R"({"code":")" << to_string(err.code)
             << R"(","rule":")" << escape_json_string(err.rule)
             << R"(","path":")" << escape_json_string(err.path)
             << R"(","message":")" << escape_json_string(err.message) << R"("})";
    }

    json << R"(],"timestamp":")" << format_iso8601(entry.timestamp)
         << R"(","duration_us":)" << entry.duration.count() << '}';
    return json.str();
}

// ---------------------------------------------------------------------------
// to_json(LoadFailureLog)
// ---------------------------------------------------------------------------
std::string StructuredLogger::to_json(const LoadFailureLog& entry) {
    std::ostringstream json;
    json << R"({"event":"policy_load_failed","source":")" << escape_json_string(entry.source)
         << R"(","reason":")" << escape_json_string(entry.reason)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp) << R"("})";
    return json.str();
}

// ---------------------------------------------------------------------------
// log_validation
// ---------------------------------------------------------------------------
void StructuredLogger::log_validation(const ValidationLog& entry) {
    const LogLevel level = entry.accepted ? LogLevel::kInfo : LogLevel::kWarn;
    if (!logger_ || static_cast<int>(min_level_) > static_cast<int>(level)) {
        return;
    }
    logger_->log(to_spdlog_level(level), to_json(entry));
}

// ---------------------------------------------------------------------------
// log_load_failure
// ---------------------------------------------------------------------------
void StructuredLogger::log_load_failure(const LoadFailureLog& entry) {
    if (!logger_) {
        return;
    }
    logger_->error(to_json(entry));
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}
