#include "batch/batch_validator.hpp"
#include "logger/structured_logger.hpp"
#include "stats/stats_collector.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
namespace {

constexpr int kExitOk       = 0;
constexpr int kExitRejected = 1;
constexpr int kExitUsage    = 2;

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

uint32_t env_u32(const char* name, uint32_t default_val, uint32_t min_val, uint32_t max_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return default_val;
    }
    try {
        const long parsed = std::stol(val);
        if (parsed < static_cast<long>(min_val) || parsed > static_cast<long>(max_val)) {
            spdlog::warn("env {}: value {} out of range [{}, {}], using default {}",
                         name, parsed, min_val, max_val, default_val);
            return default_val;
        }
        return static_cast<uint32_t>(parsed);
    } catch (const std::invalid_argument&) {
        spdlog::warn("env {}: invalid value '{}', using default {}", name, val, default_val);
        return default_val;
    } catch (const std::out_of_range&) {
        spdlog::warn("env {}: value '{}' out of range, using default {}", name, val, default_val);
        return default_val;
    }
}

bool env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return default_val;
    }
    std::string lowered{val};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }
    spdlog::warn("env {}: invalid value '{}', using default {}", name, val, default_val);
    return default_val;
}

void print_usage(std::string_view program) {
    fmt::print(stderr,
               "usage: {} [--strict] <policy.yaml>...\n"
               "\n"
               "environment:\n"
               "  POLGUARD_LOG_LEVEL  debug|info|warn|error (default info)\n"
               "  POLGUARD_LOG_PATH   structured log file (default /tmp/polguard.log)\n"
               "  POLGUARD_MAX_DEPTH  pattern nesting limit, 1..4096 (default 64)\n"
               "  POLGUARD_STRICT     also check generate and patches (default false)\n"
               "  POLGUARD_WORKERS    validation threads, 1..64 (default 4)\n",
               program);
}

void print_result(const BatchResult& result) {
    if (result.load_error) {
        fmt::print("FAIL {}: {}\n", result.source, *result.load_error);
        return;
    }
    if (result.accepted()) {
        fmt::print("OK   {} (policy '{}', {} rule(s))\n", result.source, result.policy, result.rules);
        return;
    }
    fmt::print("FAIL {} (policy '{}', {} error(s))\n", result.source, result.policy,
               result.errors.size());
    for (const auto& err : result.errors) {
        fmt::print("  - [{}] rule '{}': {}\n", to_string(err.code), err.rule, err.message);
    }
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    const std::string_view program = argc > 0 ? argv[0] : "polguard";

    // ── 설정 로드 (환경변수 우선, 기본값 fallback) ───────────────────────
    const std::string log_level_str = env_str("POLGUARD_LOG_LEVEL", "info");
    const std::string log_path      = env_str("POLGUARD_LOG_PATH",  "/tmp/polguard.log");

    LogLevel log_level = LogLevel::kInfo;
    if (const auto parsed = parse_log_level(log_level_str)) {
        log_level = *parsed;
    } else {
        spdlog::warn("env POLGUARD_LOG_LEVEL: invalid value '{}', using default info", log_level_str);
    }
    spdlog::set_level(log_level == LogLevel::kDebug ? spdlog::level::debug
                    : log_level == LogLevel::kWarn  ? spdlog::level::warn
                    : log_level == LogLevel::kError ? spdlog::level::err
                                                    : spdlog::level::info);

    ValidatorOptions options;
    options.max_pattern_depth = env_u32("POLGUARD_MAX_DEPTH", 64, 1, 4096);
    options.strict            = env_bool("POLGUARD_STRICT", false);
    const uint32_t workers    = env_u32("POLGUARD_WORKERS", 4, 1, 64);

    // ── 인자 파싱 ───────────────────────────────────────────────────────
    std::vector<std::filesystem::path> policy_paths;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        if (arg == "--strict") {
            options.strict = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(program);
            return kExitOk;
        } else if (arg.size() > 1 && arg.front() == '-') {
            fmt::print(stderr, "{}: unknown option '{}'\n", program, arg);
            print_usage(program);
            return kExitUsage;
        } else {
            policy_paths.emplace_back(arg);
        }
    }
    if (policy_paths.empty()) {
        print_usage(program);
        return kExitUsage;
    }

    spdlog::debug("Starting polguard: {} file(s), strict={}, max_depth={}, workers={}",
                  policy_paths.size(), options.strict, options.max_pattern_depth, workers);

    // ── 구조화 로거 초기화 (실패 시 구조화 로그 없이 진행) ────────────────
    std::unique_ptr<StructuredLogger> logger;
    try {
        logger = std::make_unique<StructuredLogger>(log_level, log_path);
    } catch (const std::runtime_error& e) {
        spdlog::warn("{}; continuing without structured log", e.what());
    }

    // ── 일괄 검증 ───────────────────────────────────────────────────────
    ValidationStats stats;
    const BatchValidator batch{options, workers, &stats, logger.get()};
    const auto results = batch.validate_files(policy_paths);

    for (const auto& result : results) {
        print_result(result);
    }

    // ── 종료 처리 ───────────────────────────────────────────────────────
    const auto snap = stats.snapshot();
    spdlog::info("checked={} accepted={} rejected={} load_failures={} rules={} errors={}",
                 snap.policies_checked, snap.policies_accepted, snap.policies_rejected,
                 snap.load_failures, snap.rules_checked, snap.total_errors);

    const bool all_ok = std::all_of(results.begin(), results.end(),
                                    [](const BatchResult& r) { return r.accepted(); });
    return all_ok ? kExitOk : kExitRejected;
}
