#pragma once

// ---------------------------------------------------------------------------
// stats_collector.hpp
//
// 정책 검증 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_policy_checked / on_load_failure:
//   BatchValidator 워커 스레드에서 concurrent 호출 안전 (atomic 사용).
// - snapshot():
//   갱신 경로와 contention 없이 읽기 가능.
//   카운터 간 원자적 일관성은 보장하지 않는다 (각 카운터는 개별 relaxed 로드).
//
// [격리 원칙]
// - 통계 갱신이 검증 결과에 영향을 주지 않도록 모든 갱신 메서드는 noexcept.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>

// ---------------------------------------------------------------------------
// ValidationStatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   reject_rate: policies_rejected / policies_checked (checked == 0 이면 0.0)
//   로드 실패는 policies_checked 에 포함되지 않는다.
// ---------------------------------------------------------------------------
struct ValidationStatsSnapshot {
    std::uint64_t                              policies_checked{0};
    std::uint64_t                              policies_accepted{0};
    std::uint64_t                              policies_rejected{0};
    std::uint64_t                              load_failures{0};
    std::uint64_t                              rules_checked{0};
    std::uint64_t                              total_errors{0};
    double                                     reject_rate{0.0};
    std::chrono::system_clock::time_point      captured_at{};
};

// ---------------------------------------------------------------------------
// ValidationStats
//   검증 이벤트를 집계하고 ValidationStatsSnapshot 을 제공한다.
// ---------------------------------------------------------------------------
class ValidationStats {
public:
    ValidationStats() noexcept
        : policies_checked_{0}
        , policies_accepted_{0}
        , policies_rejected_{0}
        , load_failures_{0}
        , rules_checked_{0}
        , total_errors_{0}
    {}

    ~ValidationStats() = default;

    // 복사 금지 (atomic 은 복사 불가)
    ValidationStats(const ValidationStats&)            = delete;
    ValidationStats& operator=(const ValidationStats&) = delete;

    // 이동 금지 (atomic 소유권 명확화)
    ValidationStats(ValidationStats&&)            = delete;
    ValidationStats& operator=(ValidationStats&&) = delete;

    // on_policy_checked
    //   정책 1건 검증 완료 시 호출.
    //   rule_count : 정책의 rule 개수
    //   error_count: 보고된 오류 개수 (0 이면 accepted)
    void on_policy_checked(std::size_t rule_count, std::size_t error_count) noexcept {
        policies_checked_.fetch_add(1, std::memory_order_relaxed);
        rules_checked_.fetch_add(rule_count, std::memory_order_relaxed);
        if (error_count == 0) {
            policies_accepted_.fetch_add(1, std::memory_order_relaxed);
        } else {
            policies_rejected_.fetch_add(1, std::memory_order_relaxed);
            total_errors_.fetch_add(error_count, std::memory_order_relaxed);
        }
    }

    // on_load_failure
    //   YAML 로드/스키마 파싱 실패 시 호출.
    void on_load_failure() noexcept {
        load_failures_.fetch_add(1, std::memory_order_relaxed);
    }

    // snapshot
    //   현재 통계의 불변 스냅샷을 반환한다.
    [[nodiscard]] ValidationStatsSnapshot snapshot() const noexcept {
        const auto checked  = policies_checked_.load(std::memory_order_relaxed);
        const auto rejected = policies_rejected_.load(std::memory_order_relaxed);

        double reject_rate = 0.0;
        if (checked > 0) {
            reject_rate = static_cast<double>(rejected) / static_cast<double>(checked);
        }

        return ValidationStatsSnapshot{
            .policies_checked  = checked,
            .policies_accepted = policies_accepted_.load(std::memory_order_relaxed),
            .policies_rejected = rejected,
            .load_failures     = load_failures_.load(std::memory_order_relaxed),
            .rules_checked     = rules_checked_.load(std::memory_order_relaxed),
            .total_errors      = total_errors_.load(std::memory_order_relaxed),
            .reject_rate       = reject_rate,
            .captured_at       = std::chrono::system_clock::now(),
        };
    }

private:
    std::atomic<std::uint64_t> policies_checked_;
    std::atomic<std::uint64_t> policies_accepted_;
    std::atomic<std::uint64_t> policies_rejected_;
    std::atomic<std::uint64_t> load_failures_;
    std::atomic<std::uint64_t> rules_checked_;
    std::atomic<std::uint64_t> total_errors_;
};
