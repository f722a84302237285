#pragma once

// ---------------------------------------------------------------------------
// batch_validator.hpp
//
// 여러 정책을 boost::asio::thread_pool 위에서 병렬로 로드/검증한다.
//
// [결정성]
// - 결과는 항상 입력 순서로 반환한다. 워커 완료 순서와 무관하다.
// - 정책 간 공유 상태는 통계(atomic)와 로거(spdlog _mt sink)뿐이다.
//
// [소유권]
// - stats / logger 는 호출자가 소유한다. nullptr 이면 해당 기능을 건너뛴다.
//   BatchValidator 보다 오래 살아 있어야 한다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "common/types.hpp"              // ValidationErrors
#include "logger/structured_logger.hpp"  // StructuredLogger
#include "policy/policy_validator.hpp"   // PolicyValidator, ValidatorOptions
#include "policy/rule.hpp"               // ClusterPolicy
#include "stats/stats_collector.hpp"     // ValidationStats

// ---------------------------------------------------------------------------
// BatchResult
//   정책 1건의 처리 결과.
//   load_error 가 있으면 검증은 수행되지 않았고 errors 는 비어 있다.
// ---------------------------------------------------------------------------
struct BatchResult {
    std::string                source{};
    std::string                policy{};
    std::size_t                rules{0};
    std::optional<std::string> load_error{};
    ValidationErrors           errors{};
    std::chrono::microseconds  duration{0};

    [[nodiscard]] bool accepted() const noexcept {
        return !load_error && errors.empty();
    }
};

// run_batch_tasks
//   [0, count) 작업을 workers 개 스레드에 분배하고 모두 끝날 때까지 기다린다.
//   결과 i 번째 슬롯은 task(i) 의 반환값이다.
//   task 가 예외를 던지면 해당 슬롯은 source_of(i) 와 예외 메시지(load_error)로 채워진다.
[[nodiscard]] std::vector<BatchResult>
run_batch_tasks(std::size_t count, std::size_t workers,
                const std::function<std::string(std::size_t)>& source_of,
                const std::function<BatchResult(std::size_t)>& task);

class BatchValidator {
public:
    static constexpr std::size_t kDefaultWorkers = 4;
    static constexpr std::size_t kMaxWorkers     = 64;

    // workers 는 [1, kMaxWorkers] 로 보정된다.
    explicit BatchValidator(ValidatorOptions  options,
                            std::size_t       workers = kDefaultWorkers,
                            ValidationStats*  stats   = nullptr,
                            StructuredLogger* logger  = nullptr) noexcept;

    ~BatchValidator() = default;

    BatchValidator(const BatchValidator&)            = delete;
    BatchValidator& operator=(const BatchValidator&) = delete;
    BatchValidator(BatchValidator&&)                 = delete;
    BatchValidator& operator=(BatchValidator&&)      = delete;

    // validate_files
    //   각 파일을 PolicyLoader::load 로 읽고 검증한다.
    //   로더 깊이 상한은 max(max_pattern_depth, PolicyLoader::kDefaultMaxDocumentDepth).
    [[nodiscard]] std::vector<BatchResult>
    validate_files(const std::vector<std::filesystem::path>& paths) const;

    // validate_policies
    //   이미 로드된 정책을 검증한다. source 는 "policy[i]".
    [[nodiscard]] std::vector<BatchResult>
    validate_policies(const std::vector<ClusterPolicy>& policies) const;

    [[nodiscard]] std::size_t workers() const noexcept { return workers_; }
    [[nodiscard]] std::size_t max_document_depth() const noexcept { return max_document_depth_; }

private:
    [[nodiscard]] BatchResult check_policy(const ClusterPolicy& policy,
                                           std::string source) const;
    [[nodiscard]] BatchResult check_file(const std::filesystem::path& path) const;

    PolicyValidator   validator_;
    std::size_t       workers_;
    std::size_t       max_document_depth_;
    ValidationStats*  stats_;
    StructuredLogger* logger_;
};
