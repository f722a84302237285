// ---------------------------------------------------------------------------
// batch_validator.cpp
//
// thread_pool 기반 일괄 검증 구현.
//
// [작업 분배]
// 입력 i 번째 항목은 결과 벡터 i 번째 슬롯에만 기록한다.
// 슬롯이 겹치지 않으므로 결과 벡터에 별도 잠금이 필요 없고,
// pool.join() 이후에 읽으므로 가시성도 보장된다.
// ---------------------------------------------------------------------------

#include "batch/batch_validator.hpp"

#include <algorithm>
#include <exception>
#include <functional>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <spdlog/spdlog.h>

#include "policy/policy_loader.hpp"

std::vector<BatchResult>
run_batch_tasks(std::size_t count, std::size_t workers,
                const std::function<std::string(std::size_t)>& source_of,
                const std::function<BatchResult(std::size_t)>& task) {
    std::vector<BatchResult> results(count);
    if (count == 0) {
        return results;
    }

    boost::asio::thread_pool pool{std::clamp<std::size_t>(workers, 1, count)};
    for (std::size_t i = 0; i < count; ++i) {
        boost::asio::post(pool, [&results, &source_of, &task, i]() {
            try {
                results[i] = task(i);
            } catch (const std::exception& e) {
                spdlog::error("batch_validator: task {} failed: {}", i, e.what());
                BatchResult failed{};
                failed.source     = source_of(i);
                failed.load_error = e.what();
                results[i]        = std::move(failed);
            }
        });
    }
    pool.join();
    return results;
}

namespace {

[[nodiscard]] std::chrono::microseconds elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
}

}  // namespace

BatchValidator::BatchValidator(ValidatorOptions  options,
                               std::size_t       workers,
                               ValidationStats*  stats,
                               StructuredLogger* logger) noexcept
    : validator_(options)
    , workers_(std::clamp<std::size_t>(workers, 1, kMaxWorkers))
    , max_document_depth_(std::max(options.max_pattern_depth,
                                   PolicyLoader::kDefaultMaxDocumentDepth))
    , stats_(stats)
    , logger_(logger)
{}

std::vector<BatchResult>
BatchValidator::validate_files(const std::vector<std::filesystem::path>& paths) const {
    spdlog::debug("batch_validator: validating {} file(s) with {} worker(s)",
                  paths.size(), workers_);
    return run_batch_tasks(
        paths.size(), workers_,
        [&paths](std::size_t i) { return paths[i].string(); },
        [this, &paths](std::size_t i) { return check_file(paths[i]); });
}

std::vector<BatchResult>
BatchValidator::validate_policies(const std::vector<ClusterPolicy>& policies) const {
    const auto source_of = [](std::size_t i) { return fmt::format("policy[{}]", i); };
    return run_batch_tasks(policies.size(), workers_, source_of,
                           [this, &policies, &source_of](std::size_t i) {
                               return check_policy(policies[i], source_of(i));
                           });
}

BatchResult BatchValidator::check_policy(const ClusterPolicy& policy, std::string source) const {
    const auto start = std::chrono::steady_clock::now();

    BatchResult result{};
    result.source = std::move(source);
    result.policy = policy.name;
    result.rules  = policy.rules.size();

    if (auto validated = validator_.validate(policy); !validated) {
        result.errors = std::move(validated.error());
    }
    result.duration = elapsed_since(start);

    if (stats_ != nullptr) {
        stats_->on_policy_checked(result.rules, result.errors.size());
    }
    if (logger_ != nullptr) {
        logger_->log_validation(ValidationLog{
            .source    = result.source,
            .policy    = result.policy,
            .rules     = result.rules,
            .accepted  = result.errors.empty(),
            .errors    = result.errors,
            .timestamp = std::chrono::system_clock::now(),
            .duration  = result.duration,
        });
    }
    return result;
}

BatchResult BatchValidator::check_file(const std::filesystem::path& path) const {
    auto loaded = PolicyLoader::load(path, max_document_depth_);
    if (!loaded) {
        if (stats_ != nullptr) {
            stats_->on_load_failure();
        }
        if (logger_ != nullptr) {
            logger_->log_load_failure(LoadFailureLog{
                .source    = path.string(),
                .reason    = loaded.error(),
                .timestamp = std::chrono::system_clock::now(),
            });
        }

        BatchResult result{};
        result.source     = path.string();
        result.load_error = std::move(loaded.error());
        return result;
    }
    return check_policy(*loaded, path.string());
}
