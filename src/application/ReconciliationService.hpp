/**
 * @file ReconciliationService.hpp
 * @brief Runs a record batch through grouping and outcome resolution.
 */

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "domain/CaseGrouper.hpp"
#include "domain/InvalidBatchError.hpp"
#include "domain/OutcomeResolver.hpp"
#include "domain/ReconciliationConfig.hpp"

namespace casechain::application {

/**
 * @struct ResolvedChain
 * @brief A chain with the outcome resolved for it.
 */
struct ResolvedChain {
    domain::CaseChain chain;
    domain::ResolvedOutcome outcome;
};

/**
 * @struct ReconciliationSummary
 * @brief Completeness counts of a run.
 */
struct ReconciliationSummary {
    std::size_t records = 0;
    std::size_t malformed = 0;
    std::size_t chains = 0;
    std::map<std::size_t, std::size_t> chainsBySize; ///< Members -> chain count.
    std::size_t residual = 0;
    std::size_t superseded = 0;
    std::size_t ambiguous = 0;
    std::size_t favorable = 0;   ///< Chains resolved in the employee's favor.
    std::size_t unfavorable = 0;
    std::size_t unknown = 0;     ///< Unresolved or reformed-unconfirmed chains.
    std::size_t reformed = 0;
    std::size_t embeddedEvidence = 0;
    std::map<domain::Confidence, std::size_t> byConfidence;
};

/**
 * @struct ReconciliationResult
 * @brief Everything a run produces. Residual records are resolved alone and
 * kept out of the outcome counts.
 */
struct ReconciliationResult {
    std::vector<ResolvedChain> chains;
    std::vector<ResolvedChain> residual;
    std::vector<domain::SupersededRecord> superseded;
    std::vector<domain::AmbiguousMatch> ambiguities;
    std::vector<domain::CaseRecordPtr> records; ///< Accepted records; indices in the result refer here.
    std::size_t malformed = 0;
    ReconciliationSummary summary;
};

/**
 * @class ReconciliationService
 * @brief Orchestrates the normalizer, grouper, interpreter and resolver.
 *
 * Normalization and interpretation run over disjoint index ranges on
 * `workerThreads` threads. Grouping and resolution are sequential, so the
 * output does not depend on the thread count.
 */
class ReconciliationService {
public:
    explicit ReconciliationService(domain::ReconciliationConfig config = {});

    /**
     * @brief Reconciles one batch.
     * @throws InvalidBatchError if a record pointer is null.
     */
    ReconciliationResult Reconcile(const std::vector<domain::CaseRecordPtr>& batch) const;

    /** @brief Recomputes the completeness counts of a result. */
    static ReconciliationSummary Summarize(const ReconciliationResult& result);

    const domain::ReconciliationConfig& GetConfig() const { return m_config; }

    /** @brief Thread count actually used (resolves 0 to hardware concurrency). */
    unsigned GetWorkerCount() const;

private:
    /** @brief Splits [0, count) into contiguous ranges and runs @p work on each. */
    template <typename Work>
    void RunPartitioned(std::size_t count, Work&& work) const;

    static bool IsWellFormed(const domain::CaseRecord& record);

    domain::ReconciliationConfig m_config;
    domain::CaseGrouper m_grouper;
    domain::OutcomeResolver m_resolver;
};

} // namespace casechain::application
