/**
 * @file ReconciliationService.cpp
 * @brief Implementation of ReconciliationService.
 */

#include "application/ReconciliationService.hpp"

#include <algorithm>
#include <iostream>
#include <system_error>
#include <thread>

#include "domain/CaseNumber.hpp"

namespace casechain::application {

ReconciliationService::ReconciliationService(domain::ReconciliationConfig config)
    : m_config(std::move(config)), m_grouper(m_config), m_resolver(m_config) {}

unsigned ReconciliationService::GetWorkerCount() const {
    unsigned requested = m_config.workerThreads;
    if (requested == 0) requested = std::thread::hardware_concurrency();
    return std::clamp(requested, 1u, domain::ReconciliationConfig::kMaxWorkerThreads);
}

bool ReconciliationService::IsWellFormed(const domain::CaseRecord& record) {
    return !domain::CaseNumber::DigitsOnly(record.rawNumber).empty();
}

template <typename Work>
void ReconciliationService::RunPartitioned(std::size_t count, Work&& work) const {
    const std::size_t workers = std::min<std::size_t>(GetWorkerCount(), count);
    if (workers <= 1) {
        work(0, count);
        return;
    }

    const std::size_t chunk = (count + workers - 1) / workers;
    std::vector<std::thread> threads;
    threads.reserve(workers);
    auto joinAll = [&threads]() {
        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
    };

    try {
        for (std::size_t first = 0; first < count; first += chunk) {
            const std::size_t last = std::min(count, first + chunk);
            threads.emplace_back([&work, first, last]() { work(first, last); });
        }
    } catch (const std::system_error& e) {
        // Started workers still reference @p work; let them finish first.
        joinAll();
        std::cerr << "[ReconciliationService] Could not start worker thread: " << e.what() << std::endl;
        throw;
    }
    joinAll();
}

ReconciliationResult ReconciliationService::Reconcile(const std::vector<domain::CaseRecordPtr>& batch) const {
    ReconciliationResult result;

    for (std::size_t i = 0; i < batch.size(); ++i) {
        if (!batch[i]) {
            throw domain::InvalidBatchError("Batch entry " + std::to_string(i) + " is null.");
        }
        if (!IsWellFormed(*batch[i])) {
            std::cerr << "[ReconciliationService] Skipping record " << i
                      << ": case number has no digits (\"" << batch[i]->rawNumber << "\")" << std::endl;
            ++result.malformed;
            continue;
        }
        result.records.push_back(batch[i]);
    }

    const auto& records = result.records;
    std::cout << "[ReconciliationService] Reconciling " << records.size() << " records ("
              << result.malformed << " malformed skipped)" << std::endl;

    // Independent per-record stages: each worker writes only its own range.
    domain::KeyTable keys = m_grouper.makeKeyTable(records.size());
    std::vector<std::optional<domain::RecordOutcome>> outcomes(records.size());
    const auto& interpreter = m_resolver.interpreter();

    RunPartitioned(records.size(), [&](std::size_t first, std::size_t last) {
        m_grouper.fillKeys(records, first, last, keys);
        for (std::size_t i = first; i < last; ++i) {
            outcomes[i] = interpreter.interpretRecord(*records[i]);
        }
    });

    domain::GroupingResult grouping = m_grouper.buildChains(records, keys);

    for (const auto& ambiguity : grouping.ambiguities) {
        std::cerr << "[ReconciliationService] Ambiguous match for " << records[ambiguity.probeIndex]->rawNumber
                  << ": chose " << records[ambiguity.chosenIndex]->rawNumber
                  << " over " << ambiguity.tiedWith.size() << " tied candidate(s) at score "
                  << ambiguity.score << std::endl;
    }

    auto stepsOf = [&](const domain::CaseChain& chain) {
        std::vector<domain::ChainStep> steps;
        for (const auto& member : chain.members) {
            steps.push_back({member.record, outcomes[member.index]});
        }
        return steps;
    };

    for (auto& chain : grouping.chains) {
        domain::ResolvedOutcome outcome = m_resolver.resolve(stepsOf(chain));
        result.chains.push_back({std::move(chain), std::move(outcome)});
    }

    for (const auto& member : grouping.residual) {
        domain::CaseChain single;
        single.id = result.chains.size() + result.residual.size();
        single.method = domain::LinkMethod::Unlinked;
        single.members.push_back(member);
        domain::ResolvedOutcome outcome = m_resolver.resolve(stepsOf(single));
        result.residual.push_back({std::move(single), std::move(outcome)});
    }

    result.superseded = std::move(grouping.superseded);
    result.ambiguities = std::move(grouping.ambiguities);
    result.summary = Summarize(result);

    std::cout << "[ReconciliationService] Built " << result.chains.size() << " chains, "
              << result.residual.size() << " residual, " << result.superseded.size() << " superseded" << std::endl;
    return result;
}

ReconciliationSummary ReconciliationService::Summarize(const ReconciliationResult& result) {
    ReconciliationSummary summary;
    summary.records = result.records.size();
    summary.malformed = result.malformed;
    summary.chains = result.chains.size();
    summary.residual = result.residual.size();
    summary.superseded = result.superseded.size();
    summary.ambiguous = result.ambiguities.size();

    for (const auto& resolved : result.chains) {
        summary.chainsBySize[resolved.chain.size()]++;
        summary.byConfidence[resolved.outcome.confidence]++;

        const auto& favorable = resolved.outcome.finalFavorableToEmployee;
        if (!favorable) {
            summary.unknown++;
        } else if (*favorable) {
            summary.favorable++;
        } else {
            summary.unfavorable++;
        }
        if (resolved.outcome.status == domain::ResolutionStatus::ReformedUnconfirmed) {
            summary.reformed++;
        }
        if (resolved.outcome.usedEmbeddedEvidence) {
            summary.embeddedEvidence++;
        }
    }
    return summary;
}

} // namespace casechain::application
