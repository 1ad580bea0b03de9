/**
 * @file CaseGrouper.cpp
 * @brief Implementation of CaseGrouper and UngroupedPool.
 */

#include "domain/CaseGrouper.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <unordered_map>

namespace casechain::domain {

// --- UngroupedPool ---

UngroupedPool::UngroupedPool(std::size_t size)
    : m_available(size, true), m_count(size) {}

bool UngroupedPool::contains(std::size_t index) const {
    return index < m_available.size() && m_available[index];
}

void UngroupedPool::take(std::size_t index) {
    if (!contains(index)) {
        throw std::logic_error("Record " + std::to_string(index) + " is already grouped.");
    }
    m_available[index] = false;
    --m_count;
}

std::vector<std::size_t> UngroupedPool::remaining() const {
    std::vector<std::size_t> out;
    out.reserve(m_count);
    for (std::size_t i = 0; i < m_available.size(); ++i) {
        if (m_available[i]) out.push_back(i);
    }
    return out;
}

std::vector<std::size_t> UngroupedPool::remaining(Tier tier, const std::vector<CaseRecordPtr>& records) const {
    std::vector<std::size_t> out;
    for (std::size_t i = 0; i < m_available.size(); ++i) {
        if (m_available[i] && records[i]->tier == tier) out.push_back(i);
    }
    return out;
}

// --- CaseGrouper ---

CaseGrouper::CaseGrouper(IdentifierNormalizer normalizer, SimilarityScorer scorer, std::vector<KeyStrategy> keyPriority)
    : m_normalizer(std::move(normalizer)), m_scorer(std::move(scorer)), m_keyPriority(std::move(keyPriority)) {
    if (m_keyPriority.empty()) {
        m_keyPriority.push_back(KeyStrategy::Root);
    }
}

CaseGrouper::CaseGrouper(const ReconciliationConfig& config)
    : CaseGrouper(IdentifierNormalizer(config.alternateKeyStrategies),
                  SimilarityScorer(config.similarityWeights, config.similarityThreshold),
                  config.groupingKeyPriority) {}

KeyTable CaseGrouper::makeKeyTable(std::size_t recordCount) const {
    return KeyTable(m_keyPriority.size(), std::vector<std::optional<std::string>>(recordCount));
}

void CaseGrouper::fillKeys(const std::vector<CaseRecordPtr>& records, std::size_t first, std::size_t last, KeyTable& keys) const {
    for (std::size_t p = 0; p < m_keyPriority.size(); ++p) {
        for (std::size_t i = first; i < last && i < records.size(); ++i) {
            keys[p][i] = m_normalizer.keyFor(m_keyPriority[p], records[i]->rawNumber);
        }
    }
}

GroupingResult CaseGrouper::buildChains(const std::vector<CaseRecordPtr>& records) const {
    KeyTable keys = makeKeyTable(records.size());
    fillKeys(records, 0, records.size(), keys);
    return buildChains(records, keys);
}

GroupingResult CaseGrouper::buildChains(const std::vector<CaseRecordPtr>& records, const KeyTable& keys) const {
    GroupingResult result;
    UngroupedPool pool(records.size());

    for (std::size_t p = 0; p < m_keyPriority.size(); ++p) {
        exactPass(p, records, keys, pool, result);
    }
    fallbackPass(records, pool, result);
    residualPass(records, pool, result);

    for (std::size_t index : pool.remaining()) {
        result.residual.push_back({index, records[index], 1.0});
    }
    return result;
}

void CaseGrouper::exactPass(std::size_t strategyPos, const std::vector<CaseRecordPtr>& records,
                            const KeyTable& keys, UngroupedPool& pool, GroupingResult& result) const {
    // Groups in order of first appearance so chain ids follow the batch order.
    std::unordered_map<std::string, std::size_t> groupOfKey;
    std::vector<std::pair<std::string, std::vector<std::size_t>>> groups;

    for (std::size_t i : pool.remaining()) {
        const auto& key = keys[strategyPos][i];
        if (!key || key->empty()) continue;

        auto it = groupOfKey.find(*key);
        if (it == groupOfKey.end()) {
            groupOfKey.emplace(*key, groups.size());
            groups.push_back({*key, {i}});
        } else {
            groups[it->second].second.push_back(i);
        }
    }

    const LinkMethod method = m_keyPriority[strategyPos] == KeyStrategy::Root ? LinkMethod::ExactKey : LinkMethod::AlternateKey;

    for (const auto& [key, members] : groups) {
        // Authoritative record per tier: latest filedDate, earliest position on ties.
        std::map<int, std::size_t> byRank;
        for (std::size_t i : members) {
            const int rank = TierRank(records[i]->tier);
            auto it = byRank.find(rank);
            if (it == byRank.end()) {
                byRank.emplace(rank, i);
            } else if (records[i]->filedDate > records[it->second]->filedDate) {
                it->second = i;
            }
        }
        if (byRank.size() < 2) continue;

        CaseChain chain;
        chain.id = result.chains.size();
        chain.method = method;
        chain.linkKey = key;
        for (const auto& [rank, index] : byRank) {
            chain.members.push_back({index, records[index], 1.0});
        }

        for (std::size_t i : members) {
            pool.take(i);
            const std::size_t winner = byRank.at(TierRank(records[i]->tier));
            if (winner != i) {
                result.superseded.push_back({i, records[i], chain.id, winner});
            }
        }
        result.chains.push_back(std::move(chain));
    }
}

std::optional<BestMatch> CaseGrouper::search(std::size_t probe, Tier candidateTier,
                                             const std::vector<CaseRecordPtr>& records,
                                             const UngroupedPool& pool, GroupingResult& result) const {
    auto best = m_scorer.bestCandidate(records[probe]->rawNumber, pool.remaining(candidateTier, records), records);
    if (best && best->ambiguous()) {
        result.ambiguities.push_back({probe, best->winner.index, best->tiedWith, best->winner.score});
    }
    return best;
}

void CaseGrouper::fallbackPass(const std::vector<CaseRecordPtr>& records, UngroupedPool& pool, GroupingResult& result) const {
    for (std::size_t first : pool.remaining(Tier::FirstInstance, records)) {
        auto appellate = search(first, Tier::Appellate, records, pool, result);
        if (!appellate) continue;

        CaseChain chain;
        chain.id = result.chains.size();
        chain.method = LinkMethod::Similarity;
        chain.members.push_back({first, records[first], 1.0});
        chain.members.push_back({appellate->winner.index, records[appellate->winner.index], appellate->winner.score});
        pool.take(first);
        pool.take(appellate->winner.index);

        auto superior = search(appellate->winner.index, Tier::Superior, records, pool, result);
        if (superior) {
            chain.members.push_back({superior->winner.index, records[superior->winner.index], superior->winner.score});
            pool.take(superior->winner.index);
        }
        result.chains.push_back(std::move(chain));
    }
}

void CaseGrouper::residualPass(const std::vector<CaseRecordPtr>& records, UngroupedPool& pool, GroupingResult& result) const {
    for (std::size_t appellate : pool.remaining(Tier::Appellate, records)) {
        auto superior = search(appellate, Tier::Superior, records, pool, result);
        if (!superior) continue;

        CaseChain chain;
        chain.id = result.chains.size();
        chain.method = LinkMethod::Similarity;
        chain.members.push_back({appellate, records[appellate], 1.0});
        chain.members.push_back({superior->winner.index, records[superior->winner.index], superior->winner.score});
        pool.take(appellate);
        pool.take(superior->winner.index);
        result.chains.push_back(std::move(chain));
    }
}

} // namespace casechain::domain
