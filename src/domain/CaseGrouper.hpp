/**
 * @file CaseGrouper.hpp
 * @brief Partitions a batch of records into per-lawsuit chains.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "domain/CaseChain.hpp"
#include "domain/CaseRecord.hpp"
#include "domain/IdentifierNormalizer.hpp"
#include "domain/ReconciliationConfig.hpp"
#include "domain/SimilarityScorer.hpp"

namespace casechain::domain {

/**
 * @class UngroupedPool
 * @brief Owned set of batch positions not yet placed in a chain.
 *
 * Every grouping pass reads candidates from, and removes matches from, the
 * same pool. A position can be taken once, which keeps chains disjoint.
 */
class UngroupedPool {
public:
    explicit UngroupedPool(std::size_t size);

    bool contains(std::size_t index) const;

    /**
     * @brief Removes a position from the pool.
     * @throws std::logic_error if the position was already taken.
     */
    void take(std::size_t index);

    /** @brief Remaining positions in batch order. */
    std::vector<std::size_t> remaining() const;

    /** @brief Remaining positions of one tier, in batch order. */
    std::vector<std::size_t> remaining(Tier tier, const std::vector<CaseRecordPtr>& records) const;

    std::size_t size() const { return m_count; }

private:
    std::vector<bool> m_available;
    std::size_t m_count;
};

/**
 * @struct SupersededRecord
 * @brief Same-tier record displaced by a more recently filed one in its chain.
 */
struct SupersededRecord {
    std::size_t index = 0;
    CaseRecordPtr record;
    std::size_t chainId = 0;
    std::size_t supersededBy = 0; ///< Batch position of the authoritative record.
};

/**
 * @struct AmbiguousMatch
 * @brief A similarity search whose top score was shared by several candidates.
 */
struct AmbiguousMatch {
    std::size_t probeIndex = 0;
    std::size_t chosenIndex = 0;
    std::vector<std::size_t> tiedWith;
    double score = 0.0;
};

/**
 * @struct GroupingResult
 * @brief Output of buildChains.
 */
struct GroupingResult {
    std::vector<CaseChain> chains;             ///< Multi-tier chains, in creation order.
    std::vector<ChainMember> residual;         ///< Records no pass could link.
    std::vector<SupersededRecord> superseded;
    std::vector<AmbiguousMatch> ambiguities;
};

/// keys[p][i]: key of record i under the p-th grouping strategy.
using KeyTable = std::vector<std::vector<std::optional<std::string>>>;

/**
 * @class CaseGrouper
 * @brief Exact-key passes first, then similarity fallback passes.
 *
 * Given the same batch in the same order the output is identical across runs.
 */
class CaseGrouper {
public:
    CaseGrouper(IdentifierNormalizer normalizer,
                SimilarityScorer scorer,
                std::vector<KeyStrategy> keyPriority = {KeyStrategy::Root});

    explicit CaseGrouper(const ReconciliationConfig& config);

    GroupingResult buildChains(const std::vector<CaseRecordPtr>& records) const;

    /** @brief Same as above with keys computed beforehand (see fillKeys). */
    GroupingResult buildChains(const std::vector<CaseRecordPtr>& records, const KeyTable& keys) const;

    /** @brief Allocates a key table for @p recordCount records. */
    KeyTable makeKeyTable(std::size_t recordCount) const;

    /**
     * @brief Computes keys for positions [first, last). Ranges never overlap
     * between callers, so disjoint ranges may be filled concurrently.
     */
    void fillKeys(const std::vector<CaseRecordPtr>& records, std::size_t first, std::size_t last, KeyTable& keys) const;

    const std::vector<KeyStrategy>& keyPriority() const { return m_keyPriority; }

private:
    void exactPass(std::size_t strategyPos, const std::vector<CaseRecordPtr>& records,
                   const KeyTable& keys, UngroupedPool& pool, GroupingResult& result) const;

    void fallbackPass(const std::vector<CaseRecordPtr>& records, UngroupedPool& pool, GroupingResult& result) const;

    void residualPass(const std::vector<CaseRecordPtr>& records, UngroupedPool& pool, GroupingResult& result) const;

    std::optional<BestMatch> search(std::size_t probe, Tier candidateTier,
                                    const std::vector<CaseRecordPtr>& records,
                                    const UngroupedPool& pool, GroupingResult& result) const;

    IdentifierNormalizer m_normalizer;
    SimilarityScorer m_scorer;
    std::vector<KeyStrategy> m_keyPriority;
};

} // namespace casechain::domain
