/**
 * @file SimilarityScorer.hpp
 * @brief Bounded similarity between two case numbers.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "domain/CaseRecord.hpp"
#include "domain/ReconciliationConfig.hpp"

namespace casechain::domain {

/**
 * @struct MatchCandidate
 * @brief A record that cleared the threshold against a probe number.
 */
struct MatchCandidate {
    std::size_t index = 0; ///< Position of the candidate in the batch.
    double score = 0.0;
};

/**
 * @struct BestMatch
 * @brief Winner of a candidate search plus what it beat.
 */
struct BestMatch {
    MatchCandidate winner;
    std::vector<std::size_t> tiedWith; ///< Other candidates that shared the top score.

    bool ambiguous() const { return !tiedWith.empty(); }
};

/**
 * @class SimilarityScorer
 * @brief Weighted segment comparison with a longest-common-substring fallback.
 */
class SimilarityScorer {
public:
    explicit SimilarityScorer(SimilarityWeights weights = {}, double threshold = 0.8);

    /**
     * @brief Similarity in [0, 1].
     *
     * When both numbers have the full CNJ structure the score is the matched
     * share of the sequential, year and branch weights. Otherwise it is the
     * longest common digit substring over the shorter digit string.
     */
    double score(const std::string& numberA, const std::string& numberB) const;

    /** @brief Length of the longest common substring (O(n*m) table). */
    static std::size_t LongestCommonSubstring(const std::string& a, const std::string& b);

    bool isCandidate(double score) const { return score >= m_threshold; }
    double threshold() const { return m_threshold; }

    /**
     * @brief Picks the best of @p candidates among @p records.
     *
     * Order: highest score, then most recent filedDate, then lowest batch
     * position. Candidates below the threshold are ignored.
     * @return nullopt when no candidate clears the threshold.
     */
    std::optional<BestMatch> bestCandidate(const std::string& probeNumber,
                                           const std::vector<std::size_t>& candidates,
                                           const std::vector<CaseRecordPtr>& records) const;

private:
    SimilarityWeights m_weights;
    double m_threshold;
};

} // namespace casechain::domain
