/**
 * @file SimilarityScorer.cpp
 * @brief Implementation of SimilarityScorer.
 */

#include "domain/SimilarityScorer.hpp"

#include <algorithm>
#include <cmath>

#include "domain/CaseNumber.hpp"

namespace casechain::domain {

namespace {

constexpr double kScoreEpsilon = 1e-9;

bool SameScore(double a, double b) {
    return std::fabs(a - b) < kScoreEpsilon;
}

} // namespace

SimilarityScorer::SimilarityScorer(SimilarityWeights weights, double threshold)
    : m_weights(weights), m_threshold(threshold) {}

std::size_t SimilarityScorer::LongestCommonSubstring(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) return 0;

    // Two rows of the classic table: row[j] = common suffix length of a[..i) and b[..j).
    std::vector<std::size_t> previous(b.size() + 1, 0);
    std::vector<std::size_t> current(b.size() + 1, 0);
    std::size_t best = 0;

    for (std::size_t i = 1; i <= a.size(); ++i) {
        for (std::size_t j = 1; j <= b.size(); ++j) {
            if (a[i - 1] == b[j - 1]) {
                current[j] = previous[j - 1] + 1;
                best = std::max(best, current[j]);
            } else {
                current[j] = 0;
            }
        }
        std::swap(previous, current);
    }
    return best;
}

double SimilarityScorer::score(const std::string& numberA, const std::string& numberB) const {
    auto a = CaseNumber::Parse(numberA);
    auto b = CaseNumber::Parse(numberB);

    if (a && b) {
        const double total = m_weights.Total();
        if (total <= 0.0) return 0.0;

        double matched = 0.0;
        if (a->sequential == b->sequential) matched += m_weights.sequential;
        if (a->year == b->year) matched += m_weights.year;
        if (a->branch == b->branch) matched += m_weights.branch;
        return matched / total;
    }

    const std::string digitsA = CaseNumber::DigitsOnly(numberA);
    const std::string digitsB = CaseNumber::DigitsOnly(numberB);
    const std::size_t shorter = std::min(digitsA.size(), digitsB.size());
    if (shorter == 0) return 0.0;

    const double value = static_cast<double>(LongestCommonSubstring(digitsA, digitsB)) / static_cast<double>(shorter);
    return std::min(1.0, value);
}

std::optional<BestMatch> SimilarityScorer::bestCandidate(const std::string& probeNumber,
                                                         const std::vector<std::size_t>& candidates,
                                                         const std::vector<CaseRecordPtr>& records) const {
    std::vector<MatchCandidate> passing;
    for (std::size_t index : candidates) {
        double s = score(probeNumber, records[index]->rawNumber);
        if (isCandidate(s)) {
            passing.push_back({index, s});
        }
    }
    if (passing.empty()) return std::nullopt;

    auto better = [&records](const MatchCandidate& lhs, const MatchCandidate& rhs) {
        if (!SameScore(lhs.score, rhs.score)) return lhs.score > rhs.score;
        const std::string& lhsDate = records[lhs.index]->filedDate;
        const std::string& rhsDate = records[rhs.index]->filedDate;
        if (lhsDate != rhsDate) return lhsDate > rhsDate;
        return lhs.index < rhs.index;
    };

    BestMatch best;
    best.winner = *std::min_element(passing.begin(), passing.end(), better);

    for (const auto& candidate : passing) {
        if (candidate.index != best.winner.index && SameScore(candidate.score, best.winner.score)) {
            best.tiedWith.push_back(candidate.index);
        }
    }
    return best;
}

} // namespace casechain::domain
