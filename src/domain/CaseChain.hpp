/**
 * @file CaseChain.hpp
 * @brief Aggregate of per-tier records believed to be the same lawsuit.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "domain/CaseRecord.hpp"

namespace casechain::domain {

/**
 * @enum LinkMethod
 * @brief How the members of a chain were linked.
 */
enum class LinkMethod {
    ExactKey,     ///< Identical primary key.
    AlternateKey, ///< Identical key of a lower-priority strategy.
    Similarity,   ///< Score at or above the threshold.
    Unlinked      ///< Residual single-record chain.
};

inline std::string LinkMethodToString(LinkMethod method) {
    switch (method) {
        case LinkMethod::ExactKey: return "exact_key";
        case LinkMethod::AlternateKey: return "alternate_key";
        case LinkMethod::Similarity: return "similarity";
        case LinkMethod::Unlinked: return "unlinked";
    }
    return "unknown";
}

/**
 * @struct ChainMember
 * @brief Authoritative record of one tier inside a chain.
 */
struct ChainMember {
    std::size_t index = 0; ///< Position in the reconciled batch.
    CaseRecordPtr record;
    double linkScore = 1.0; ///< Similarity to the previous member (1.0 for key links).
};

/**
 * @struct CaseChain
 * @brief Records ordered by tier rank, at most one per tier.
 */
struct CaseChain {
    std::size_t id = 0;
    std::vector<ChainMember> members;
    LinkMethod method = LinkMethod::Unlinked;
    std::string linkKey; ///< Shared key for key-linked chains.

    std::size_t size() const { return members.size(); }
    bool isMultiTier() const { return members.size() >= 2; }
};

} // namespace casechain::domain
