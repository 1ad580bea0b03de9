/**
 * @file MovementInterpreter.hpp
 * @brief Extracts the semantic outcome of a record from its movement codes.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/CaseRecord.hpp"
#include "domain/ReconciliationConfig.hpp"
#include "domain/value_objects/Verdict.hpp"

namespace casechain::domain {

/**
 * @struct VerdictEvidence
 * @brief A recognized verdict and the movement it was read from.
 */
struct VerdictEvidence {
    Verdict verdict;
    int code = 0;
    std::string timestamp;
};

/**
 * @struct ReformDetails
 * @brief Data carried by a "prior decision reformed" movement.
 */
struct ReformDetails {
    int code = 0;
    std::string timestamp;
    std::vector<MovementAttachment> attachments;
    std::optional<std::string> priorDecisionType; ///< From the "tipo de decisão" complement, when present.
};

/**
 * @struct RecordOutcome
 * @brief Last recognized event per category for one record.
 */
struct RecordOutcome {
    Tier tier = Tier::FirstInstance;
    std::optional<VerdictEvidence> claim;  ///< Last first-instance verdict.
    std::optional<VerdictEvidence> appeal; ///< Last appeal verdict.
    std::optional<ReformDetails> reform;   ///< Last reform marker.
    bool reformOnly = false;               ///< Reform seen, no verdict of the record's own tier.

    /**
     * @brief Verdict that belongs to the record's own tier:
     * the claim verdict at first instance, the appeal verdict above it.
     */
    std::optional<VerdictEvidence> verdictForTier() const {
        return tier == Tier::FirstInstance ? claim : appeal;
    }

    /**
     * @brief First-instance verdict found in the docket of a higher-tier record.
     */
    std::optional<VerdictEvidence> embeddedClaim() const {
        if (tier == Tier::FirstInstance) return std::nullopt;
        return claim;
    }
};

/**
 * @class MovementInterpreter
 * @brief Maps movement codes to outcomes using an allow-list table.
 *
 * Unrecognized codes are ignored. Within a record, later events supersede
 * earlier ones of the same category.
 */
class MovementInterpreter {
public:
    explicit MovementInterpreter(MovementCodeTable table = MovementCodeTable::Default());

    /**
     * @brief Interprets the movements of a record.
     * @return nullopt when no recognized code is present ("outcome unknown").
     */
    std::optional<RecordOutcome> interpretRecord(const CaseRecord& record) const;

    const MovementCodeTable& table() const { return m_table; }

private:
    ReformDetails readReform(const MovementEvent& event) const;

    MovementCodeTable m_table;
};

} // namespace casechain::domain
