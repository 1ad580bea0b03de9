/**
 * @file Verdict.hpp
 * @brief Value Objects for the semantic outcome of a procedural movement.
 */

#pragma once

#include <optional>
#include <string>

namespace casechain::domain {

/**
 * @enum VerdictCategory
 * @brief Semantic family a recognized movement code belongs to.
 */
enum class VerdictCategory {
    Claim,   ///< First-instance merits decision.
    Appeal,  ///< Appellate or superior judgment of an appeal.
    Reform   ///< "Prior decision reformed" marker without its own verdict.
};

/**
 * @enum Verdict
 * @brief Outcome carried by a recognized movement code.
 */
enum class Verdict {
    ClaimGranted,
    ClaimDenied,
    ClaimPartiallyGranted,
    AppealGranted,
    AppealPartiallyGranted,
    AppealDenied,
    AppealNotAdmitted
};

inline VerdictCategory CategoryOf(Verdict verdict) {
    switch (verdict) {
        case Verdict::ClaimGranted:
        case Verdict::ClaimDenied:
        case Verdict::ClaimPartiallyGranted:
            return VerdictCategory::Claim;
        default:
            return VerdictCategory::Appeal;
    }
}

/**
 * @brief True when the appeal was accepted (fully or partially).
 * Partial grants count as granted; "not admitted" counts as denied.
 */
inline bool IsAppealAccepted(Verdict verdict) {
    return verdict == Verdict::AppealGranted || verdict == Verdict::AppealPartiallyGranted;
}

/**
 * @brief Position of the employee after a verdict, read as a claim result.
 *
 * Claim verdicts map directly (partial grants are favorable). Appeal verdicts
 * are read structurally: an accepted appeal stands in for a granted claim and
 * a rejected one for a denied claim.
 */
inline bool IsFavorablePosition(Verdict verdict) {
    switch (verdict) {
        case Verdict::ClaimGranted:
        case Verdict::ClaimPartiallyGranted:
        case Verdict::AppealGranted:
        case Verdict::AppealPartiallyGranted:
            return true;
        default:
            return false;
    }
}

inline std::string VerdictToString(Verdict verdict) {
    switch (verdict) {
        case Verdict::ClaimGranted: return "claim_granted";
        case Verdict::ClaimDenied: return "claim_denied";
        case Verdict::ClaimPartiallyGranted: return "claim_partially_granted";
        case Verdict::AppealGranted: return "appeal_granted";
        case Verdict::AppealPartiallyGranted: return "appeal_partially_granted";
        case Verdict::AppealDenied: return "appeal_denied";
        case Verdict::AppealNotAdmitted: return "appeal_not_admitted";
    }
    return "unknown";
}

inline std::optional<Verdict> VerdictFromString(const std::string& value) {
    if (value == "claim_granted") return Verdict::ClaimGranted;
    if (value == "claim_denied") return Verdict::ClaimDenied;
    if (value == "claim_partially_granted") return Verdict::ClaimPartiallyGranted;
    if (value == "appeal_granted") return Verdict::AppealGranted;
    if (value == "appeal_partially_granted") return Verdict::AppealPartiallyGranted;
    if (value == "appeal_denied") return Verdict::AppealDenied;
    if (value == "appeal_not_admitted") return Verdict::AppealNotAdmitted;
    return std::nullopt;
}

} // namespace casechain::domain
