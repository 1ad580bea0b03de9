/**
 * @file MovementInterpreter.cpp
 * @brief Implementation of MovementInterpreter.
 */

#include "domain/MovementInterpreter.hpp"

#include "domain/TextFold.hpp"

namespace casechain::domain {

MovementInterpreter::MovementInterpreter(MovementCodeTable table)
    : m_table(std::move(table)) {}

ReformDetails MovementInterpreter::readReform(const MovementEvent& event) const {
    ReformDetails details;
    details.code = event.code;
    details.timestamp = event.timestamp;
    details.attachments = event.attachments;

    for (const auto& attachment : event.attachments) {
        const std::string key = TextFold::Fold(attachment.key);
        if (key.find("decis") != std::string::npos || key.find("tipo") != std::string::npos) {
            details.priorDecisionType = attachment.value;
        }
    }
    return details;
}

std::optional<RecordOutcome> MovementInterpreter::interpretRecord(const CaseRecord& record) const {
    RecordOutcome outcome;
    outcome.tier = record.tier;
    bool recognized = false;

    for (const auto& event : record.movements) {
        if (event.code == m_table.reformCode) {
            outcome.reform = readReform(event);
            recognized = true;
            continue;
        }

        auto verdict = m_table.Lookup(event.code);
        if (!verdict) continue;

        VerdictEvidence evidence{*verdict, event.code, event.timestamp};
        if (CategoryOf(*verdict) == VerdictCategory::Claim) {
            outcome.claim = evidence;
        } else {
            outcome.appeal = evidence;
        }
        recognized = true;
    }

    if (!recognized) {
        return std::nullopt;
    }

    outcome.reformOnly = outcome.reform.has_value() && !outcome.verdictForTier();
    return outcome;
}

} // namespace casechain::domain
