/**
 * @file OutcomeResolver.cpp
 * @brief Implementation of OutcomeResolver.
 */

#include "domain/OutcomeResolver.hpp"

#include <algorithm>
#include <utility>

namespace casechain::domain {

std::string ConfidenceToString(Confidence confidence) {
    switch (confidence) {
        case Confidence::High: return "HIGH";
        case Confidence::Medium: return "MEDIUM";
        case Confidence::Low: return "LOW";
    }
    return "LOW";
}

std::string StatusToString(ResolutionStatus status) {
    switch (status) {
        case ResolutionStatus::Resolved: return "resolved";
        case ResolutionStatus::ReformedUnconfirmed: return "reformed, unconfirmed";
        case ResolutionStatus::Unresolved: return "unresolved";
    }
    return "unresolved";
}

std::string EvidenceToString(EvidenceKind evidence) {
    switch (evidence) {
        case EvidenceKind::Direct: return "direct";
        case EvidenceKind::Heuristic: return "heuristic";
        case EvidenceKind::HeuristicTie: return "heuristic_tie";
        case EvidenceKind::Missing: return "missing";
    }
    return "missing";
}

std::string TransitionKindToString(TransitionKind kind) {
    switch (kind) {
        case TransitionKind::ReversedInFavor: return "reversed_in_favor";
        case TransitionKind::ReversedAgainst: return "reversed_against";
        case TransitionKind::UpheldFavorable: return "upheld_favorable";
        case TransitionKind::UpheldDenial: return "upheld_denial";
        case TransitionKind::Reformed: return "reformed";
        case TransitionKind::Undetermined: return "undetermined";
    }
    return "undetermined";
}

std::string DescribeTransition(TransitionKind kind) {
    switch (kind) {
        case TransitionKind::ReversedInFavor: return "reversed in employee's favor";
        case TransitionKind::ReversedAgainst: return "reversed against employee";
        case TransitionKind::UpheldFavorable: return "upheld";
        case TransitionKind::UpheldDenial: return "upheld denial";
        case TransitionKind::Reformed: return "decision reformed, verdict not independently confirmed";
        case TransitionKind::Undetermined: return "undetermined";
    }
    return "undetermined";
}

OutcomeResolver::OutcomeResolver(MovementInterpreter interpreter, AppellantHeuristic heuristic)
    : m_interpreter(std::move(interpreter)), m_heuristic(std::move(heuristic)) {}

OutcomeResolver::OutcomeResolver(const ReconciliationConfig& config)
    : OutcomeResolver(MovementInterpreter(config.movementCodes), AppellantHeuristic(config.heuristic)) {}

ResolvedOutcome OutcomeResolver::resolve(const CaseChain& chain) const {
    std::vector<ChainStep> steps;
    steps.reserve(chain.members.size());
    for (const auto& member : chain.members) {
        if (!member.record) continue;
        steps.push_back({member.record, m_interpreter.interpretRecord(*member.record)});
    }
    return resolve(std::move(steps));
}

std::vector<OutcomeResolver::Position> OutcomeResolver::buildPositions(const std::vector<ChainStep>& steps, bool& usedEmbedded) {
    std::vector<Position> positions;
    std::optional<VerdictEvidence> embedded;

    for (const auto& step : steps) {
        Position position;
        position.tier = step.record->tier;
        if (step.outcome) {
            position.verdict = step.outcome->verdictForTier();
            position.reform = step.outcome->reformOnly;
            if (auto claim = step.outcome->embeddedClaim()) {
                embedded = claim;
            }
        }
        positions.push_back(position);
    }

    // A first-instance verdict read from a higher docket fills a missing first tier.
    if (embedded) {
        if (!positions.empty() && positions.front().tier == Tier::FirstInstance) {
            Position& first = positions.front();
            if (!first.verdict && !first.reform) {
                first.verdict = embedded;
                usedEmbedded = true;
            }
        } else {
            Position first;
            first.tier = Tier::FirstInstance;
            first.verdict = embedded;
            positions.insert(positions.begin(), first);
            usedEmbedded = true;
        }
    }
    return positions;
}

TransitionResolution OutcomeResolver::applyTruthTable(const Position& higher, bool lowerFavorable) const {
    TransitionResolution t;
    const bool accepted = IsAppealAccepted(higher.verdict->verdict);

    t.appellant = lowerFavorable ? Party::Employer : Party::Employee;
    t.favorableAfter = accepted ? !lowerFavorable : lowerFavorable;
    t.evidence = EvidenceKind::Direct;

    if (lowerFavorable) {
        t.kind = accepted ? TransitionKind::ReversedAgainst : TransitionKind::UpheldFavorable;
    } else {
        t.kind = accepted ? TransitionKind::ReversedInFavor : TransitionKind::UpheldDenial;
    }
    return t;
}

TransitionResolution OutcomeResolver::applyHeuristic(const Position& higher, const std::vector<CaseRecordPtr>& records,
                                                     ResolvedOutcome& outcome) const {
    AppellantGuess guess = m_heuristic.infer(records);
    outcome.heuristic = guess;

    // Whoever appealed lost below: an employer appeal implies a favorable lower decision.
    TransitionResolution t = applyTruthTable(higher, guess.appellant == Party::Employer);
    t.evidence = guess.tie ? EvidenceKind::HeuristicTie : EvidenceKind::Heuristic;
    return t;
}

ResolvedOutcome OutcomeResolver::resolve(std::vector<ChainStep> steps) const {
    ResolvedOutcome outcome;

    steps.erase(std::remove_if(steps.begin(), steps.end(), [](const ChainStep& s) { return !s.record; }), steps.end());
    std::stable_sort(steps.begin(), steps.end(), [](const ChainStep& a, const ChainStep& b) {
        return TierRank(a.record->tier) < TierRank(b.record->tier);
    });

    std::vector<CaseRecordPtr> records;
    for (const auto& step : steps) {
        records.push_back(step.record);
        if (step.outcome && step.outcome->reform) {
            outcome.reform = step.outcome->reform;
        }
    }

    const std::vector<Position> positions = buildPositions(steps, outcome.usedEmbeddedEvidence);

    const auto known = std::count_if(positions.begin(), positions.end(), [](const Position& p) { return p.verdict.has_value(); });
    std::optional<std::size_t> lastInformative;
    for (std::size_t i = 0; i < positions.size(); ++i) {
        if (positions[i].verdict || positions[i].reform) lastInformative = i;
    }

    std::optional<bool> carried;

    // A lone appeal verdict at the bottom of the chain implies an unrecorded lower decision.
    if (known == 1 && positions.front().verdict &&
        CategoryOf(positions.front().verdict->verdict) == VerdictCategory::Appeal) {
        TransitionResolution t = applyHeuristic(positions.front(), records, outcome);
        t.lowerTier = std::nullopt;
        t.higherTier = positions.front().tier;
        t.higherCode = positions.front().verdict->code;
        carried = t.favorableAfter;
        outcome.transitions.push_back(t);
    }

    for (std::size_t i = 0; i + 1 < positions.size(); ++i) {
        const Position& lower = positions[i];
        const Position& higher = positions[i + 1];
        TransitionResolution t;

        if (higher.reform) {
            t.kind = TransitionKind::Reformed;
        } else if (higher.verdict && CategoryOf(higher.verdict->verdict) == VerdictCategory::Appeal) {
            std::optional<bool> lowerFavorable = carried;
            if (!lowerFavorable && lower.verdict) {
                lowerFavorable = IsFavorablePosition(lower.verdict->verdict);
            }
            t = lowerFavorable ? applyTruthTable(higher, *lowerFavorable) : applyHeuristic(higher, records, outcome);
        }

        t.lowerTier = lower.tier;
        t.higherTier = higher.tier;
        if (lower.verdict) t.lowerCode = lower.verdict->code;
        if (higher.verdict) t.higherCode = higher.verdict->code;

        carried = t.favorableAfter;
        outcome.transitions.push_back(t);
    }

    if (lastInformative && positions[*lastInformative].reform) {
        outcome.status = ResolutionStatus::ReformedUnconfirmed;
    } else {
        for (auto it = outcome.transitions.rbegin(); it != outcome.transitions.rend(); ++it) {
            if (it->favorableAfter) {
                outcome.finalFavorableToEmployee = it->favorableAfter;
                break;
            }
        }
        if (!outcome.finalFavorableToEmployee) {
            // Only a first-instance decision is known.
            for (auto it = positions.rbegin(); it != positions.rend(); ++it) {
                if (it->verdict && CategoryOf(it->verdict->verdict) == VerdictCategory::Claim) {
                    outcome.finalFavorableToEmployee = IsFavorablePosition(it->verdict->verdict);
                    break;
                }
            }
        }
        outcome.status = outcome.finalFavorableToEmployee ? ResolutionStatus::Resolved : ResolutionStatus::Unresolved;
    }

    for (const auto& t : outcome.transitions) {
        outcome.whoAppealedPerStep.push_back(t.appellant);
    }

    outcome.confidence = Confidence::Low;
    if (outcome.status == ResolutionStatus::Resolved && !outcome.transitions.empty()) {
        outcome.confidence = Confidence::High;
        for (const auto& t : outcome.transitions) {
            if (t.evidence == EvidenceKind::Heuristic) {
                outcome.confidence = std::max(outcome.confidence, Confidence::Medium);
            } else if (t.evidence != EvidenceKind::Direct) {
                outcome.confidence = Confidence::Low;
            }
        }
    }
    return outcome;
}

} // namespace casechain::domain
