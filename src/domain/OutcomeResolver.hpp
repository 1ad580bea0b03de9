/**
 * @file OutcomeResolver.hpp
 * @brief Infers who appealed at each tier transition and the final result for the employee.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/AppellantHeuristic.hpp"
#include "domain/CaseChain.hpp"
#include "domain/MovementInterpreter.hpp"
#include "domain/ReconciliationConfig.hpp"
#include "domain/value_objects/Party.hpp"

namespace casechain::domain {

enum class Confidence {
    High,   ///< Every transition read from observed codes.
    Medium, ///< Some transition relied on the subject heuristic.
    Low     ///< Single tier known, heuristic tie, or a transition without evidence.
};

enum class ResolutionStatus {
    Resolved,
    ReformedUnconfirmed, ///< Last informative event is a reform without its own verdict.
    Unresolved           ///< Nothing recognizable in the chain.
};

enum class EvidenceKind {
    Direct,
    Heuristic,
    HeuristicTie,
    Missing
};

enum class TransitionKind {
    ReversedInFavor, ///< Employee lost below and won the appeal.
    ReversedAgainst, ///< Employee won below and the employer's appeal succeeded.
    UpheldFavorable, ///< Employer's appeal failed.
    UpheldDenial,    ///< Employee's appeal failed.
    Reformed,        ///< Decision reformed, verdict not independently confirmed.
    Undetermined
};

std::string ConfidenceToString(Confidence confidence);
std::string StatusToString(ResolutionStatus status);
std::string EvidenceToString(EvidenceKind evidence);
std::string TransitionKindToString(TransitionKind kind);
std::string DescribeTransition(TransitionKind kind);

/**
 * @struct TransitionResolution
 * @brief Reading of one lower-tier/higher-tier pair.
 */
struct TransitionResolution {
    std::optional<Tier> lowerTier; ///< nullopt when the lower decision is implied, not recorded.
    Tier higherTier = Tier::Appellate;
    std::optional<int> lowerCode;
    std::optional<int> higherCode;
    Party appellant = Party::Unknown;
    std::optional<bool> favorableAfter; ///< Employee's position after this step.
    EvidenceKind evidence = EvidenceKind::Missing;
    TransitionKind kind = TransitionKind::Undetermined;
};

/**
 * @struct ResolvedOutcome
 * @brief Result attached to a chain.
 */
struct ResolvedOutcome {
    std::optional<bool> finalFavorableToEmployee; ///< nullopt = unknown.
    std::vector<Party> whoAppealedPerStep;
    Confidence confidence = Confidence::Low;
    ResolutionStatus status = ResolutionStatus::Unresolved;
    std::vector<TransitionResolution> transitions;
    std::optional<ReformDetails> reform;       ///< Last reform event seen in the chain.
    std::optional<AppellantGuess> heuristic;   ///< Present when the subject heuristic was consulted.
    bool usedEmbeddedEvidence = false;         ///< A first-instance code came from a higher tier's docket.
};

/**
 * @struct ChainStep
 * @brief A chain member with its interpreted outcome.
 */
struct ChainStep {
    CaseRecordPtr record;
    std::optional<RecordOutcome> outcome;
};

/**
 * @class OutcomeResolver
 * @brief Walks a chain in tier order and applies the appeal truth table.
 *
 * | Lower          | Higher                    | Appellant | Favorable after |
 * |----------------|---------------------------|-----------|-----------------|
 * | claim granted  | appeal granted            | Employer  | no              |
 * | claim granted  | appeal denied/not admitted| Employer  | yes             |
 * | claim denied   | appeal granted            | Employee  | yes             |
 * | claim denied   | appeal denied/not admitted| Employee  | no              |
 *
 * Partial grants behave as grants. An appellate verdict below a superior
 * verdict is read structurally (granted as granted claim, denied as denied
 * claim) unless an earlier transition already fixed the employee's position.
 */
class OutcomeResolver {
public:
    OutcomeResolver(MovementInterpreter interpreter, AppellantHeuristic heuristic);
    explicit OutcomeResolver(const ReconciliationConfig& config);

    /** @brief Interprets every member and resolves the chain. */
    ResolvedOutcome resolve(const CaseChain& chain) const;

    /** @brief Resolves members whose outcomes were interpreted beforehand. */
    ResolvedOutcome resolve(std::vector<ChainStep> steps) const;

    const MovementInterpreter& interpreter() const { return m_interpreter; }

private:
    struct Position {
        Tier tier = Tier::FirstInstance;
        std::optional<VerdictEvidence> verdict;
        bool reform = false;
    };

    static std::vector<Position> buildPositions(const std::vector<ChainStep>& steps, bool& usedEmbedded);

    TransitionResolution applyTruthTable(const Position& higher, bool lowerFavorable) const;
    TransitionResolution applyHeuristic(const Position& higher, const std::vector<CaseRecordPtr>& records,
                                        ResolvedOutcome& outcome) const;

    MovementInterpreter m_interpreter;
    AppellantHeuristic m_heuristic;
};

} // namespace casechain::domain
