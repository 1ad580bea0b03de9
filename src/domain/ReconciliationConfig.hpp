/**
 * @file ReconciliationConfig.hpp
 * @brief Versioned configuration data handed to the engine at construction time.
 *
 * Movement code tables, similarity weights, the match threshold and the
 * appellant keyword lists are domain assumptions. They live here as data so
 * alternate settings can be tested without touching the algorithms.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "domain/value_objects/Party.hpp"
#include "domain/value_objects/Verdict.hpp"

namespace casechain::domain {

/**
 * @enum KeyStrategy
 * @brief Windowings of a 20-digit case number used to build comparison keys.
 */
enum class KeyStrategy {
    Root,            ///< sequential + year + branch (the primary key).
    YearSequential,  ///< year + sequential.
    MiddleSection,   ///< digits 7..14 (check digits, year, branch, court).
    SequentialCourt, ///< sequential + branch + court.
    LegacyCore       ///< sequential + everything after the check digits.
};

std::string KeyStrategyToString(KeyStrategy strategy);
std::optional<KeyStrategy> KeyStrategyFromString(const std::string& value);

/**
 * @struct MovementCodeTable
 * @brief Allow-list of movement codes the interpreter understands.
 */
struct MovementCodeTable {
    std::map<int, Verdict> verdicts; ///< Code -> verdict.
    int reformCode = 190;            ///< "Reforma de Decisão Anterior".

    std::optional<Verdict> Lookup(int code) const {
        auto it = verdicts.find(code);
        if (it == verdicts.end()) return std::nullopt;
        return it->second;
    }

    /** @brief TPU/CNJ merit and appeal codes. */
    static MovementCodeTable Default();
};

/**
 * @struct SimilarityWeights
 * @brief Weights of the structured case-number comparison.
 * Court and origin segments carry no weight: they change between tiers.
 */
struct SimilarityWeights {
    double sequential = 5.0;
    double year = 3.0;
    double branch = 1.0;

    double Total() const { return sequential + year + branch; }
};

/**
 * @struct AppellantHeuristicConfig
 * @brief Subject keywords and codes used to guess the appellant of an unpaired appeal.
 * Keywords are matched against case-folded subject names.
 */
struct AppellantHeuristicConfig {
    std::vector<std::string> employeeKeywords;     ///< Wage/overtime/indemnity claims.
    std::vector<std::string> employerKeywords;     ///< Just cause, reinstatement, stability.
    std::vector<std::string> weakEmployeeKeywords; ///< Harassment, moral damages.
    std::vector<int> employeeSubjectCodes;
    std::vector<int> employerSubjectCodes;
    int strongWeight = 2;
    int weakWeight = 1;
    Party tieBreakAppellant = Party::Employee;

    static AppellantHeuristicConfig Default();
};

/**
 * @struct ReconciliationConfig
 * @brief Complete engine configuration. A default-constructed value is usable as-is.
 */
struct ReconciliationConfig {
    int schemaVersion = 1;
    std::string tableVersion = "tpu-cnj-2024";

    MovementCodeTable movementCodes = MovementCodeTable::Default();

    double similarityThreshold = 0.8;
    SimilarityWeights similarityWeights;

    /// Alternate keys the normalizer emits, in priority order.
    std::vector<KeyStrategy> alternateKeyStrategies = {
        KeyStrategy::YearSequential, KeyStrategy::MiddleSection, KeyStrategy::SequentialCourt};

    /// Key strategies the grouper's exact pass runs, in priority order.
    std::vector<KeyStrategy> groupingKeyPriority = {KeyStrategy::Root, KeyStrategy::YearSequential};

    AppellantHeuristicConfig heuristic = AppellantHeuristicConfig::Default();

    /// Threads for the normalize and interpret stages (0 = hardware concurrency).
    unsigned workerThreads = 1;

    /// Upper bound accepted for workerThreads.
    static constexpr unsigned kMaxWorkerThreads = 256;

    /**
     * @brief Lists every inconsistency of the configuration.
     * @return Empty when the configuration can be used.
     */
    std::vector<std::string> Validate() const;
};

} // namespace casechain::domain
