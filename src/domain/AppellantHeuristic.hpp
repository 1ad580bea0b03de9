/**
 * @file AppellantHeuristic.hpp
 * @brief Subject-based guess of who filed an appeal whose lower decision is unknown.
 *
 * The keyword lists encode an approximate legal assumption: wage-type claims
 * are usually appealed by the employee, just-cause and reinstatement matters
 * by the employer. Results from this path are never reported above MEDIUM.
 */

#pragma once

#include <vector>

#include "domain/CaseRecord.hpp"
#include "domain/ReconciliationConfig.hpp"
#include "domain/value_objects/Party.hpp"

namespace casechain::domain {

/**
 * @struct AppellantGuess
 * @brief Outcome of the keyword scoring.
 */
struct AppellantGuess {
    Party appellant = Party::Unknown;
    int employeeScore = 0;
    int employerScore = 0;
    bool tie = false; ///< Scores were equal; appellant is the configured default.
};

class AppellantHeuristic {
public:
    explicit AppellantHeuristic(AppellantHeuristicConfig config = AppellantHeuristicConfig::Default());

    /** @brief Scores the subjects of every record in @p records together. */
    AppellantGuess infer(const std::vector<CaseRecordPtr>& records) const;

    /** @brief Scores a single subject list. */
    AppellantGuess infer(const std::vector<Subject>& subjects) const;

private:
    void score(const Subject& subject, AppellantGuess& guess) const;
    AppellantGuess decide(AppellantGuess guess) const;

    AppellantHeuristicConfig m_config;
};

} // namespace casechain::domain
