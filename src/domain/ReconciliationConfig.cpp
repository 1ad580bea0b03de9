/**
 * @file ReconciliationConfig.cpp
 * @brief Default tables and validation of ReconciliationConfig.
 */

#include "domain/ReconciliationConfig.hpp"

#include <string>

namespace casechain::domain {

std::string KeyStrategyToString(KeyStrategy strategy) {
    switch (strategy) {
        case KeyStrategy::Root: return "root";
        case KeyStrategy::YearSequential: return "year_sequential";
        case KeyStrategy::MiddleSection: return "middle_section";
        case KeyStrategy::SequentialCourt: return "sequential_court";
        case KeyStrategy::LegacyCore: return "legacy_core";
    }
    return "unknown";
}

std::optional<KeyStrategy> KeyStrategyFromString(const std::string& value) {
    if (value == "root") return KeyStrategy::Root;
    if (value == "year_sequential") return KeyStrategy::YearSequential;
    if (value == "middle_section") return KeyStrategy::MiddleSection;
    if (value == "sequential_court") return KeyStrategy::SequentialCourt;
    if (value == "legacy_core") return KeyStrategy::LegacyCore;
    return std::nullopt;
}

MovementCodeTable MovementCodeTable::Default() {
    MovementCodeTable table;
    table.verdicts = {
        {219, Verdict::ClaimGranted},           // Procedência
        {220, Verdict::ClaimDenied},            // Improcedência
        {221, Verdict::ClaimPartiallyGranted},  // Procedência em Parte
        {237, Verdict::AppealGranted},          // Provimento
        {238, Verdict::AppealPartiallyGranted}, // Provimento em Parte
        {242, Verdict::AppealDenied},           // Desprovimento
        {236, Verdict::AppealNotAdmitted}       // Negação de Seguimento
    };
    table.reformCode = 190;
    return table;
}

AppellantHeuristicConfig AppellantHeuristicConfig::Default() {
    AppellantHeuristicConfig cfg;
    cfg.employeeKeywords = {
        "salário", "salarios", "remuneração", "verbas rescisórias",
        "horas extras", "adicional", "indenização por dano",
        "equiparação", "diferenças salariais", "gratificação",
        "comissões", "prêmios", "participação nos lucros"
    };
    cfg.employerKeywords = {
        "justa causa", "rescisão por justa causa", "dispensa por justa causa",
        "contribuição sindical", "multa administrativa",
        "reintegração", "estabilidade", "readmissão"
    };
    cfg.weakEmployeeKeywords = {"assédio", "dano moral"};
    return cfg;
}

std::vector<std::string> ReconciliationConfig::Validate() const {
    std::vector<std::string> problems;

    if (similarityThreshold < 0.0 || similarityThreshold > 1.0) {
        problems.push_back("similarityThreshold must be within [0, 1].");
    }
    if (similarityWeights.sequential < 0.0 || similarityWeights.year < 0.0 || similarityWeights.branch < 0.0) {
        problems.push_back("similarityWeights must not be negative.");
    }
    if (similarityWeights.Total() <= 0.0) {
        problems.push_back("similarityWeights must add up to a positive total.");
    }
    if (movementCodes.verdicts.empty()) {
        problems.push_back("movementCodes has no verdict codes.");
    }
    if (movementCodes.verdicts.count(movementCodes.reformCode) > 0) {
        problems.push_back("reformCode collides with a verdict code.");
    }
    if (groupingKeyPriority.empty()) {
        problems.push_back("groupingKeyPriority must name at least one strategy.");
    }
    if (heuristic.strongWeight < 0 || heuristic.weakWeight < 0) {
        problems.push_back("heuristic weights must not be negative.");
    }
    if (workerThreads > kMaxWorkerThreads) {
        problems.push_back("workerThreads must not exceed " + std::to_string(kMaxWorkerThreads) + ".");
    }
    if (heuristic.tieBreakAppellant == Party::Unknown) {
        problems.push_back("heuristic tieBreakAppellant must be Employee or Employer.");
    }

    return problems;
}

} // namespace casechain::domain
