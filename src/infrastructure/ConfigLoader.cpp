/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace casechain::infrastructure {

using domain::KeyStrategy;
using domain::ReconciliationConfig;

namespace {

std::vector<KeyStrategy> ReadStrategies(const nlohmann::json& list, const char* field) {
    std::vector<KeyStrategy> strategies;
    for (const auto& item : list) {
        auto strategy = domain::KeyStrategyFromString(item.get<std::string>());
        if (!strategy) {
            throw std::invalid_argument(std::string(field) + ": unknown key strategy '" + item.get<std::string>() + "'");
        }
        strategies.push_back(*strategy);
    }
    return strategies;
}

nlohmann::json WriteStrategies(const std::vector<KeyStrategy>& strategies) {
    nlohmann::json list = nlohmann::json::array();
    for (auto strategy : strategies) {
        list.push_back(domain::KeyStrategyToString(strategy));
    }
    return list;
}

} // namespace

std::optional<ReconciliationConfig> ConfigLoader::FromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] Settings root must be an object." << std::endl;
        return std::nullopt;
    }

    ReconciliationConfig config;
    try {
        config.schemaVersion = j.value("schema_version", config.schemaVersion);
        config.tableVersion = j.value("table_version", config.tableVersion);
        if (j.contains("worker_threads")) {
            const auto& threads = j.at("worker_threads");
            if (!threads.is_number_integer() || threads.get<long long>() < 0 ||
                threads.get<long long>() > static_cast<long long>(ReconciliationConfig::kMaxWorkerThreads)) {
                throw std::invalid_argument("worker_threads must be an integer within [0, " +
                                            std::to_string(ReconciliationConfig::kMaxWorkerThreads) + "]");
            }
            config.workerThreads = threads.get<unsigned>();
        }

        if (j.contains("movement_codes")) {
            const auto& codes = j.at("movement_codes");
            config.movementCodes.reformCode = codes.value("reform_code", config.movementCodes.reformCode);
            if (codes.contains("verdicts")) {
                config.movementCodes.verdicts.clear();
                for (const auto& [code, label] : codes.at("verdicts").items()) {
                    auto verdict = domain::VerdictFromString(label.get<std::string>());
                    if (!verdict) {
                        throw std::invalid_argument("movement_codes.verdicts: unknown verdict '" + label.get<std::string>() + "'");
                    }
                    config.movementCodes.verdicts[std::stoi(code)] = *verdict;
                }
            }
        }

        if (j.contains("similarity")) {
            const auto& similarity = j.at("similarity");
            config.similarityThreshold = similarity.value("threshold", config.similarityThreshold);
            if (similarity.contains("weights")) {
                const auto& w = similarity.at("weights");
                config.similarityWeights.sequential = w.value("sequential", config.similarityWeights.sequential);
                config.similarityWeights.year = w.value("year", config.similarityWeights.year);
                config.similarityWeights.branch = w.value("branch", config.similarityWeights.branch);
            }
        }

        if (j.contains("alternate_keys")) {
            config.alternateKeyStrategies = ReadStrategies(j.at("alternate_keys"), "alternate_keys");
        }
        if (j.contains("grouping_keys")) {
            config.groupingKeyPriority = ReadStrategies(j.at("grouping_keys"), "grouping_keys");
        }

        if (j.contains("heuristic")) {
            const auto& h = j.at("heuristic");
            auto& target = config.heuristic;
            target.employeeKeywords = h.value("employee_keywords", target.employeeKeywords);
            target.employerKeywords = h.value("employer_keywords", target.employerKeywords);
            target.weakEmployeeKeywords = h.value("weak_employee_keywords", target.weakEmployeeKeywords);
            target.employeeSubjectCodes = h.value("employee_subject_codes", target.employeeSubjectCodes);
            target.employerSubjectCodes = h.value("employer_subject_codes", target.employerSubjectCodes);
            target.strongWeight = h.value("strong_weight", target.strongWeight);
            target.weakWeight = h.value("weak_weight", target.weakWeight);
            if (h.contains("tie_break")) {
                auto party = domain::PartyFromString(h.at("tie_break").get<std::string>());
                if (!party) {
                    throw std::invalid_argument("heuristic.tie_break: unknown party");
                }
                target.tieBreakAppellant = *party;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Invalid settings: " << e.what() << std::endl;
        return std::nullopt;
    }

    const auto problems = config.Validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            std::cerr << "[ConfigLoader] " << problem << std::endl;
        }
        return std::nullopt;
    }
    return config;
}

std::optional<ReconciliationConfig> ConfigLoader::Load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        std::cerr << "[ConfigLoader] Settings file not found: " << path << std::endl;
        return std::nullopt;
    }

    nlohmann::json j;
    try {
        std::ifstream f(path);
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
        return std::nullopt;
    }
    return FromJson(j);
}

nlohmann::json ConfigLoader::ToJson(const ReconciliationConfig& config) {
    nlohmann::json verdicts = nlohmann::json::object();
    for (const auto& [code, verdict] : config.movementCodes.verdicts) {
        verdicts[std::to_string(code)] = domain::VerdictToString(verdict);
    }

    const auto& h = config.heuristic;
    return {
        {"schema_version", config.schemaVersion},
        {"table_version", config.tableVersion},
        {"worker_threads", config.workerThreads},
        {"movement_codes", {{"verdicts", verdicts}, {"reform_code", config.movementCodes.reformCode}}},
        {"similarity", {
            {"threshold", config.similarityThreshold},
            {"weights", {
                {"sequential", config.similarityWeights.sequential},
                {"year", config.similarityWeights.year},
                {"branch", config.similarityWeights.branch}}}}},
        {"alternate_keys", WriteStrategies(config.alternateKeyStrategies)},
        {"grouping_keys", WriteStrategies(config.groupingKeyPriority)},
        {"heuristic", {
            {"employee_keywords", h.employeeKeywords},
            {"employer_keywords", h.employerKeywords},
            {"weak_employee_keywords", h.weakEmployeeKeywords},
            {"employee_subject_codes", h.employeeSubjectCodes},
            {"employer_subject_codes", h.employerSubjectCodes},
            {"strong_weight", h.strongWeight},
            {"weak_weight", h.weakWeight},
            {"tie_break", domain::PartyToString(h.tieBreakAppellant)}}}
    };
}

bool ConfigLoader::Save(const std::string& path, const ReconciliationConfig& config) {
    try {
        std::ofstream f(path);
        if (!f.is_open()) {
            std::cerr << "[ConfigLoader] Cannot open " << path << " for writing." << std::endl;
            return false;
        }
        f << ToJson(config).dump(4);
        return !f.fail();
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing " << path << ": " << e.what() << std::endl;
        return false;
    }
}

} // namespace casechain::infrastructure
