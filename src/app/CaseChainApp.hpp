/**
 * @file CaseChainApp.hpp
 * @brief Command-line front end of the case-chain reconciler.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "application/ReconciliationService.hpp"

namespace casechain::app {

/**
 * @struct AppOptions
 * @brief Parsed command line.
 */
struct AppOptions {
    std::optional<std::string> configPath;
    std::optional<std::string> outputPath;
    std::optional<unsigned> threads; ///< Overrides worker_threads from the settings.
    std::vector<std::string> inputs;
    bool showHelp = false;
};

/**
 * @class CaseChainApp
 * @brief Loads input files, reconciles them and reports the result.
 */
class CaseChainApp {
public:
    /**
     * @brief Runs one reconciliation.
     * @return 0 on success, 1 on a usage or configuration error, 2 on an invalid batch or failed export.
     */
    int Run(int argc, char** argv);

    /**
     * @brief Parses the arguments.
     * @return nullopt (after printing the reason) if they are unusable.
     */
    static std::optional<AppOptions> ParseArguments(const std::vector<std::string>& args);

    static void PrintUsage();

private:
    bool Init(const AppOptions& options);
    void PrintSummary(const application::ReconciliationResult& result) const;

    domain::ReconciliationConfig m_config; ///< Defaults unless --config is given.
};

} // namespace casechain::app
