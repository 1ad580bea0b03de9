/**
 * @file CaseChainApp.cpp
 * @brief Implementation of the CaseChainApp class.
 */
#include "app/CaseChainApp.hpp"

#include <iomanip>
#include <iostream>
#include <system_error>
#include <stdexcept>

#include "infrastructure/CaseRecordJsonLoader.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ResultExporter.hpp"

namespace casechain::app {

void CaseChainApp::PrintUsage() {
    std::cout << "Usage: casechain [--config FILE] [--output FILE] [--threads N] INPUT.json...\n"
              << "  --config FILE   Reconciliation settings (JSON). Defaults are used otherwise.\n"
              << "  --output FILE   Write chains and outcomes as JSON.\n"
              << "  --threads N     Worker threads for normalization (0 = all cores).\n";
}

std::optional<AppOptions> CaseChainApp::ParseArguments(const std::vector<std::string>& args) {
    AppOptions options;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= args.size()) {
                std::cerr << "[CaseChainApp] Missing value for " << arg << std::endl;
                return std::nullopt;
            }
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
        } else if (arg == "--config") {
            auto value = next();
            if (!value) return std::nullopt;
            options.configPath = *value;
        } else if (arg == "--output" || arg == "-o") {
            auto value = next();
            if (!value) return std::nullopt;
            options.outputPath = *value;
        } else if (arg == "--threads") {
            auto value = next();
            if (!value) return std::nullopt;
            try {
                const long n = std::stol(*value);
                if (n < 0 || n > static_cast<long>(domain::ReconciliationConfig::kMaxWorkerThreads)) {
                    throw std::out_of_range("thread count");
                }
                options.threads = static_cast<unsigned>(n);
            } catch (const std::exception&) {
                std::cerr << "[CaseChainApp] Invalid thread count: " << *value << std::endl;
                return std::nullopt;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "[CaseChainApp] Unknown option: " << arg << std::endl;
            return std::nullopt;
        } else {
            options.inputs.push_back(arg);
        }
    }

    if (!options.showHelp && options.inputs.empty()) {
        std::cerr << "[CaseChainApp] No input files given." << std::endl;
        return std::nullopt;
    }
    return options;
}

bool CaseChainApp::Init(const AppOptions& options) {
    if (options.configPath) {
        auto loaded = infrastructure::ConfigLoader::Load(*options.configPath);
        if (!loaded) {
            std::cerr << "[CaseChainApp] Unusable settings file: " << *options.configPath << std::endl;
            return false;
        }
        m_config = *loaded;
        std::cout << "[CaseChainApp] Settings loaded (table " << m_config.tableVersion << ")" << std::endl;
    }
    if (options.threads) {
        m_config.workerThreads = *options.threads;
    }
    return true;
}

void CaseChainApp::PrintSummary(const application::ReconciliationResult& result) const {
    const auto& s = result.summary;
    std::cout << "\n=== Reconciliation summary ===\n"
              << "Records:      " << s.records << " (" << s.malformed << " malformed skipped)\n"
              << "Chains:       " << s.chains << "\n";
    for (const auto& [size, count] : s.chainsBySize) {
        std::cout << "  " << size << " tiers:    " << count << "\n";
    }
    std::cout << "Residual:     " << s.residual << "\n"
              << "Superseded:   " << s.superseded << "\n"
              << "Ambiguous:    " << s.ambiguous << "\n"
              << "Favorable:    " << s.favorable << "\n"
              << "Unfavorable:  " << s.unfavorable << "\n"
              << "Unknown:      " << s.unknown << " (" << s.reformed << " reformed, unconfirmed)\n";
    for (const auto& [confidence, count] : s.byConfidence) {
        std::cout << "  " << std::left << std::setw(8) << domain::ConfidenceToString(confidence) << count << "\n";
    }
    std::cout << std::flush;
}

int CaseChainApp::Run(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto options = ParseArguments(args);
    if (!options) {
        PrintUsage();
        return 1;
    }
    if (options->showHelp) {
        PrintUsage();
        return 0;
    }
    if (!Init(*options)) {
        return 1;
    }

    try {
        std::vector<domain::CaseRecordPtr> batch;
        std::size_t malformed = 0;
        for (const auto& input : options->inputs) {
            auto report = infrastructure::CaseRecordJsonLoader::LoadFile(input);
            malformed += report.malformed;
            batch.insert(batch.end(), report.records.begin(), report.records.end());
        }

        application::ReconciliationService service(m_config);
        auto result = service.Reconcile(batch);
        result.malformed += malformed;
        result.summary = application::ReconciliationService::Summarize(result);

        PrintSummary(result);

        if (options->outputPath && !infrastructure::ResultExporter::Export(result, *options->outputPath)) {
            return 2;
        }
    } catch (const domain::InvalidBatchError& e) {
        std::cerr << "[CaseChainApp] Invalid batch: " << e.what() << std::endl;
        return 2;
    } catch (const std::system_error& e) {
        std::cerr << "[CaseChainApp] Reconciliation aborted: " << e.what() << std::endl;
        return 2;
    }
    return 0;
}

} // namespace casechain::app
