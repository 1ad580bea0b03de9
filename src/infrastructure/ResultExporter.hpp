/**
 * @file ResultExporter.hpp
 * @brief Serializes reconciliation results and writes them atomically.
 */

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "application/ReconciliationService.hpp"

namespace casechain::infrastructure {

class ResultExporter {
public:
    /** @brief Full result: chains, residual, superseded, ambiguities and summary. */
    static nlohmann::json ToJson(const application::ReconciliationResult& result);

    static nlohmann::json SummaryToJson(const application::ReconciliationSummary& summary);

    /**
     * @brief Writes the result as indented JSON (temp file, then rename).
     * @return false if any step failed; the target is left untouched in that case.
     */
    static bool Export(const application::ReconciliationResult& result, const std::string& path);

    /** @brief Atomic text write: filename.<timestamp>.tmp, then rename over @p path. */
    static bool WriteAtomic(const std::string& path, const std::string& content);
};

} // namespace casechain::infrastructure
