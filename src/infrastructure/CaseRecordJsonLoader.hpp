/**
 * @file CaseRecordJsonLoader.hpp
 * @brief Reads court-registry (DataJud) documents into CaseRecords.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/CaseRecord.hpp"

namespace casechain::infrastructure {

/**
 * @struct LoadReport
 * @brief Records accepted from a document and the count of skipped ones.
 */
struct LoadReport {
    std::vector<domain::CaseRecordPtr> records;
    std::size_t malformed = 0;
};

/**
 * @class CaseRecordJsonLoader
 * @brief Accepts a JSON array of documents, an object with a "records" array,
 * or a search response with hits.hits[]._source.
 *
 * Documents without a case number or with an unknown grau are skipped and
 * counted. A document that is not one of the container shapes above, or a
 * file that is not JSON, raises domain::InvalidBatchError.
 */
class CaseRecordJsonLoader {
public:
    /** @throws domain::InvalidBatchError */
    static LoadReport LoadFile(const std::string& path);

    /** @throws domain::InvalidBatchError */
    static LoadReport LoadDocument(const nlohmann::json& document);

    /** @brief Converts one registry document; nullopt when it is malformed. */
    static std::optional<domain::CaseRecord> ParseRecord(const nlohmann::json& source);

private:
    static const nlohmann::json& ExtractEntries(const nlohmann::json& document);
    static domain::MovementEvent ParseMovement(const nlohmann::json& movement);
};

} // namespace casechain::infrastructure
