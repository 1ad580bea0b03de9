/**
 * @file CaseRecord.hpp
 * @brief Domain entity representing one tier's filing of a lawsuit.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "domain/value_objects/Tier.hpp"

namespace casechain::domain {

/**
 * @struct MovementAttachment
 * @brief Structured annotation of a movement (a tabulated complement).
 */
struct MovementAttachment {
    std::string key;   ///< Complement description (e.g. "tipo_de_decisao_anterior").
    std::string value; ///< Complement name or value (e.g. "Sentença").
};

/**
 * @struct MovementEvent
 * @brief One procedural event of a docket.
 */
struct MovementEvent {
    int code = 0;                                ///< Procedural-movement classifier.
    std::string timestamp;                       ///< As supplied by the registry.
    std::vector<MovementAttachment> attachments; ///< Source order preserved.
};

/**
 * @struct Subject
 * @brief Subject classification of a lawsuit (code plus display name).
 */
struct Subject {
    int code = 0;
    std::string name;
};

/**
 * @struct CaseRecord
 * @brief A lawsuit as recorded at one tier. Never mutated after ingestion.
 */
struct CaseRecord {
    std::string rawNumber;                ///< As-recorded case identifier.
    Tier tier = Tier::FirstInstance;
    std::string court;                    ///< Deciding body (e.g. "TRT2").
    std::vector<MovementEvent> movements; ///< Insertion order is chronological order.
    std::string filedDate;                ///< ISO-8601; empty sorts as oldest.
    std::vector<Subject> subjects;
};

using CaseRecordPtr = std::shared_ptr<const CaseRecord>;

} // namespace casechain::domain
