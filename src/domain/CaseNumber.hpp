/**
 * @file CaseNumber.hpp
 * @brief Decomposition of national (CNJ) case numbers.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace casechain::domain {

/**
 * @struct CnjComponents
 * @brief Segments of NNNNNNN-DD.AAAA.J.TR.OOOO.
 */
struct CnjComponents {
    std::string sequential;  ///< NNNNNNN
    std::string checkDigits; ///< DD
    std::string year;        ///< AAAA
    std::string branch;      ///< J, justice branch
    std::string court;       ///< TR
    std::string origin;      ///< OOOO
    std::string digits;      ///< Full digit-only string the segments were cut from.
};

/**
 * @class CaseNumber
 * @brief Stateless helpers shared by the normalizer and the similarity scorer.
 */
class CaseNumber {
public:
    /// Digits of a full national case number.
    static constexpr std::size_t kFullLength = 20;

    /** @brief Removes every non-digit character. */
    static std::string DigitsOnly(const std::string& raw);

    /**
     * @brief Splits the first 20 digits of @p raw into CNJ segments.
     * @return nullopt when fewer than 20 digits are present.
     */
    static std::optional<CnjComponents> Parse(const std::string& raw);
};

} // namespace casechain::domain
