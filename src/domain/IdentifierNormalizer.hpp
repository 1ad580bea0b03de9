/**
 * @file IdentifierNormalizer.hpp
 * @brief Canonicalizes raw case numbers into comparable keys.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/ReconciliationConfig.hpp"

namespace casechain::domain {

/**
 * @struct NormalizedKeys
 * @brief Keys produced for one case number.
 */
struct NormalizedKeys {
    std::string primaryKey;                 ///< Root key, stable across tiers.
    std::vector<std::string> alternateKeys; ///< Extra windowings, in strategy order.
    bool structured = false;                ///< True when the number had the full 20 digits.
};

/**
 * @class IdentifierNormalizer
 * @brief Pure, deterministic key builder.
 *
 * For full-length numbers the primary key keeps the sequential number, the
 * filing year and the justice branch, dropping the court and origin segments
 * that legitimately change between instances. Shorter numbers cannot be
 * windowed and yield their digit string as the only key.
 */
class IdentifierNormalizer {
public:
    explicit IdentifierNormalizer(std::vector<KeyStrategy> alternateStrategies = {
        KeyStrategy::YearSequential, KeyStrategy::MiddleSection, KeyStrategy::SequentialCourt});

    NormalizedKeys normalize(const std::string& rawNumber) const;

    /**
     * @brief Key of a single strategy.
     * @return The digit string for short numbers; nullopt when there are no digits.
     */
    std::optional<std::string> keyFor(KeyStrategy strategy, const std::string& rawNumber) const;

    const std::vector<KeyStrategy>& alternateStrategies() const { return m_alternateStrategies; }

private:
    static std::string window(KeyStrategy strategy, const std::string& digits);

    std::vector<KeyStrategy> m_alternateStrategies;
};

} // namespace casechain::domain
