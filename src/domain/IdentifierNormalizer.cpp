/**
 * @file IdentifierNormalizer.cpp
 * @brief Implementation of IdentifierNormalizer.
 */

#include "domain/IdentifierNormalizer.hpp"

#include <algorithm>

#include "domain/CaseNumber.hpp"

namespace casechain::domain {

IdentifierNormalizer::IdentifierNormalizer(std::vector<KeyStrategy> alternateStrategies)
    : m_alternateStrategies(std::move(alternateStrategies)) {}

std::string IdentifierNormalizer::window(KeyStrategy strategy, const std::string& digits) {
    // digits holds at least CaseNumber::kFullLength characters here.
    switch (strategy) {
        case KeyStrategy::Root:
            return digits.substr(0, 7) + digits.substr(9, 4) + digits.substr(13, 1);
        case KeyStrategy::YearSequential:
            return digits.substr(9, 4) + digits.substr(0, 7);
        case KeyStrategy::MiddleSection:
            return digits.substr(7, 8);
        case KeyStrategy::SequentialCourt:
            return digits.substr(0, 7) + digits.substr(13, 3);
        case KeyStrategy::LegacyCore:
            return digits.substr(0, 7) + digits.substr(9);
    }
    return digits;
}

NormalizedKeys IdentifierNormalizer::normalize(const std::string& rawNumber) const {
    NormalizedKeys keys;
    const std::string digits = CaseNumber::DigitsOnly(rawNumber);

    if (digits.size() < CaseNumber::kFullLength) {
        keys.primaryKey = digits;
        return keys;
    }

    keys.structured = true;
    keys.primaryKey = window(KeyStrategy::Root, digits);
    for (KeyStrategy strategy : m_alternateStrategies) {
        if (strategy == KeyStrategy::Root) continue;
        std::string key = window(strategy, digits);
        if (key == keys.primaryKey) continue;
        if (std::find(keys.alternateKeys.begin(), keys.alternateKeys.end(), key) != keys.alternateKeys.end()) continue;
        keys.alternateKeys.push_back(std::move(key));
    }
    return keys;
}

std::optional<std::string> IdentifierNormalizer::keyFor(KeyStrategy strategy, const std::string& rawNumber) const {
    const std::string digits = CaseNumber::DigitsOnly(rawNumber);
    if (digits.empty()) return std::nullopt;
    if (digits.size() < CaseNumber::kFullLength) return digits;
    return window(strategy, digits);
}

} // namespace casechain::domain
