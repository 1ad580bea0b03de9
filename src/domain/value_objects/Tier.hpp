/**
 * @file Tier.hpp
 * @brief Value Object defining the judicial tiers a labor lawsuit passes through.
 */

#pragma once

#include <optional>
#include <string>

namespace casechain::domain {

/**
 * @enum Tier
 * @brief Judicial level of a court record.
 */
enum class Tier {
    FirstInstance,  ///< Labor court (Vara do Trabalho), grau G1.
    Appellate,      ///< Regional appellate court (TRT), grau G2.
    Superior        ///< Superior labor court (TST), grau GS.
};

/**
 * @brief Rank used to order records inside a chain (1 < 2 < 3).
 */
inline int TierRank(Tier tier) {
    switch (tier) {
        case Tier::FirstInstance: return 1;
        case Tier::Appellate: return 2;
        case Tier::Superior: return 3;
    }
    return 99;
}

inline std::string TierToString(Tier tier) {
    switch (tier) {
        case Tier::FirstInstance: return "FirstInstance";
        case Tier::Appellate: return "Appellate";
        case Tier::Superior: return "Superior";
    }
    return "Unknown";
}

/**
 * @brief Maps the registry's grau codes (and the canonical names) to a tier.
 * @return nullopt when the value is not a known tier label.
 */
inline std::optional<Tier> TierFromString(const std::string& value) {
    if (value == "G1" || value == "GRAU_1" || value == "FirstInstance") return Tier::FirstInstance;
    if (value == "G2" || value == "GRAU_2" || value == "Appellate") return Tier::Appellate;
    if (value == "GS" || value == "SUP" || value == "TST" || value == "Superior") return Tier::Superior;
    return std::nullopt;
}

} // namespace casechain::domain
