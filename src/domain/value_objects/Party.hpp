/**
 * @file Party.hpp
 * @brief Value Object naming a side of a labor lawsuit.
 */

#pragma once

#include <optional>
#include <string>

namespace casechain::domain {

enum class Party {
    Employee,
    Employer,
    Unknown
};

inline std::string PartyToString(Party party) {
    switch (party) {
        case Party::Employee: return "Employee";
        case Party::Employer: return "Employer";
        case Party::Unknown: return "Unknown";
    }
    return "Unknown";
}

inline std::optional<Party> PartyFromString(const std::string& value) {
    if (value == "Employee" || value == "employee") return Party::Employee;
    if (value == "Employer" || value == "employer") return Party::Employer;
    if (value == "Unknown" || value == "unknown") return Party::Unknown;
    return std::nullopt;
}

} // namespace casechain::domain
