/**
 * @file CaseNumber.cpp
 * @brief Implementation of CaseNumber.
 */

#include "domain/CaseNumber.hpp"

#include <cctype>

namespace casechain::domain {

std::string CaseNumber::DigitsOnly(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (unsigned char c : raw) {
        if (std::isdigit(c)) {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

std::optional<CnjComponents> CaseNumber::Parse(const std::string& raw) {
    std::string digits = DigitsOnly(raw);
    if (digits.size() < kFullLength) {
        return std::nullopt;
    }

    CnjComponents c;
    c.sequential = digits.substr(0, 7);
    c.checkDigits = digits.substr(7, 2);
    c.year = digits.substr(9, 4);
    c.branch = digits.substr(13, 1);
    c.court = digits.substr(14, 2);
    c.origin = digits.substr(16, 4);
    c.digits = std::move(digits);
    return c;
}

} // namespace casechain::domain
