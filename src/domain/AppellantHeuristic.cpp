/**
 * @file AppellantHeuristic.cpp
 * @brief Implementation of AppellantHeuristic.
 */

#include "domain/AppellantHeuristic.hpp"

#include <algorithm>

#include "domain/TextFold.hpp"

namespace casechain::domain {

namespace {

void FoldAll(std::vector<std::string>& keywords) {
    for (auto& keyword : keywords) {
        keyword = TextFold::Fold(keyword);
    }
}

bool Contains(const std::vector<int>& codes, int code) {
    return std::find(codes.begin(), codes.end(), code) != codes.end();
}

} // namespace

AppellantHeuristic::AppellantHeuristic(AppellantHeuristicConfig config)
    : m_config(std::move(config)) {
    FoldAll(m_config.employeeKeywords);
    FoldAll(m_config.employerKeywords);
    FoldAll(m_config.weakEmployeeKeywords);
}

void AppellantHeuristic::score(const Subject& subject, AppellantGuess& guess) const {
    // One category per subject: employee terms first, then employer, then weak hints.
    if (Contains(m_config.employeeSubjectCodes, subject.code) ||
        TextFold::ContainsAny(subject.name, m_config.employeeKeywords)) {
        guess.employeeScore += m_config.strongWeight;
    } else if (Contains(m_config.employerSubjectCodes, subject.code) ||
               TextFold::ContainsAny(subject.name, m_config.employerKeywords)) {
        guess.employerScore += m_config.strongWeight;
    } else if (TextFold::ContainsAny(subject.name, m_config.weakEmployeeKeywords)) {
        guess.employeeScore += m_config.weakWeight;
    }
}

AppellantGuess AppellantHeuristic::decide(AppellantGuess guess) const {
    if (guess.employeeScore > guess.employerScore) {
        guess.appellant = Party::Employee;
    } else if (guess.employerScore > guess.employeeScore) {
        guess.appellant = Party::Employer;
    } else {
        guess.appellant = m_config.tieBreakAppellant;
        guess.tie = true;
    }
    return guess;
}

AppellantGuess AppellantHeuristic::infer(const std::vector<Subject>& subjects) const {
    AppellantGuess guess;
    for (const auto& subject : subjects) {
        score(subject, guess);
    }
    return decide(guess);
}

AppellantGuess AppellantHeuristic::infer(const std::vector<CaseRecordPtr>& records) const {
    AppellantGuess guess;
    for (const auto& record : records) {
        if (!record) continue;
        for (const auto& subject : record->subjects) {
            score(subject, guess);
        }
    }
    return decide(guess);
}

} // namespace casechain::domain
