/**
 * @file TextFold.hpp
 * @brief Case folding for keyword matching over Portuguese registry text.
 */

#pragma once

#include <string>
#include <vector>

namespace casechain::domain {

class TextFold {
public:
    /**
     * @brief Lowercases ASCII letters and the Latin-1 uppercase range encoded in UTF-8
     * (Á, Ç, Ê, Õ...), leaving every other byte untouched.
     */
    static std::string Fold(const std::string& input);

    /** @brief True if the folded haystack contains any of the (already folded) needles. */
    static bool ContainsAny(const std::string& haystack, const std::vector<std::string>& needles);
};

} // namespace casechain::domain
