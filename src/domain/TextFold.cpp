/**
 * @file TextFold.cpp
 * @brief Implementation of TextFold.
 */

#include "domain/TextFold.hpp"

#include <cctype>

namespace casechain::domain {

std::string TextFold::Fold(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (std::size_t i = 0; i < input.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        if (c == 0xC3 && i + 1 < input.size()) {
            unsigned char next = static_cast<unsigned char>(input[i + 1]);
            // U+00C0..U+00DE map to U+00E0..U+00FE, except the multiplication sign.
            if (next >= 0x80 && next <= 0x9E && next != 0x97) {
                next = static_cast<unsigned char>(next + 0x20);
            }
            out.push_back(static_cast<char>(c));
            out.push_back(static_cast<char>(next));
            ++i;
            continue;
        }
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

bool TextFold::ContainsAny(const std::string& haystack, const std::vector<std::string>& needles) {
    const std::string folded = Fold(haystack);
    for (const auto& needle : needles) {
        if (!needle.empty() && folded.find(needle) != std::string::npos) return true;
    }
    return false;
}

} // namespace casechain::domain
