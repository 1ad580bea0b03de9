/**
 * @file InvalidBatchError.hpp
 * @brief Fatal error raised at the batch boundary.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace casechain::domain {

/**
 * @class InvalidBatchError
 * @brief Structurally invalid input batch. The only fatal error of a run.
 */
class InvalidBatchError : public std::runtime_error {
public:
    explicit InvalidBatchError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace casechain::domain
