#pragma once
/**
 * @file Errors.hpp
 * @brief Exception types raised by the descriptor library.
 *
 * @details
 * - ConfigurationError: invalid problem setup detected synchronously at
 *   construction (unknown method/direction, inconsistent grid, bad config).
 * - IntegrationError: one or more subproblems of an ensemble failed to
 *   integrate (stage iteration diverged, non-finite state, user callback threw).
 */

#include "common.hpp"

/**
 * @class ConfigurationError
 * @brief Raised when a problem or configuration value is not recognised.
 */
class ConfigurationError : public std::invalid_argument
{
  public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @class IntegrationError
 * @brief Raised after an ensemble run in which subproblems failed.
 */
class IntegrationError : public std::runtime_error
{
  public:
    IntegrationError(const std::string& what, std::vector<size_t> failedIn)
        : std::runtime_error(what), failed(std::move(failedIn)) {}

    /// Subproblem indices that failed, ascending.
    const std::vector<size_t>& failedIndices() const { return failed; }

  private:
    std::vector<size_t> failed;
};
