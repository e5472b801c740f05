#ifndef SLIDESIFTERRORS_H
#define SLIDESIFTERRORS_H

#include <stdexcept>
#include <string>

/**
 * @brief A single candidate image could not be opened or decoded
 *
 * Thrown by ImageLoader and DHashCalculator. SlideReducer catches it per
 * candidate, so it never ends a deduplication run.
 */
class DecodeError : public std::runtime_error
{
public:
    explicit DecodeError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A run was requested with a setting it cannot work with
 *
 * Raised before any candidate is touched (e.g. a similarity threshold
 * outside [0, 1]).
 */
class InvalidConfiguration : public std::invalid_argument
{
public:
    explicit InvalidConfiguration(const std::string& message)
        : std::invalid_argument(message) {}
};

#endif // SLIDESIFTERRORS_H
