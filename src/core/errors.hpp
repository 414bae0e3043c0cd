#ifndef PIIANON_CORE_ERRORS_HPP
#define PIIANON_CORE_ERRORS_HPP

#include <string>
#include <stdexcept>

/**
 * @file errors.hpp
 * @brief Typed failures raised by the anonymization core.
 *
 * All errors derive from AnonymizerError (a std::runtime_error), so callers that
 * only care about "did it work" can catch one type, while the CLI boundary can
 * tell client errors from engine faults.
 *
 * None of these are retried or swallowed inside the core.
 */

namespace piianon {
namespace core {

class AnonymizerError : public std::runtime_error
{
public:
    explicit AnonymizerError(const std::string &msg)
        : std::runtime_error(msg)
    {
    }
};

/// The structure walker received a value with no JSON representation.
class UnsupportedTypeError : public AnonymizerError
{
public:
    explicit UnsupportedTypeError(const std::string &msg)
        : AnonymizerError(msg)
    {
    }
};

/// Unknown operator kind.
class InvalidOperatorError : public AnonymizerError
{
public:
    explicit InvalidOperatorError(const std::string &msg)
        : AnonymizerError(msg)
    {
    }
};

/// Operator kind is known but one of its parameters is out of range.
class InvalidOperatorParamsError : public AnonymizerError
{
public:
    explicit InvalidOperatorParamsError(const std::string &msg)
        : AnonymizerError(msg)
    {
    }
};

/// encrypt requested without a key.
class MissingKeyError : public AnonymizerError
{
public:
    explicit MissingKeyError(const std::string &msg)
        : AnonymizerError(msg)
    {
    }
};

/// Internal fault of the detection engine, surfaced unmodified.
class DetectionEngineError : public AnonymizerError
{
public:
    explicit DetectionEngineError(const std::string &msg)
        : AnonymizerError(msg)
    {
    }
};

/// Input nested deeper than the configured limit.
class DepthExceededError : public AnonymizerError
{
public:
    explicit DepthExceededError(const std::string &msg)
        : AnonymizerError(msg)
    {
    }
};

/// Malformed request document or request field.
class InvalidRequestError : public AnonymizerError
{
public:
    explicit InvalidRequestError(const std::string &msg)
        : AnonymizerError(msg)
    {
    }
};

/// Malformed configuration line or value.
class ConfigError : public AnonymizerError
{
public:
    explicit ConfigError(const std::string &msg)
        : AnonymizerError(msg)
    {
    }
};

} // namespace core
} // namespace piianon

#endif // PIIANON_CORE_ERRORS_HPP
