#pragma once

#include <stdexcept>
#include <string>

namespace isoholdem {

// Malformed card text, hand text, packed hand code, or dataset content.
// The only error the command-line driver recovers from.
class ParseError : public std::invalid_argument {
public:
    explicit ParseError(const std::string& what)
        : std::invalid_argument(what) {}
};

// A required table is absent (or incomplete) and cannot be built here
class DatasetMissingError : public std::runtime_error {
public:
    explicit DatasetMissingError(const std::string& what)
        : std::runtime_error(what) {}
};

// A canonical query was not found in a table that is assumed complete
class DatasetLookupMiss : public std::logic_error {
public:
    explicit DatasetLookupMiss(const std::string& what)
        : std::logic_error(what) {}
};

// Canonicalizer output failed its own validity check
class CanonicalizationInvariantViolation : public std::logic_error {
public:
    explicit CanonicalizationInvariantViolation(const std::string& what)
        : std::logic_error(what) {}
};

} // namespace isoholdem
