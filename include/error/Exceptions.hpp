#pragma once

#include <stdexcept>
#include <string>

namespace ad::error {

// A rule that cannot be compiled. Raised before any inventory is built.
struct MalformedIgnoreRule : std::runtime_error {
    MalformedIgnoreRule(const std::string& rule, const std::string& reason)
        : std::runtime_error("Malformed ignore rule '" + rule + "': " + reason), rule(rule), reason(reason) {}

    std::string rule, reason;
};

struct PackageDatabaseUnavailable : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Any read or write failure that is neither "not found" nor "permission denied".
struct IOError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct RepoListingFailed : IOError {
    using IOError::IOError;
};

}
