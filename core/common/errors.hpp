#pragma once

#include <stdexcept>
#include <string>

namespace kchoice {

// ─── Error Taxonomy ────────────────────────────────────────────
// Every failure is local and fatal: the computation is pure and
// deterministic, so a retry would reproduce the same fault.

/// Non-positive or non-finite value/weight, or mismatched inputs.
class InvalidInstanceError : public std::runtime_error {
public:
    explicit InvalidInstanceError(const std::string& what)
        : std::runtime_error(what) {}
};

/// Negative or non-finite capacity.
class InfeasibleQueryError : public std::runtime_error {
public:
    explicit InfeasibleQueryError(const std::string& what)
        : std::runtime_error(what) {}
};

/// Probability mass drifted away from 1, or weights cannot be normalised.
class NumericDriftError : public std::runtime_error {
public:
    explicit NumericDriftError(const std::string& what)
        : std::runtime_error(what) {}
};

/// Two different subproblems resolved to the same cache identity.
class CacheInconsistencyError : public std::runtime_error {
public:
    explicit CacheInconsistencyError(const std::string& what)
        : std::runtime_error(what) {}
};

/// Behavioural parameters, thresholds or targets outside their domain.
class InvalidParameterError : public std::invalid_argument {
public:
    explicit InvalidParameterError(const std::string& what)
        : std::invalid_argument(what) {}
};

/// A scoring function returned a negative or non-finite weight.
class ScoringError : public std::runtime_error {
public:
    explicit ScoringError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace kchoice
