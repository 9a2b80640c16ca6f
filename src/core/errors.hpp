#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Base for every error raised by the analysis engine. "Not enough data" is
// never an error: those paths return a defined default instead.
class AnalysisError : public std::runtime_error {
public:
  explicit AnalysisError(const std::string &msg) : std::runtime_error(msg) {}
};

// Malformed arguments (mismatched lengths, negative sensitivity, unordered
// series). Fatal to the single call that received them.
class InvalidInputError : public AnalysisError {
public:
  explicit InvalidInputError(const std::string &msg) : AnalysisError(msg) {}
};

// A metrics query or alert dispatch failed. Recoverable: the affected source
// is skipped and the run continues.
class CollaboratorError : public AnalysisError {
public:
  explicit CollaboratorError(const std::string &msg) : AnalysisError(msg) {}
};

// Out-of-range configuration detected while constructing a job.
class ConfigurationError : public AnalysisError {
public:
  explicit ConfigurationError(const std::string &msg) : AnalysisError(msg) {}
};

#endif // ERRORS_HPP
