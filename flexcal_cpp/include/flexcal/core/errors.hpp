#pragma once

#include <stdexcept>
#include <string>

namespace flexcal {

class FlexcalError : public std::runtime_error {
public:
    explicit FlexcalError(const std::string& message)
        : std::runtime_error(message) {}
};

class SchemaError : public FlexcalError {
public:
    explicit SchemaError(const std::string& message)
        : FlexcalError("Schema error: " + message) {}
};

class DuplicateKeyError : public SchemaError {
public:
    explicit DuplicateKeyError(const std::string& key)
        : SchemaError("Keyword " + key + " already exists and cannot be added"),
          key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

class ValidationError : public FlexcalError {
public:
    explicit ValidationError(const std::string& message)
        : FlexcalError("Validation error: " + message) {}
};

// Value has a type outside the declared dtypes, or is not invocable when it
// must be.
class TypeError : public ValidationError {
public:
    explicit TypeError(const std::string& message)
        : ValidationError("Type error: " + message) {}
};

class SchemaMismatchError : public FlexcalError {
public:
    explicit SchemaMismatchError(const std::string& message)
        : FlexcalError("Schema mismatch: " + message) {}
};

class ConfigurationError : public FlexcalError {
public:
    explicit ConfigurationError(const std::string& message)
        : FlexcalError("Configuration error: " + message) {}
};

class IOError : public FlexcalError {
public:
    explicit IOError(const std::string& message)
        : FlexcalError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

class FlexureError : public FlexcalError {
public:
    explicit FlexureError(const std::string& message)
        : FlexcalError("Flexure error: " + message) {}
};

class UnsupportedExtractionMethod : public FlexureError {
public:
    explicit UnsupportedExtractionMethod(const std::string& method)
        : FlexureError("Not ready for this flexure method: " + method),
          method_(method) {}

    const std::string& method() const { return method_; }

private:
    std::string method_;
};

// Extraction arrays that cannot be correlated (e.g. wave and sky lengths differ)
class InvalidExtraction : public FlexureError {
public:
    explicit InvalidExtraction(const std::string& message)
        : FlexureError("Invalid extraction: " + message) {}
};

class InsufficientOverlap : public FlexureError {
public:
    InsufficientOverlap(int n_overlap, int n_required)
        : FlexureError("Not enough overlap between sky spectra (" +
                       std::to_string(n_overlap) + " < " +
                       std::to_string(n_required) + " samples)"),
          n_overlap_(n_overlap) {}

    int n_overlap() const { return n_overlap_; }

private:
    int n_overlap_;
};

} // namespace flexcal
