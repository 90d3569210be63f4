#pragma once

#include <stdexcept>
#include <string>

namespace loanprep {

class LoanPrepException : public std::runtime_error {
public:
    explicit LoanPrepException(const std::string& message) : std::runtime_error(message) {}
};

/// Input dataset path does not name an existing regular file.
class DatasetNotFound : public LoanPrepException {
public:
    explicit DatasetNotFound(const std::string& path)
        : LoanPrepException("dataset not found: " + path) {}
};

/// A required column is absent from the (header-trimmed) table.
class MissingColumn : public LoanPrepException {
public:
    explicit MissingColumn(const std::string& column)
        : LoanPrepException("required column missing: " + column) {}
};

/// A required numeric cell is empty or not a finite number.
class NumericConversionFailure : public LoanPrepException {
public:
    explicit NumericConversionFailure(const std::string& message)
        : LoanPrepException("numeric conversion failed: " + message) {}
};

class EvaluationFailure : public LoanPrepException {
public:
    explicit EvaluationFailure(const std::string& message)
        : LoanPrepException("evaluation failed: " + message) {}
};

class SerializationFailure : public LoanPrepException {
public:
    explicit SerializationFailure(const std::string& message)
        : LoanPrepException("serialization failed: " + message) {}
};

} // namespace loanprep
