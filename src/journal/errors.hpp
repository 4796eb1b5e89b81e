#pragma once

#include <stdexcept>
#include <string>

namespace dailyfeels::journal {

class JournalError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed or missing field in a request; never retried.
class ValidationError : public JournalError {
public:
    ValidationError(const std::string& field, const std::string& problem)
        : JournalError(field + ": " + problem)
        , field_(field) {}

    const std::string& Field() const { return field_; }

private:
    std::string field_;
};

class NotFoundError : public JournalError {
public:
    using JournalError::JournalError;
};

// The store cannot be opened or a statement failed.
class PersistenceUnavailable : public JournalError {
public:
    using JournalError::JournalError;
};

}  // namespace dailyfeels::journal
