#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace tape::domain {

class TapeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Network, timeout, 5xx or rate-limit failure that survived every retry.
class TransientFetchError : public TapeError {
public:
    using TapeError::TapeError;
};

// The exchange rejected the request itself (unknown symbol, bad parameter).
class PermanentFetchError : public TapeError {
public:
    PermanentFetchError(const std::string& message, unsigned httpStatus, std::optional<long long> exchangeCode)
        : TapeError(message), httpStatus_(httpStatus), exchangeCode_(exchangeCode) {}

    explicit PermanentFetchError(const std::string& message) : TapeError(message) {}

    unsigned httpStatus() const noexcept { return httpStatus_; }
    const std::optional<long long>& exchangeCode() const noexcept { return exchangeCode_; }

private:
    unsigned httpStatus_{0U};
    std::optional<long long> exchangeCode_;
};

class ValidationError : public TapeError {
public:
    using TapeError::TapeError;
};

class StaleWriteError : public TapeError {
public:
    using TapeError::TapeError;
};

class ConcurrentIngestionError : public TapeError {
public:
    using TapeError::TapeError;
};

class CorruptPartitionError : public TapeError {
public:
    using TapeError::TapeError;
};

}  // namespace tape::domain
