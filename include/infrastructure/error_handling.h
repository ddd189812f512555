#pragma once

#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <stdexcept>
#include <utility>
#include <cstdint>

namespace sigelnet {

enum class ErrorCode {
    OK = 0,
    VALIDATION_ERROR,
    CONSENSUS_CONFLICT,
    TRANSPORT_ERROR,
    RESOURCE_EXHAUSTED,
    STORAGE_ERROR,
    NOT_FOUND,
    ALREADY_EXISTS,
    INVALID_ARGUMENT,
    INVALID_STATE,
    INTERNAL_ERROR
};

enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

struct Error {
    ErrorCode code;
    ErrorSeverity severity;
    std::string message;
    uint64_t timestamp;

    Error() : code(ErrorCode::OK), severity(ErrorSeverity::INFO), timestamp(0) {}
    Error(ErrorCode c, const std::string& msg) : code(c), severity(ErrorSeverity::ERROR), message(msg), timestamp(0) {}
};

// Either a value or an error of type E. E defaults to Error; ledger
// operations use their own reject reasons.
template<typename T, typename E = Error>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_(), hasValue_(true) {}
    Result(E error) : value_(), error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }
    explicit operator bool() const { return hasValue_; }

    const T& value() const { return value_; }
    T& value() { return value_; }
    const E& error() const { return error_; }

    T valueOr(const T& defaultValue) const { return hasValue_ ? value_ : defaultValue; }

private:
    T value_;
    E error_;
    bool hasValue_;
};

template<typename E>
class Result<void, E> {
public:
    Result() : error_(), hasValue_(true) {}
    Result(E error) : error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }
    explicit operator bool() const { return hasValue_; }
    const E& error() const { return error_; }

private:
    E error_;
    bool hasValue_;
};

// Raised when durable state cannot be written or read back. The node
// treats it as fatal.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

class ErrorHandler {
public:
    static ErrorHandler& instance();

    void setHandler(std::function<void(const Error&)> handler);
    void handle(const Error& error);
    void handle(ErrorCode code, const std::string& message);

    std::vector<Error> getRecentErrors(size_t count = 10) const;
    void clearErrors();

    uint64_t getErrorCount() const;
    uint64_t getErrorCount(ErrorCode code) const;
    bool hasCriticalErrors() const;

private:
    ErrorHandler();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

const char* errorToString(ErrorCode code);
const char* severityToString(ErrorSeverity severity);

Error makeError(ErrorCode code, const std::string& message);
Error makeCritical(ErrorCode code, const std::string& message);

}
