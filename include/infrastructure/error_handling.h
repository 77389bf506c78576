#pragma once

#include <string>
#include <functional>
#include <memory>
#include <cstdint>

namespace phichain {

enum class ErrorCode {
    OK = 0,
    REJECTED_SYMMETRY,
    INVALID_ARGUMENT,
    INVALID_DIRECTION,
    FILE_NOT_FOUND,
    CRYPTO_ERROR,
    INTERNAL_ERROR
};

struct Error {
    ErrorCode code = ErrorCode::OK;
    std::string message;
    std::string context;
    uint64_t timestamp = 0;
};

// Value or the Error explaining why there is none. Used for outcomes a
// caller is expected to handle, such as a symmetry rejection.
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), hasValue_(true) {}
    Result(Error error) : value_(), error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }

    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }

private:
    T value_;
    Error error_;
    bool hasValue_;
};

// Process-wide tally of reported errors. The ledger never reports into it;
// front ends decide which outcomes are worth recording.
class ErrorHandler {
public:
    static ErrorHandler& instance();

    // Invoked for every handled error, outside the registry lock.
    void setHandler(std::function<void(const Error&)> handler);
    // Stamps the time and, when the error has none, the current context.
    void handle(const Error& error);

    void pushContext(const std::string& context);
    void popContext();

    uint64_t getErrorCount() const;
    uint64_t getErrorCount(ErrorCode code) const;

private:
    ErrorHandler();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

class ScopedContext {
public:
    explicit ScopedContext(const std::string& ctx);
    ~ScopedContext();
    ScopedContext(const ScopedContext&) = delete;
    ScopedContext& operator=(const ScopedContext&) = delete;
};

// Stable upper-case identifier, e.g. "REJECTED_SYMMETRY".
const char* errorToString(ErrorCode code);

Error makeError(ErrorCode code, const std::string& message, const std::string& context = "");

#define PHICHAIN_CONTEXT(name) phichain::ScopedContext _ctx_##__LINE__(name)

}
