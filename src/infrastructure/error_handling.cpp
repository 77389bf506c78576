#include "infrastructure/error_handling.h"
#include <array>
#include <ctime>
#include <mutex>
#include <vector>

namespace phichain {

const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::REJECTED_SYMMETRY: return "REJECTED_SYMMETRY";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::INVALID_DIRECTION: return "INVALID_DIRECTION";
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::CRYPTO_ERROR: return "CRYPTO_ERROR";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
    }
    return "INTERNAL_ERROR";
}

Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    Error err;
    err.code = code;
    err.message = message;
    err.context = context;
    err.timestamp = static_cast<uint64_t>(std::time(nullptr));
    return err;
}

static constexpr size_t ERROR_CODE_COUNT = static_cast<size_t>(ErrorCode::INTERNAL_ERROR) + 1;

struct ErrorHandler::Impl {
    std::function<void(const Error&)> handler;
    std::vector<std::string> contextStack;
    std::array<uint64_t, ERROR_CODE_COUNT> counts{};
    uint64_t total = 0;
    mutable std::mutex mtx;
};

ErrorHandler::ErrorHandler() : impl_(std::make_unique<Impl>()) {}

ErrorHandler& ErrorHandler::instance() {
    static ErrorHandler inst;
    return inst;
}

void ErrorHandler::setHandler(std::function<void(const Error&)> handler) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->handler = handler;
}

void ErrorHandler::handle(const Error& error) {
    Error err = error;
    std::function<void(const Error&)> handler;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        if (err.timestamp == 0) {
            err.timestamp = static_cast<uint64_t>(std::time(nullptr));
        }
        if (err.context.empty()) {
            for (const auto& c : impl_->contextStack) {
                if (!err.context.empty()) err.context += " > ";
                err.context += c;
            }
        }
        impl_->total++;
        impl_->counts[static_cast<size_t>(err.code) % ERROR_CODE_COUNT]++;
        handler = impl_->handler;
    }
    if (handler) handler(err);
}

void ErrorHandler::pushContext(const std::string& context) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->contextStack.push_back(context);
}

void ErrorHandler::popContext() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->contextStack.empty()) impl_->contextStack.pop_back();
}

uint64_t ErrorHandler::getErrorCount() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->total;
}

uint64_t ErrorHandler::getErrorCount(ErrorCode code) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->counts[static_cast<size_t>(code) % ERROR_CODE_COUNT];
}

ScopedContext::ScopedContext(const std::string& ctx) {
    ErrorHandler::instance().pushContext(ctx);
}

ScopedContext::~ScopedContext() {
    ErrorHandler::instance().popContext();
}

}
