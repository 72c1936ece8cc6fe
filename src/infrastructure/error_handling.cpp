#include "infrastructure/error_handling.h"
#include <mutex>
#include <deque>
#include <unordered_map>
#include <ctime>

namespace testbox {

const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::UNSUPPORTED_PLATFORM: return "Unsupported platform";
        case ErrorCode::NO_RUNTIME_DETECTED: return "No runtime detected";
        case ErrorCode::DOWNLOAD_ERROR: return "Download error";
        case ErrorCode::CHECKSUM_MISMATCH: return "Checksum mismatch";
        case ErrorCode::ARCHIVE_FORMAT: return "Unsupported archive format";
        case ErrorCode::BINARY_NOT_FOUND: return "Binary not found in archive";
        case ErrorCode::COMMAND_NOT_FOUND: return "Command not found";
        case ErrorCode::SANDBOX_CREATION: return "Sandbox creation failed";
        case ErrorCode::INSTALL_FAILURE: return "Dependency install failed";
        case ErrorCode::EXECUTION_TIMEOUT: return "Execution timed out";
        case ErrorCode::EXECUTION_ERROR: return "Execution error";
        case ErrorCode::TEST_FAILURE: return "Test failure";
        case ErrorCode::SOURCE_ERROR: return "Source error";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::NOT_FOUND: return "Not found";
        case ErrorCode::INTERNAL_ERROR: return "Internal error";
        default: return "Unknown error";
    }
}

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::UNSUPPORTED_PLATFORM: return "UnsupportedPlatformError";
        case ErrorCode::NO_RUNTIME_DETECTED: return "NoRuntimeDetectedError";
        case ErrorCode::DOWNLOAD_ERROR: return "DownloadError";
        case ErrorCode::CHECKSUM_MISMATCH: return "ChecksumMismatchError";
        case ErrorCode::ARCHIVE_FORMAT: return "ArchiveFormatError";
        case ErrorCode::BINARY_NOT_FOUND: return "BinaryNotFoundError";
        case ErrorCode::COMMAND_NOT_FOUND: return "CommandNotFoundError";
        case ErrorCode::SANDBOX_CREATION: return "SandboxCreationError";
        case ErrorCode::INSTALL_FAILURE: return "InstallFailure";
        case ErrorCode::EXECUTION_TIMEOUT: return "ExecutionTimeout";
        case ErrorCode::EXECUTION_ERROR: return "ExecutionError";
        case ErrorCode::TEST_FAILURE: return "TestFailure";
        case ErrorCode::SOURCE_ERROR: return "SourceError";
        case ErrorCode::INVALID_ARGUMENT: return "InvalidArgument";
        case ErrorCode::NOT_FOUND: return "NotFound";
        case ErrorCode::INTERNAL_ERROR: return "InternalError";
        default: return "UnknownError";
    }
}

const char* severityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARNING";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

std::string describeError(const Error& error) {
    std::string msg = error.message.empty() ? errorToString(error.code) : error.message;
    if (!error.context.empty()) {
        msg += " [" + error.context + "]";
    }
    return msg;
}

Exception::Exception(Error error)
    : std::runtime_error(describeError(error)), error_(std::move(error)) {
    if (error_.timestamp == 0) {
        error_.timestamp = static_cast<uint64_t>(std::time(nullptr));
    }
}

void throwIfError(const Error& error) {
    if (error.code != ErrorCode::OK) {
        throw Exception(error);
    }
}

Error makeError(ErrorCode code, const std::string& message) {
    Error err;
    err.code = code;
    err.severity = ErrorSeverity::ERROR;
    err.message = message;
    err.timestamp = static_cast<uint64_t>(std::time(nullptr));
    return err;
}

Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    Error err = makeError(code, message);
    err.context = context;
    return err;
}

struct ErrorHandler::Impl {
    std::function<void(const Error&)> handler;
    std::deque<Error> recentErrors;
    std::unordered_map<int, uint64_t> errorCounts;
    uint64_t totalErrors = 0;
    mutable std::mutex mtx;
    static constexpr size_t MAX_RECENT_ERRORS = 100;
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
    std::function<void(const Error&)> cb;
    Error err = error;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        if (err.timestamp == 0) {
            err.timestamp = static_cast<uint64_t>(std::time(nullptr));
        }

        impl_->recentErrors.push_back(err);
        if (impl_->recentErrors.size() > Impl::MAX_RECENT_ERRORS) {
            impl_->recentErrors.pop_front();
        }

        impl_->totalErrors++;
        impl_->errorCounts[static_cast<int>(err.code)]++;
        cb = impl_->handler;
    }

    if (cb) {
        cb(err);
    }
}

void ErrorHandler::handle(ErrorCode code, const std::string& message) {
    handle(makeError(code, message));
}

std::vector<Error> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<Error> result;
    size_t start = impl_->recentErrors.size() > count ?
                   impl_->recentErrors.size() - count : 0;
    for (size_t i = impl_->recentErrors.size(); i > start; i--) {
        result.push_back(impl_->recentErrors[i - 1]);
    }
    return result;
}

void ErrorHandler::clearErrors() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->recentErrors.clear();
    impl_->errorCounts.clear();
    impl_->totalErrors = 0;
}

uint64_t ErrorHandler::getErrorCount() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->totalErrors;
}

uint64_t ErrorHandler::getErrorCount(ErrorCode code) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->errorCounts.find(static_cast<int>(code));
    return it != impl_->errorCounts.end() ? it->second : 0;
}

Error ErrorHandler::getLastError() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->recentErrors.empty()) {
        return Error{};
    }
    return impl_->recentErrors.back();
}

}
