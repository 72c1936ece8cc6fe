#pragma once

#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <stdexcept>
#include <cstdint>

namespace testbox {

enum class ErrorCode {
    OK = 0,
    UNSUPPORTED_PLATFORM,
    NO_RUNTIME_DETECTED,
    DOWNLOAD_ERROR,
    CHECKSUM_MISMATCH,
    ARCHIVE_FORMAT,
    BINARY_NOT_FOUND,
    COMMAND_NOT_FOUND,
    SANDBOX_CREATION,
    INSTALL_FAILURE,
    EXECUTION_TIMEOUT,
    EXECUTION_ERROR,
    TEST_FAILURE,
    SOURCE_ERROR,
    INVALID_ARGUMENT,
    NOT_FOUND,
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
    std::string context;
    std::string file;
    int line;
    uint64_t timestamp;

    Error() : code(ErrorCode::OK), severity(ErrorSeverity::INFO), line(0), timestamp(0) {}
    Error(ErrorCode c, const std::string& msg) : code(c), severity(ErrorSeverity::ERROR), message(msg), line(0), timestamp(0) {}
    Error(ErrorCode c, ErrorSeverity s, const std::string& msg, const std::string& ctx,
          const std::string& f, int l, uint64_t ts)
        : code(c), severity(s), message(msg), context(ctx), file(f), line(l), timestamp(ts) {}
};

template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_(), hasValue_(true) {}
    Result(Error error) : value_(), error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }

    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }

    T valueOr(const T& defaultValue) const { return hasValue_ ? value_ : defaultValue; }

private:
    T value_;
    Error error_;
    bool hasValue_;
};

template<>
class Result<void> {
public:
    Result() : error_(), hasValue_(true) {}
    Result(Error error) : error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }
    const Error& error() const { return error_; }

private:
    Error error_;
    bool hasValue_;
};

// Thrown by provisioning code; converted back into Result at service boundaries.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error);

    const Error& error() const { return error_; }
    ErrorCode code() const { return error_.code; }

private:
    Error error_;
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
    Error getLastError() const;

private:
    ErrorHandler();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

const char* errorToString(ErrorCode code);
const char* errorCodeName(ErrorCode code);
const char* severityToString(ErrorSeverity severity);
std::string describeError(const Error& error);
void throwIfError(const Error& error);

Error makeError(ErrorCode code, const std::string& message);
Error makeError(ErrorCode code, const std::string& message, const std::string& context);

#define TESTBOX_ERROR(code, msg, ctx) testbox::Error{code, testbox::ErrorSeverity::ERROR, msg, ctx, __FILE__, __LINE__, 0}
#define TESTBOX_THROW(code, msg, ctx) throw testbox::Exception(TESTBOX_ERROR(code, msg, ctx))

}
