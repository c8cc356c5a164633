#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace hybridrag {

/**
 * Structured error reporting for the retrieval orchestration layer.
 *
 * Branch-level failures (one retrieval call, the generation stage) are
 * absorbed by the orchestrator and pipeline; only RetrievalFailure and
 * argument/configuration errors reach callers of the public operations.
 */

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,
    CONFIGURATION_INVALID = 2,
    CANCELLED = 3,

    // Retrieval
    RETRIEVAL_TIMEOUT = 100,
    RETRIEVAL_FAILED = 101,
    CIRCUIT_OPEN = 102,

    // Generation
    GENERATION_TIMEOUT = 200,
    GENERATION_FAILED = 201,

    // Transport
    NETWORK_TIMEOUT = 400,
    CONNECTION_FAILED = 401,
    HTTP_STATUS = 402,
    PROTOCOL_ERROR = 403,

    INTERNAL_ERROR = 500
};

const char* to_string(ErrorCode code) noexcept;

class HybridRagException : public std::runtime_error {
public:
    explicit HybridRagException(ErrorCode code, const std::string& message,
                                const std::string& context = "")
        : std::runtime_error(format_message(code, message, context))
        , code_(code)
        , context_(context) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context) {
        std::string result = "hybridrag error [" + std::string(to_string(code)) + "]: " + message;
        if (!context.empty()) {
            result += " (" + context + ")";
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
};

class InvalidArgumentError : public HybridRagException {
public:
    explicit InvalidArgumentError(const std::string& message, const std::string& context = "")
        : HybridRagException(ErrorCode::INVALID_ARGUMENT, message, context) {}
};

class ConfigurationError : public HybridRagException {
public:
    explicit ConfigurationError(const std::string& message, const std::string& context = "")
        : HybridRagException(ErrorCode::CONFIGURATION_INVALID, message, context) {}
};

class CancelledError : public HybridRagException {
public:
    explicit CancelledError(const std::string& message = "operation cancelled",
                            const std::string& context = "")
        : HybridRagException(ErrorCode::CANCELLED, message, context) {}
};

// One retrieval branch exceeded its sub-deadline. Recovered locally.
class RetrievalTimeout : public HybridRagException {
public:
    explicit RetrievalTimeout(const std::string& message, const std::string& context = "")
        : HybridRagException(ErrorCode::RETRIEVAL_TIMEOUT, message, context) {}
};

// Every retrieval branch failed or timed out. Surfaced to the caller.
class RetrievalFailure : public HybridRagException {
public:
    explicit RetrievalFailure(const std::string& message, const std::string& context = "")
        : HybridRagException(ErrorCode::RETRIEVAL_FAILED, message, context) {}
};

class CircuitOpenError : public HybridRagException {
public:
    explicit CircuitOpenError(const std::string& breaker_name)
        : HybridRagException(ErrorCode::CIRCUIT_OPEN, "circuit open, call rejected", breaker_name)
        , breaker_name_(breaker_name) {}

    const std::string& breaker_name() const noexcept { return breaker_name_; }

private:
    std::string breaker_name_;
};

class GenerationTimeout : public HybridRagException {
public:
    explicit GenerationTimeout(const std::string& message, const std::string& context = "")
        : HybridRagException(ErrorCode::GENERATION_TIMEOUT, message, context) {}
};

class GenerationFailure : public HybridRagException {
public:
    explicit GenerationFailure(const std::string& message, const std::string& context = "")
        : HybridRagException(ErrorCode::GENERATION_FAILED, message, context) {}
};

class TransportError : public HybridRagException {
public:
    explicit TransportError(ErrorCode code, const std::string& message, const std::string& context = "")
        : HybridRagException(code, message, context) {}
};

class ProtocolError : public HybridRagException {
public:
    explicit ProtocolError(const std::string& message, const std::string& context = "")
        : HybridRagException(ErrorCode::PROTOCOL_ERROR, message, context) {}
};

// Best-effort human readable description of a captured exception.
std::string describe(const std::exception_ptr& error);

// Macros for common error checking
#define HYBRIDRAG_CHECK(condition, code, message) \
    do { \
        if (!(condition)) { \
            throw ::hybridrag::HybridRagException(code, message, __func__); \
        } \
    } while (0)

#define HYBRIDRAG_CHECK_ARGUMENT(condition, message) \
    do { \
        if (!(condition)) { \
            throw ::hybridrag::InvalidArgumentError(message, __func__); \
        } \
    } while (0)

} // namespace hybridrag
