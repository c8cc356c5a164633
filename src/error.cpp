#include "hybridrag/error.hpp"

namespace hybridrag {

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SUCCESS: return "success";
        case ErrorCode::INVALID_ARGUMENT: return "invalid_argument";
        case ErrorCode::CONFIGURATION_INVALID: return "configuration_invalid";
        case ErrorCode::CANCELLED: return "cancelled";
        case ErrorCode::RETRIEVAL_TIMEOUT: return "retrieval_timeout";
        case ErrorCode::RETRIEVAL_FAILED: return "retrieval_failed";
        case ErrorCode::CIRCUIT_OPEN: return "circuit_open";
        case ErrorCode::GENERATION_TIMEOUT: return "generation_timeout";
        case ErrorCode::GENERATION_FAILED: return "generation_failed";
        case ErrorCode::NETWORK_TIMEOUT: return "network_timeout";
        case ErrorCode::CONNECTION_FAILED: return "connection_failed";
        case ErrorCode::HTTP_STATUS: return "http_status";
        case ErrorCode::PROTOCOL_ERROR: return "protocol_error";
        case ErrorCode::INTERNAL_ERROR: return "internal_error";
    }
    return "unknown";
}

std::string describe(const std::exception_ptr& error) {
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

} // namespace hybridrag
