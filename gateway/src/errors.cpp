
#include "errors.hpp"

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION:
            return "validation_error";
        case ErrorKind::UNSUPPORTED_CLIENT_TYPE:
            return "unsupported_client_type";
        case ErrorKind::ADAPTER_NOT_READY:
            return "adapter_not_ready";
        case ErrorKind::PROCESSING_FAILURE:
            return "processing_failure";
    }
    return "unknown";
}

GatewayError::GatewayError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

ValidationError::ValidationError(const std::string& message)
    : GatewayError(ErrorKind::VALIDATION, message) {}

UnsupportedClientType::UnsupportedClientType(const std::string& tag)
    : GatewayError(ErrorKind::UNSUPPORTED_CLIENT_TYPE, "Unsupported client type: " + tag), tag_(tag) {}

AdapterNotReady::AdapterNotReady(const std::string& adapter_name)
    : GatewayError(ErrorKind::ADAPTER_NOT_READY, adapter_name + " adapter is not ready") {}

ProcessingFailure::ProcessingFailure(const std::string& message)
    : GatewayError(ErrorKind::PROCESSING_FAILURE, message) {}
