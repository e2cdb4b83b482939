
#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
    VALIDATION,
    UNSUPPORTED_CLIENT_TYPE,
    ADAPTER_NOT_READY,
    PROCESSING_FAILURE
};

std::string to_string(ErrorKind kind);

class GatewayError : public std::runtime_error {
public:
    GatewayError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Malformed inbound payload: missing field, wrong type, unknown enum value.
class ValidationError : public GatewayError {
public:
    explicit ValidationError(const std::string& message);
};

class UnsupportedClientType : public GatewayError {
public:
    explicit UnsupportedClientType(const std::string& tag);

    const std::string& tag() const { return tag_; }

private:
    std::string tag_;
};

class AdapterNotReady : public GatewayError {
public:
    explicit AdapterNotReady(const std::string& adapter_name);
};

class ProcessingFailure : public GatewayError {
public:
    explicit ProcessingFailure(const std::string& message);
};
