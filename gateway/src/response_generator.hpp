
#pragma once
#include "models.hpp"
#include <string>

// Produces reply content for messages the processor does not answer itself.
// Implementations may throw; the processor converts failures into error replies.
class ResponseGenerator {
public:
    virtual ~ResponseGenerator() = default;

    virtual std::string generate(const CanonicalMessage& message) = 0;
};

// Demo generator: echoes the inbound text back.
class EchoResponseGenerator : public ResponseGenerator {
public:
    std::string generate(const CanonicalMessage& message) override;
};
