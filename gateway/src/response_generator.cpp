
#include "response_generator.hpp"
#include <fmt/format.h>

std::string EchoResponseGenerator::generate(const CanonicalMessage& message) {
    return fmt::format(
        "Received message: {}\n\n"
        "This is a demo reply from the gateway. Plug a ResponseGenerator in to answer for real.",
        message.content());
}
