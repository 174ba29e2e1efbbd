#pragma once
#include <stdexcept>
#include <string>

// Failure reported by a reasoning backend. status is the upstream HTTP status, 0 if none.
struct ReasoningError : std::runtime_error {
    ReasoningError(long status, const std::string& what) : std::runtime_error(what), status(status) {}
    long status{0};
};

class ReasoningEngine {
public:
    virtual ~ReasoningEngine() = default;
    // role selects the persona/system prompt; prompt is the full stage input.
    virtual std::string complete(const std::string& role, const std::string& prompt) = 0;
};
