#pragma once
#include <map>
#include <string>
#include "../../interview_core/include/reasoning.hpp"

struct LlmConfig {
    std::string ollama_url{"http://localhost:11434"};
    std::string llm_model{"mistral"};
    int timeout_ms{240000};
    std::map<std::string, std::string> system_prompts; // role -> system prompt, overrides defaults
};

// ReasoningEngine backed by an Ollama-compatible /api/chat endpoint.
class OllamaClient : public ReasoningEngine {
public:
    explicit OllamaClient(LlmConfig cfg);

    // Throws ReasoningError with the upstream status on non-2xx replies.
    std::string complete(const std::string& role, const std::string& prompt) override;
    // True when the server answers /api/tags.
    bool reachable() const;

    std::string system_prompt(const std::string& role) const;
    const LlmConfig& config() const { return cfg_; }

private:
    LlmConfig cfg_;
};
