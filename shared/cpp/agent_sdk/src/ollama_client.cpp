#include "../include/ollama_client.hpp"
#include "../include/http.hpp"
#include <nlohmann/json.hpp>
#include <utility>

using json = nlohmann::json;

namespace {
const std::map<std::string, std::string>& default_prompts() {
    static const std::map<std::string, std::string> prompts = {
        {"communicator", "You are a calm, empathetic medical intake assistant. You talk directly to the patient, "
                         "one short question at a time, in plain language. You never diagnose."},
        {"validator", "You are a careful clinical reviewer. You check patient-reported information for "
                      "completeness and consistency and you point out red flags."},
        {"reporter", "You are a clinical documentation assistant. You write structured, factual summaries "
                     "for physicians using only the information provided."},
    };
    return prompts;
}

// Ollama reports failures as {"error": "..."}; fall back to the raw body.
std::string error_message(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (j.contains("error")) {
            const auto& e = j["error"];
            if (e.is_string()) return e.get<std::string>();
            if (e.is_object() && e.contains("message")) return e["message"].get<std::string>();
        }
    } catch (const json::exception&) {
    }
    return body;
}
}

OllamaClient::OllamaClient(LlmConfig cfg) : cfg_(std::move(cfg)) {
    if (!cfg_.ollama_url.empty() && cfg_.ollama_url.back() == '/') cfg_.ollama_url.pop_back();
}

std::string OllamaClient::system_prompt(const std::string& role) const {
    auto it = cfg_.system_prompts.find(role);
    if (it != cfg_.system_prompts.end()) return it->second;
    auto d = default_prompts().find(role);
    if (d != default_prompts().end()) return d->second;
    return "You are a helpful assistant acting as " + role + ".";
}

std::string OllamaClient::complete(const std::string& role, const std::string& prompt) {
    json body = {
        {"model", cfg_.llm_model},
        {"stream", false},
        {"messages", json::array({
            json{{"role", "system"}, {"content", system_prompt(role)}},
            json{{"role", "user"}, {"content", prompt}}
        })}
    };
    auto r = http_post_json(cfg_.ollama_url + "/api/chat", body.dump(), cfg_.timeout_ms);
    if (r.status < 200 || r.status >= 300) {
        throw ReasoningError(r.status, "chat failed: status " + std::to_string(r.status) + ": " + error_message(r.body));
    }
    json data;
    try {
        data = json::parse(r.body);
    } catch (const json::exception& e) {
        throw ReasoningError(r.status, std::string("chat reply is not JSON: ") + e.what());
    }
    if (data.contains("message") && data["message"].contains("content")) {
        return data["message"]["content"].get<std::string>();
    }
    return {};
}

bool OllamaClient::reachable() const {
    try {
        auto r = http_get(cfg_.ollama_url + "/api/tags", 5000);
        return r.status >= 200 && r.status < 300;
    } catch (const std::exception&) {
        return false;
    }
}
