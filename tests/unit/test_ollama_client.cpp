#include <doctest/doctest.h>
#include "../../shared/cpp/agent_sdk/include/ollama_client.hpp"
#include "../../shared/cpp/interview_core/include/resilient_invoker.hpp"
#include "../support/fake_ollama.hpp"

namespace {
// Nothing listens on port 9 locally, so connections are refused immediately.
LlmConfig offline() {
    LlmConfig c;
    c.ollama_url = "http://127.0.0.1:9/";
    c.timeout_ms = 2000;
    return c;
}

LlmConfig pointed_at(const FakeOllama& server) {
    LlmConfig c;
    c.ollama_url = server.url() + "/";
    c.llm_model = "mistral-nemo";
    c.timeout_ms = 5000;
    return c;
}
}

TEST_SUITE("OllamaClient") {
TEST_CASE("role prompts use overrides before the built-in personas") {
    LlmConfig cfg = offline();
    cfg.system_prompts["validator"] = "custom validator";
    OllamaClient client(cfg);
    CHECK(client.config().ollama_url == "http://127.0.0.1:9");
    CHECK(client.system_prompt("validator") == "custom validator");
    CHECK(client.system_prompt("communicator").find("patient") != std::string::npos);
    CHECK(client.system_prompt("triage") == "You are a helpful assistant acting as triage.");
}

TEST_CASE("an unreachable backend is reported, and the invoker turns it into a fallback") {
    OllamaClient client(offline());
    CHECK_FALSE(client.reachable());
    CHECK_THROWS_AS(client.complete("communicator", "hello"), std::runtime_error);

    RetryPolicy p;
    p.max_attempts = 2;
    ResilientInvoker inv(p, [](std::chrono::milliseconds) {});
    auto out = inv.invoke([&] { return client.complete("communicator", "hello"); }, Audience::Human);
    CHECK(out.fallback);
    CHECK(out.text == fallback_text(Audience::Human));
}

TEST_CASE("a successful chat returns the assistant message content") {
    FakeOllama server;
    server.respond(200, R"({"model":"mistral-nemo","message":{"role":"assistant","content":"Where does it hurt?"},"done":true})");
    OllamaClient client(pointed_at(server));

    CHECK(client.reachable());
    CHECK(client.complete("communicator", "The patient has a headache.") == "Where does it hurt?");

    auto sent = server.last_chat();
    CHECK(sent["model"] == "mistral-nemo");
    CHECK(sent["stream"] == false);
    REQUIRE(sent["messages"].size() == 2);
    CHECK(sent["messages"][0]["role"] == "system");
    CHECK(sent["messages"][0]["content"] == client.system_prompt("communicator"));
    CHECK(sent["messages"][1]["role"] == "user");
    CHECK(sent["messages"][1]["content"] == "The patient has a headache.");
}

TEST_CASE("a reply without message content is empty") {
    FakeOllama server;
    server.respond(200, R"({"done":true})");
    OllamaClient client(pointed_at(server));
    CHECK(client.complete("validator", "check").empty());
}

TEST_CASE("an overloaded backend raises ReasoningError with the upstream status") {
    FakeOllama server;
    server.respond(503, R"({"error":"overloaded"})");
    OllamaClient client(pointed_at(server));

    try {
        client.complete("validator", "check these answers");
        FAIL("expected ReasoningError");
    } catch (const ReasoningError& e) {
        CHECK(e.status == 503);
        CHECK(std::string(e.what()).find("overloaded") != std::string::npos);
    }

    RetryPolicy p;
    p.max_attempts = 3;
    ResilientInvoker inv(p, [](std::chrono::milliseconds) {});
    auto out = inv.invoke([&] { return client.complete("validator", "check"); }, Audience::Internal);
    CHECK(out.fallback);
    CHECK(out.attempts == 3);
    CHECK(out.last_failure == FailureKind::Transient);
    CHECK(server.chat_requests() == 4);
}

TEST_CASE("a rejected request is fatal and not retried") {
    FakeOllama server;
    server.respond(404, R"({"error":"model 'mistral-nemo' not found"})");
    OllamaClient client(pointed_at(server));

    RetryPolicy p;
    p.max_attempts = 3;
    ResilientInvoker inv(p, [](std::chrono::milliseconds) {});
    auto out = inv.invoke([&] { return client.complete("reporter", "summarise"); }, Audience::Internal);
    CHECK(out.fallback);
    CHECK(out.attempts == 1);
    CHECK(out.last_failure == FailureKind::Fatal);
    CHECK(out.last_error.find("not found") != std::string::npos);
    CHECK(server.chat_requests() == 1);
}

TEST_CASE("a non-JSON chat reply is a ReasoningError") {
    FakeOllama server;
    server.respond(200, "<html>proxy error</html>");
    OllamaClient client(pointed_at(server));
    CHECK_THROWS_AS(client.complete("communicator", "hello"), ReasoningError);
}
}
