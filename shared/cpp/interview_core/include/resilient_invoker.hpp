#pragma once
#include <chrono>
#include <functional>
#include <string>

enum class FailureKind { Transient, Fatal };

// Whether the caller faces a human (interactive stage) or feeds another stage.
// HumanOpening is the first question of a conversation, before the human has said anything.
enum class Audience { Human, HumanOpening, Internal };

using FailureClassifier = std::function<FailureKind(const std::string& signature)>;
using Sleeper = std::function<void(std::chrono::milliseconds)>;
using ReasoningCall = std::function<std::string()>;

struct RetryPolicy {
    int max_attempts{3};
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double jitter{0.1};
    FailureClassifier classify; // empty means classify_failure
};

struct InvokeOutcome {
    std::string text;
    int attempts{0};
    bool fallback{false};
    FailureKind last_failure{FailureKind::Transient};
    std::string last_error;
};

// Overload and rate-limit signatures ("overloaded", 429, 503, ...) are transient.
FailureKind classify_failure(const std::string& signature);

// Delay before retry number `attempt` (0-based): min(base * 2^attempt * (1 +/- jitter), max).
std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, int attempt, double unit_random);

const std::string& fallback_text(Audience audience);
bool is_fallback(const std::string& text);

class ResilientInvoker {
public:
    explicit ResilientInvoker(RetryPolicy policy, Sleeper sleeper = {});

    InvokeOutcome invoke(const ReasoningCall& call, Audience audience) const;
    // Composes the retry policy around call; the returned callable never throws.
    ReasoningCall wrap(ReasoningCall call, Audience audience) const;

    const RetryPolicy& policy() const { return policy_; }

private:
    RetryPolicy policy_;
    Sleeper sleep_;
};
