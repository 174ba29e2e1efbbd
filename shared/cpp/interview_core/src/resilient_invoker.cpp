#include "../include/resilient_invoker.hpp"
#include "../include/logging.hpp"
#include "../include/reasoning.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <random>
#include <thread>
#include <utility>

namespace {
const std::string kHumanFallback =
    "I'm having trouble responding right now. Could you please repeat or rephrase your last message?";
const std::string kOpeningFallback =
    "I'm having trouble responding right now. To get us started, could you tell me what brings you in today?";
const std::string kInternalFallback =
    "[unavailable] The reasoning service could not produce output for this step.";

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

// "503" must stand alone, not inside "15031".
bool contains_code(const std::string& s, const std::string& code) {
    for (auto pos = s.find(code); pos != std::string::npos; pos = s.find(code, pos + 1)) {
        bool left = pos == 0 || !std::isdigit((unsigned char)s[pos - 1]);
        std::size_t end = pos + code.size();
        bool right = end >= s.size() || !std::isdigit((unsigned char)s[end]);
        if (left && right) return true;
    }
    return false;
}

bool has_content(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](unsigned char c) { return !std::isspace(c); });
}

double random_unit() {
    thread_local std::mt19937 rng(std::random_device{}());
    return std::uniform_real_distribution<double>(0.0, 1.0)(rng);
}
}

FailureKind classify_failure(const std::string& signature) {
    static const char* markers[] = {
        "overloaded", "rate limit", "rate_limit", "ratelimit", "too many requests",
        "unavailable", "resource_exhausted", "try again later"
    };
    std::string s = to_lower(signature);
    for (const char* m : markers) {
        if (s.find(m) != std::string::npos) return FailureKind::Transient;
    }
    if (contains_code(s, "429") || contains_code(s, "503")) return FailureKind::Transient;
    return FailureKind::Fatal;
}

std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, int attempt, double unit_random) {
    double factor = 1.0 + policy.jitter * (2.0 * unit_random - 1.0);
    double ms = (double)policy.base_delay.count() * std::pow(2.0, attempt) * factor;
    ms = std::min(ms, (double)policy.max_delay.count());
    return std::chrono::milliseconds(std::llround(std::max(0.0, ms)));
}

const std::string& fallback_text(Audience audience) {
    switch (audience) {
    case Audience::Human: return kHumanFallback;
    case Audience::HumanOpening: return kOpeningFallback;
    case Audience::Internal: break;
    }
    return kInternalFallback;
}

bool is_fallback(const std::string& text) {
    return text == kHumanFallback || text == kOpeningFallback || text == kInternalFallback;
}

ResilientInvoker::ResilientInvoker(RetryPolicy policy, Sleeper sleeper)
    : policy_(std::move(policy)), sleep_(std::move(sleeper)) {
    if (policy_.max_attempts < 1) policy_.max_attempts = 1;
    if (!policy_.classify) policy_.classify = classify_failure;
    if (!sleep_) sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

InvokeOutcome ResilientInvoker::invoke(const ReasoningCall& call, Audience audience) const {
    InvokeOutcome out;
    for (int attempt = 0; attempt < policy_.max_attempts; ++attempt) {
        out.attempts = attempt + 1;
        FailureKind kind = FailureKind::Fatal;
        try {
            std::string result = call();
            if (has_content(result)) {
                out.text = std::move(result);
                return out;
            }
            out.last_error = "empty response from reasoning backend";
            kind = FailureKind::Transient;
        } catch (const ReasoningError& e) {
            out.last_error = "HTTP " + std::to_string(e.status) + ": " + e.what();
            kind = policy_.classify(out.last_error);
        } catch (const std::exception& e) {
            out.last_error = e.what();
            kind = policy_.classify(out.last_error);
        }
        out.last_failure = kind;

        if (kind == FailureKind::Fatal) {
            log_error("retry", "fatal reasoning failure, not retrying: " + out.last_error);
            break;
        }
        if (attempt + 1 >= policy_.max_attempts) {
            log_warn("retry", "giving up after " + std::to_string(out.attempts) + " attempts: " + out.last_error);
            break;
        }
        auto delay = backoff_delay(policy_, attempt, random_unit());
        log_warn("retry", "transient failure (" + out.last_error + "), attempt " + std::to_string(out.attempts) +
                 "/" + std::to_string(policy_.max_attempts) + ", retrying in " + std::to_string(delay.count()) + "ms");
        sleep_(delay);
    }
    out.text = fallback_text(audience);
    out.fallback = true;
    return out;
}

ReasoningCall ResilientInvoker::wrap(ReasoningCall call, Audience audience) const {
    ResilientInvoker self = *this;
    return [self, call = std::move(call), audience]() { return self.invoke(call, audience).text; };
}
