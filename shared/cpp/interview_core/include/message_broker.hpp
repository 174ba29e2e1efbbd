#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

struct BrokerClosed : std::runtime_error {
    BrokerClosed() : std::runtime_error("message broker closed") {}
};

enum class QuestionWait { NewQuestion, Closed, TimedOut };

struct QuestionUpdate {
    QuestionWait outcome{QuestionWait::TimedOut};
    std::string question;
    std::uint64_t version{0};
};

// Per-session handoff between request handlers and the session worker.
// Messages queue in arrival order; the question is a single last-write-wins slot.
class MessageBroker {
public:
    void add_message(std::string text);
    // Blocks until a message is queued. Throws BrokerClosed once closed and drained.
    std::string get_message();

    void set_question(std::string text);
    std::optional<std::string> get_question() const;
    std::uint64_t question_version() const;

    // Waits until the question version moves past after_version, the broker closes,
    // or the timeout expires.
    QuestionUpdate wait_for_question(std::uint64_t after_version, std::chrono::milliseconds timeout) const;

    void close();
    bool closed() const;
    std::size_t pending_messages() const;

private:
    mutable std::mutex mtx_;
    std::condition_variable message_cv_;
    mutable std::condition_variable question_cv_;
    std::deque<std::string> messages_;
    std::optional<std::string> question_;
    std::uint64_t question_version_{0};
    bool closed_{false};
};
