#include "../include/message_broker.hpp"
#include <utility>

void MessageBroker::add_message(std::string text) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        messages_.push_back(std::move(text));
    }
    message_cv_.notify_one();
}

std::string MessageBroker::get_message() {
    std::unique_lock<std::mutex> lock(mtx_);
    message_cv_.wait(lock, [this] { return !messages_.empty() || closed_; });
    if (messages_.empty()) throw BrokerClosed();
    std::string m = std::move(messages_.front());
    messages_.pop_front();
    return m;
}

void MessageBroker::set_question(std::string text) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        question_ = std::move(text);
        ++question_version_;
    }
    question_cv_.notify_all();
}

std::optional<std::string> MessageBroker::get_question() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return question_;
}

std::uint64_t MessageBroker::question_version() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return question_version_;
}

QuestionUpdate MessageBroker::wait_for_question(std::uint64_t after_version, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mtx_);
    bool woke = question_cv_.wait_for(lock, timeout, [&] { return question_version_ > after_version || closed_; });
    QuestionUpdate u;
    u.version = question_version_;
    if (question_version_ > after_version) {
        u.outcome = QuestionWait::NewQuestion;
        u.question = question_.value_or("");
    } else if (woke) {
        u.outcome = QuestionWait::Closed;
    }
    return u;
}

void MessageBroker::close() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        closed_ = true;
    }
    message_cv_.notify_all();
    question_cv_.notify_all();
}

bool MessageBroker::closed() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return closed_;
}

std::size_t MessageBroker::pending_messages() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return messages_.size();
}
