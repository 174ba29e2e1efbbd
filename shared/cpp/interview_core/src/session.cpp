#include "../include/session.hpp"
#include "../include/logging.hpp"
#include <utility>

const char* to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::Pending: return "pending";
        case SessionStatus::Running: return "running";
        case SessionStatus::AwaitingInput: return "awaiting_input";
        case SessionStatus::Completed: return "completed";
        case SessionStatus::Failed: return "failed";
    }
    return "unknown";
}

bool is_terminal(SessionStatus status) {
    return status == SessionStatus::Completed || status == SessionStatus::Failed;
}

Session::Session(std::string id, std::shared_ptr<TranscriptLog> transcript)
    : id_(std::move(id)), transcript_(std::move(transcript)) {}

std::shared_ptr<TranscriptLog> Session::transcript() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return transcript_;
}

bool Session::claim_worker() {
    bool expected = false;
    return worker_claimed_.compare_exchange_strong(expected, true);
}

void Session::attach_worker(WorkerHandle handle) {
    std::lock_guard<std::mutex> lock(mtx_);
    worker_ = std::move(handle);
}

std::optional<WorkerHandle> Session::worker() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return worker_;
}

bool Session::wait_finished(std::chrono::milliseconds timeout) const {
    auto w = worker();
    if (!w || !w->done.valid()) return false;
    return w->done.wait_for(timeout) == std::future_status::ready;
}

void Session::set_outcome(SessionOutcome outcome) {
    std::lock_guard<std::mutex> lock(mtx_);
    outcome_ = std::move(outcome);
}

SessionOutcome Session::outcome() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return outcome_;
}

bool Session::release() {
    if (released_.exchange(true)) return false;
    broker_.close();
    std::shared_ptr<TranscriptLog> t;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        t = std::move(transcript_);
        transcript_.reset();
    }
    if (t) {
        try {
            t->remove();
        } catch (const std::exception& e) {
            log_warn("session", "could not delete transcript " + t->path().string() + ": " + e.what());
        }
    }
    return true;
}
