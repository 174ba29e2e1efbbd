#pragma once
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "message_broker.hpp"
#include "transcript_log.hpp"

enum class SessionStatus { Pending, Running, AwaitingInput, Completed, Failed };

const char* to_string(SessionStatus status);
bool is_terminal(SessionStatus status);

// Terminal result of a session's pipeline.
struct SessionOutcome {
    std::string artifact;
    std::string report_path;
    std::string location;
    std::string error;
};

// The session owns the handle; the thread itself is detached.
struct WorkerHandle {
    std::thread::id thread_id;
    std::shared_future<void> done;
};

class Session {
public:
    explicit Session(std::string id, std::shared_ptr<TranscriptLog> transcript = nullptr);

    const std::string& id() const { return id_; }
    MessageBroker& broker() { return broker_; }
    const MessageBroker& broker() const { return broker_; }

    SessionStatus status() const { return status_.load(); }
    void set_status(SessionStatus s) { status_.store(s); }

    // Null once the session has been cleaned up.
    std::shared_ptr<TranscriptLog> transcript() const;

    // True for exactly one caller over the session's lifetime.
    bool claim_worker();
    void attach_worker(WorkerHandle handle);
    std::optional<WorkerHandle> worker() const;
    // Returns true once the worker has finished; false on timeout or if none was started.
    bool wait_finished(std::chrono::milliseconds timeout) const;

    void set_outcome(SessionOutcome outcome);
    SessionOutcome outcome() const;

    // Closes the broker and deletes the transcript. Only the first call does anything;
    // transcript deletion errors are logged and swallowed.
    bool release();
    bool released() const { return released_.load(); }

    // Set when a caller stopped waiting for the next question while the worker was
    // still running; cleared by the next inbound message.
    void mark_abandoned() { abandoned_.store(true); }
    void clear_abandoned() { abandoned_.store(false); }
    bool abandoned() const { return abandoned_.load(); }

private:
    std::string id_;
    MessageBroker broker_;
    std::atomic<SessionStatus> status_{SessionStatus::Pending};
    std::atomic<bool> worker_claimed_{false};
    std::atomic<bool> released_{false};
    std::atomic<bool> abandoned_{false};

    mutable std::mutex mtx_;
    std::shared_ptr<TranscriptLog> transcript_;
    std::optional<WorkerHandle> worker_;
    SessionOutcome outcome_;
};
