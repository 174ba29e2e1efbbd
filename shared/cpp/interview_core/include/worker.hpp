#pragma once
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>
#include "pipeline.hpp"
#include "reasoning.hpp"
#include "reporting.hpp"
#include "resilient_invoker.hpp"
#include "session.hpp"
#include "session_registry.hpp"

// Runs one pipeline per session on a detached thread and drives the session through
// pending -> running -> (awaiting_input <-> running)* -> completed | failed.
// A terminal state triggers registry cleanup exactly once.
class WorkerManager {
public:
    WorkerManager(SessionRegistry& registry, const Pipeline& pipeline, ReasoningEngine& engine,
                  ResilientInvoker invoker, ReportRenderer* renderer = nullptr, ReportStore* store = nullptr);
    // Closes the brokers of sessions it started and waits for their workers to exit.
    ~WorkerManager();

    WorkerManager(const WorkerManager&) = delete;
    WorkerManager& operator=(const WorkerManager&) = delete;

    // No-op (returns false) when the session already has a worker.
    bool start(const std::shared_ptr<Session>& session);

    std::size_t live_workers() const;
    // Sessions whose worker is still running; finished ones are dropped.
    std::size_t tracked_sessions() const;
    bool wait_idle(std::chrono::milliseconds timeout) const;

private:
    void run(std::shared_ptr<Session> session);
    SessionOutcome publish(const Session& session, const PipelineResult& result);
    void finish(const std::shared_ptr<Session>& session);
    void untrack(const std::shared_ptr<Session>& session);

    SessionRegistry& registry_;
    const Pipeline& pipeline_;
    ReasoningEngine& engine_;
    ResilientInvoker invoker_;
    ReportRenderer* renderer_;
    ReportStore* store_;

    mutable std::mutex mtx_;
    mutable std::condition_variable idle_cv_;
    std::size_t live_{0};
    std::vector<std::weak_ptr<Session>> started_;
};
