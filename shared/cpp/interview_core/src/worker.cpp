#include "../include/worker.hpp"
#include "../include/logging.hpp"
#include <algorithm>
#include <future>
#include <system_error>
#include <thread>
#include <utility>

namespace {
class SessionObserver : public StageObserver {
public:
    explicit SessionObserver(Session& s) : s_(s) {}

    void awaiting_input(const StageSpec& stage, const std::string& question) override {
        s_.set_status(SessionStatus::AwaitingInput);
        log_debug("worker", s_.id() + "/" + stage.name + " asks: " + question);
    }

    void input_received(const StageSpec& stage, const std::string& question, const std::string& answer) override {
        s_.set_status(SessionStatus::Running);
        s_.clear_abandoned();
        if (auto t = s_.transcript()) t->interaction(stage.name, question, answer);
    }

    void stage_finished(const StageSpec& stage, const StageResult& r) override {
        if (!r.fallback) return;
        log_warn("worker", s_.id() + "/" + stage.name + " fell back after " + std::to_string(r.attempts) + " attempt(s)");
        if (auto t = s_.transcript()) t->error(stage.name, "reasoning fallback used after " + std::to_string(r.attempts) + " attempt(s)");
    }

private:
    Session& s_;
};
}

WorkerManager::WorkerManager(SessionRegistry& registry, const Pipeline& pipeline, ReasoningEngine& engine,
                             ResilientInvoker invoker, ReportRenderer* renderer, ReportStore* store)
    : registry_(registry), pipeline_(pipeline), engine_(engine), invoker_(std::move(invoker)),
      renderer_(renderer), store_(store) {}

WorkerManager::~WorkerManager() {
    std::vector<std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        for (auto& w : started_) {
            if (auto s = w.lock()) sessions.push_back(std::move(s));
        }
    }
    for (auto& s : sessions) s->broker().close();
    std::unique_lock<std::mutex> lock(mtx_);
    idle_cv_.wait(lock, [this] { return live_ == 0; });
}

bool WorkerManager::start(const std::shared_ptr<Session>& session) {
    if (!session || !session->claim_worker()) return false;

    std::promise<void> done;
    std::shared_future<void> finished = done.get_future().share();
    {
        std::lock_guard<std::mutex> lock(mtx_);
        ++live_;
        started_.push_back(session);
    }
    try {
        std::thread t([this, session, done = std::move(done)]() mutable {
            run(session);
            done.set_value();
            std::lock_guard<std::mutex> lock(mtx_);
            untrack(session);
            --live_;
            idle_cv_.notify_all();
        });
        session->attach_worker(WorkerHandle{t.get_id(), finished});
        t.detach();
    } catch (const std::system_error& e) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            untrack(session);
            --live_;
        }
        log_error("worker", "could not start worker for " + session->id() + ": " + e.what());
        session->set_status(SessionStatus::Failed);
        finish(session);
        return false;
    }
    log_info("worker", "started worker for session " + session->id());
    return true;
}

void WorkerManager::run(std::shared_ptr<Session> session) {
    session->set_status(SessionStatus::Running);
    SessionObserver observer(*session);
    try {
        PipelineResult result = pipeline_.run(engine_, invoker_, session->broker(), &observer);
        SessionOutcome outcome = publish(*session, result);
        if (auto t = session->transcript()) t->completion(outcome.artifact, outcome.location);
        session->set_outcome(std::move(outcome));
        session->set_status(SessionStatus::Completed);
        log_info("worker", "session " + session->id() + " completed");
    } catch (const BrokerClosed&) {
        SessionOutcome outcome;
        outcome.error = "session closed before the interview finished";
        session->set_outcome(outcome);
        session->set_status(SessionStatus::Failed);
        log_warn("worker", "session " + session->id() + ": " + outcome.error);
    } catch (const std::exception& e) {
        SessionOutcome outcome;
        outcome.error = e.what();
        if (auto t = session->transcript()) {
            try {
                t->error("pipeline", outcome.error);
            } catch (const std::exception& te) {
                log_warn("worker", "could not record failure in transcript: " + std::string(te.what()));
            }
        }
        session->set_outcome(outcome);
        session->set_status(SessionStatus::Failed);
        log_error("worker", "session " + session->id() + " failed: " + outcome.error);
    }
    finish(session);
}

SessionOutcome WorkerManager::publish(const Session& session, const PipelineResult& result) {
    SessionOutcome out;
    out.artifact = result.artifact;
    if (!renderer_) return out;

    ReportFields fields;
    fields.session_id = session.id();
    fields.generated_at = utc_timestamp();
    for (const auto& s : result.stages) fields.sections.emplace_back(s.name, s.output);
    fields.summary = result.artifact;
    out.report_path = renderer_->render(fields).string();
    if (store_) out.location = store_->store(out.report_path, session.id());
    return out;
}

void WorkerManager::finish(const std::shared_ptr<Session>& session) {
    registry_.cleanup(session);
}

// Caller holds mtx_.
void WorkerManager::untrack(const std::shared_ptr<Session>& session) {
    started_.erase(std::remove_if(started_.begin(), started_.end(),
                                  [&](const std::weak_ptr<Session>& w) {
                                      auto s = w.lock();
                                      return !s || s == session;
                                  }),
                   started_.end());
}

std::size_t WorkerManager::tracked_sessions() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return started_.size();
}

std::size_t WorkerManager::live_workers() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return live_;
}

bool WorkerManager::wait_idle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mtx_);
    return idle_cv_.wait_for(lock, timeout, [this] { return live_ == 0; });
}
