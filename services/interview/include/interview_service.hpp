#pragma once
#include <chrono>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "report.hpp"
#include "../../../shared/cpp/interview_core/include/session_registry.hpp"
#include "../../../shared/cpp/interview_core/include/worker.hpp"

// Carries the HTTP status the request handler should answer with.
struct ServiceError : std::runtime_error {
    ServiceError(int status, const std::string& msg) : std::runtime_error(msg), status(status) {}
    int status;
};

// Request-side half of the interview: hands answers to session workers and waits
// for the next question or the terminal outcome.
class InterviewService {
public:
    // archive, when given, answers reports(); it is usually the store the workers write to.
    InterviewService(SessionRegistry& registry, WorkerManager& workers, std::chrono::milliseconds answer_timeout,
                     SqliteReportStore* archive = nullptr);

    // Creates the session (a fresh id when session_id is empty), starts its worker and
    // returns the first question. Calling it again for a live session returns the
    // current question.
    nlohmann::json start(const std::string& session_id);
    nlohmann::json answer(const std::string& session_id, const std::string& message);
    nlohmann::json status(const std::string& session_id) const;
    // Reports stored for a session, including sessions that finished and were cleaned up.
    nlohmann::json reports(const std::string& session_id) const;
    bool cleanup(const std::string& session_id);
    nlohmann::json health() const;

private:
    nlohmann::json await_question(const std::shared_ptr<Session>& session, std::uint64_t after_version);
    nlohmann::json question_reply(const Session& session, const std::string& question) const;
    nlohmann::json terminal_reply(const Session& session) const;

    SessionRegistry& registry_;
    WorkerManager& workers_;
    std::chrono::milliseconds answer_timeout_;
    SqliteReportStore* archive_;
};
