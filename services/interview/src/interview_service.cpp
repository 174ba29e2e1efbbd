#include "../include/interview_service.hpp"
#include "../include/util.hpp"
#include "../../../shared/cpp/interview_core/include/logging.hpp"

using json = nlohmann::json;

namespace {
// How long a reply waits for a closing worker to publish its terminal state.
constexpr std::chrono::seconds kFinishGrace{5};
}

InterviewService::InterviewService(SessionRegistry& registry, WorkerManager& workers,
                                   std::chrono::milliseconds answer_timeout, SqliteReportStore* archive)
    : registry_(registry), workers_(workers), answer_timeout_(answer_timeout), archive_(archive) {}

json InterviewService::start(const std::string& session_id) {
    std::string id = session_id.empty() ? gen_session_id() : session_id;
    auto session = registry_.get_or_create(id);
    workers_.start(session);

    auto& broker = session->broker();
    std::uint64_t version = broker.question_version();
    if (version > 0) {
        if (auto q = broker.get_question()) return question_reply(*session, *q);
    }
    return await_question(session, version);
}

json InterviewService::answer(const std::string& session_id, const std::string& message) {
    if (session_id.empty()) throw ServiceError(400, "session_id required");
    auto session = registry_.find(session_id);
    if (!session) throw ServiceError(404, "unknown session: " + session_id);
    if (message.empty()) throw ServiceError(400, "message required");

    auto& broker = session->broker();
    if (broker.closed()) return terminal_reply(*session);
    std::uint64_t version = broker.question_version();
    broker.add_message(message);
    return await_question(session, version);
}

json InterviewService::await_question(const std::shared_ptr<Session>& session, std::uint64_t after_version) {
    QuestionUpdate u = session->broker().wait_for_question(after_version, answer_timeout_);
    switch (u.outcome) {
        case QuestionWait::NewQuestion:
            return question_reply(*session, u.question);
        case QuestionWait::Closed:
            return terminal_reply(*session);
        case QuestionWait::TimedOut:
            break;
    }
    // The worker keeps running; the next answer for this session picks it up again.
    session->mark_abandoned();
    log_warn("service", "timed out waiting for the next question in session " + session->id());
    throw ServiceError(504, "timeout waiting for the next question");
}

// A fallback question means the reasoning backend is struggling; clients may show a notice.
json InterviewService::question_reply(const Session& session, const std::string& question) const {
    json reply = {{"session_id", session.id()}, {"question", question}, {"status", to_string(session.status())}};
    if (is_fallback(question)) reply["fallback"] = true;
    return reply;
}

json InterviewService::terminal_reply(const Session& session) const {
    session.wait_finished(kFinishGrace);
    SessionStatus st = session.status();
    SessionOutcome out = session.outcome();
    json reply = {
        {"session_id", session.id()},
        {"completed", st == SessionStatus::Completed},
        {"status", to_string(st)}
    };
    if (st == SessionStatus::Completed) {
        reply["report"] = out.artifact;
        if (!out.report_path.empty()) reply["report_path"] = out.report_path;
        if (!out.location.empty()) reply["location"] = out.location;
    } else {
        reply["error"] = out.error.empty() ? std::string("session closed") : out.error;
    }
    return reply;
}

json InterviewService::status(const std::string& session_id) const {
    auto session = registry_.find(session_id);
    if (!session) throw ServiceError(404, "unknown session: " + session_id);
    json out = {
        {"session_id", session->id()},
        {"status", to_string(session->status())},
        {"pending_messages", session->broker().pending_messages()},
        {"abandoned", session->abandoned()}
    };
    auto q = session->broker().get_question();
    out["question"] = q ? json(*q) : json(nullptr);
    return out;
}

json InterviewService::reports(const std::string& session_id) const {
    if (session_id.empty()) throw ServiceError(400, "session_id required");
    if (!archive_) throw ServiceError(503, "report storage is not configured");
    json list = json::array();
    for (const auto& r : archive_->reports_for(session_id)) {
        list.push_back({{"location", r.location}, {"sha1", r.sha1}, {"stored_at", r.stored_at}});
    }
    return json{{"session_id", session_id}, {"reports", list}};
}

bool InterviewService::cleanup(const std::string& session_id) {
    return registry_.cleanup(session_id);
}

json InterviewService::health() const {
    return json{
        {"status", "ok"},
        {"active_sessions", registry_.size()},
        {"live_workers", workers_.live_workers()},
        {"abandoned", registry_.abandoned()}
    };
}
