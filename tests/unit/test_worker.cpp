#include <doctest/doctest.h>
#include "../../shared/cpp/interview_core/include/worker.hpp"
#include "../support/fakes.hpp"

using namespace std::chrono_literals;

namespace {
struct Fixture {
    TempDir dir;
    SessionRegistry registry{dir / "transcripts"};
    Pipeline pipeline = default_interview_pipeline();
    ScriptedEngine engine;
    RecordingRenderer renderer{dir / "reports"};
    RecordingStore store;
};

std::string await_question(Session& s, std::uint64_t after = 0) {
    auto u = s.broker().wait_for_question(after, 5s);
    REQUIRE(u.outcome == QuestionWait::NewQuestion);
    return u.question;
}
}

TEST_SUITE("WorkerManager") {
TEST_CASE("headache interview runs interview, validate and report to completion") {
    Fixture f;
    f.engine.reply("communicator", "Hello, what brings you in today?");
    f.engine.step("validator", [](const std::string& prompt) {
        CHECK(prompt.find("I have a headache") != std::string::npos);
        return std::string("Symptom: headache. Onset unknown.");
    });
    f.engine.step("reporter", [](const std::string& prompt) {
        CHECK(prompt.find("I have a headache") != std::string::npos);
        CHECK(prompt.find("Symptom: headache") != std::string::npos);
        return std::string("Chief complaint: headache.");
    });

    WorkerManager workers(f.registry, f.pipeline, f.engine, fast_invoker(), &f.renderer, &f.store);
    auto s = f.registry.get_or_create("headache");
    auto transcript = s->transcript();
    REQUIRE(transcript != nullptr);

    REQUIRE(workers.start(s));
    CHECK(await_question(*s) == "Hello, what brings you in today?");
    CHECK(wait_until([&] { return s->status() == SessionStatus::AwaitingInput; }));

    s->broker().add_message("I have a headache");
    REQUIRE(s->wait_finished(5s));

    CHECK(s->status() == SessionStatus::Completed);
    auto out = s->outcome();
    CHECK(out.artifact == "Chief complaint: headache.");
    CHECK(out.error.empty());
    CHECK(out.location == "patients/headache/reports/report_headache.txt");
    CHECK_FALSE(out.report_path.empty());

    REQUIRE(f.renderer.rendered.size() == 1);
    const auto& fields = f.renderer.rendered[0];
    CHECK(fields.session_id == "headache");
    REQUIRE(fields.sections.size() == 3);
    CHECK(fields.sections[0] == std::make_pair(std::string("interview"), std::string("I have a headache")));
    CHECK(fields.summary == "Chief complaint: headache.");
    CHECK(f.store.stored.size() == 1);

    // Terminal state cleaned the session up and removed its transcript.
    CHECK(s->released());
    CHECK(f.registry.find("headache") == nullptr);
    CHECK_FALSE(std::filesystem::exists(transcript->path()));
    CHECK(workers.wait_idle(5s));
}

TEST_CASE("starting a session twice runs a single worker") {
    Fixture f;
    WorkerManager workers(f.registry, f.pipeline, f.engine, fast_invoker());
    auto s = f.registry.get_or_create("s1");
    CHECK(workers.start(s));
    CHECK_FALSE(workers.start(s));
    await_question(*s);
    CHECK(workers.live_workers() == 1);
    CHECK(f.engine.calls_for("communicator").size() == 1);

    s->broker().add_message("fine");
    REQUIRE(s->wait_finished(5s));
    CHECK(s->status() == SessionStatus::Completed);
    CHECK(workers.wait_idle(5s));
}

TEST_CASE("finished sessions are no longer tracked by the manager") {
    Fixture f;
    StageSpec summarize;
    summarize.name = "summary";
    summarize.role = "reporter";
    Pipeline one_stage(std::vector<StageSpec>{summarize});
    WorkerManager workers(f.registry, one_stage, f.engine, fast_invoker());

    std::vector<std::weak_ptr<Session>> finished;
    for (int i = 0; i < 50; ++i) {
        auto s = f.registry.get_or_create("batch-" + std::to_string(i));
        REQUIRE(workers.start(s));
        finished.push_back(s);
    }
    REQUIRE(workers.wait_idle(5s));
    CHECK(workers.tracked_sessions() == 0);
    CHECK(f.registry.size() == 0);
    // The worker thread drops its own reference just after reporting idle.
    for (auto& w : finished) CHECK(wait_until([&] { return w.expired(); }));

    auto blocked = f.registry.get_or_create("blocked");
    WorkerManager interactive(f.registry, f.pipeline, f.engine, fast_invoker());
    REQUIRE(interactive.start(blocked));
    await_question(*blocked);
    CHECK(interactive.tracked_sessions() == 1);
    blocked->broker().add_message("done");
    REQUIRE(interactive.wait_idle(5s));
    CHECK(interactive.tracked_sessions() == 0);
}

TEST_CASE("a renderer failure fails the session and still cleans up") {
    Fixture f;
    f.renderer.fail = true;
    WorkerManager workers(f.registry, f.pipeline, f.engine, fast_invoker(), &f.renderer, &f.store);
    auto s = f.registry.get_or_create("s1");
    workers.start(s);
    await_question(*s);
    s->broker().add_message("answer");

    REQUIRE(s->wait_finished(5s));
    CHECK(s->status() == SessionStatus::Failed);
    CHECK(s->outcome().error == "renderer exploded");
    CHECK(f.store.stored.empty());
    CHECK(s->released());
    CHECK(f.registry.size() == 0);
}

TEST_CASE("a storage failure fails the session") {
    Fixture f;
    f.store.fail = true;
    WorkerManager workers(f.registry, f.pipeline, f.engine, fast_invoker(), &f.renderer, &f.store);
    auto s = f.registry.get_or_create("s1");
    workers.start(s);
    await_question(*s);
    s->broker().add_message("answer");

    REQUIRE(s->wait_finished(5s));
    CHECK(s->status() == SessionStatus::Failed);
    CHECK(s->outcome().error == "storage unavailable");
}

TEST_CASE("a fatal reasoning error falls back instead of failing the session") {
    Fixture f;
    f.engine.fail("validator", 400, "context length exceeded");
    WorkerManager workers(f.registry, f.pipeline, f.engine, fast_invoker());
    auto s = f.registry.get_or_create("s1");
    workers.start(s);
    await_question(*s);
    s->broker().add_message("I feel dizzy");

    REQUIRE(s->wait_finished(5s));
    CHECK(s->status() == SessionStatus::Completed);
    CHECK(f.engine.calls_for("validator").size() == 1);
    CHECK(f.engine.calls_for("reporter").at(0).prompt.find(fallback_text(Audience::Internal)) != std::string::npos);
}

TEST_CASE("the transcript records the conversation while the session is live") {
    Fixture f;
    StageSpec ask;
    ask.name = "interview";
    ask.role = "communicator";
    ask.interactive = true;
    ask.max_turns = 2;
    Pipeline two_turns(std::vector<StageSpec>{ask});
    f.engine.reply("communicator", "Q1").reply("communicator", "Q2");
    WorkerManager workers(f.registry, two_turns, f.engine, fast_invoker());
    auto s = f.registry.get_or_create("s1");
    auto transcript = s->transcript();
    workers.start(s);

    await_question(*s, 0);
    s->broker().add_message("first answer");
    await_question(*s, 1);

    auto recs = transcript->read_all();
    REQUIRE(recs.size() == 1);
    CHECK(recs[0]["type"] == "interaction");
    CHECK(recs[0]["question"] == "Q1");
    CHECK(recs[0]["answer"] == "first answer");

    s->broker().add_message("second answer");
    REQUIRE(s->wait_finished(5s));
    CHECK(s->outcome().artifact == "first answer\nsecond answer");
}

TEST_CASE("an explicit cleanup while awaiting input fails the worker exactly once") {
    Fixture f;
    WorkerManager workers(f.registry, f.pipeline, f.engine, fast_invoker(), &f.renderer, &f.store);
    auto s = f.registry.get_or_create("s1");
    workers.start(s);
    await_question(*s);

    CHECK(f.registry.cleanup("s1"));
    REQUIRE(s->wait_finished(5s));
    CHECK(s->status() == SessionStatus::Failed);
    CHECK(s->outcome().error == "session closed before the interview finished");
    CHECK(f.renderer.rendered.empty());
    CHECK_FALSE(f.registry.cleanup("s1"));
    CHECK(workers.wait_idle(5s));
}

TEST_CASE("destroying the manager stops blocked workers") {
    Fixture f;
    std::shared_ptr<Session> s;
    {
        WorkerManager workers(f.registry, f.pipeline, f.engine, fast_invoker());
        s = f.registry.get_or_create("s1");
        workers.start(s);
        await_question(*s);
    }
    CHECK(s->wait_finished(1s));
    CHECK(s->status() == SessionStatus::Failed);
}
}
