#include "../include/pipeline.hpp"
#include "../include/logging.hpp"
#include <fstream>
#include <stdexcept>
#include <unordered_set>
#include <utility>

using json = nlohmann::json;

namespace {
// Once the broker is closed no further reasoning call is made: the attempt fails
// fatally, so the invoker stops retrying, and the caller then throws BrokerClosed.
std::string complete_unless_closed(ReasoningEngine& engine, MessageBroker& broker, const std::string& role,
                                   const std::string& prompt) {
    if (broker.closed()) throw BrokerClosed();
    return engine.complete(role, prompt);
}
}

const StageResult* PipelineResult::find(const std::string& name) const {
    for (const auto& s : stages) {
        if (s.name == name) return &s;
    }
    return nullptr;
}

Pipeline::Pipeline(std::vector<StageSpec> stages) : stages_(std::move(stages)) {
    if (stages_.empty()) throw std::invalid_argument("pipeline has no stages");
    std::unordered_set<std::string> seen;
    for (const auto& s : stages_) {
        if (s.name.empty()) throw std::invalid_argument("pipeline stage without a name");
        if (seen.count(s.name)) throw std::invalid_argument("duplicate stage: " + s.name);
        for (const auto& dep : s.depends_on) {
            if (!seen.count(dep)) {
                throw std::invalid_argument("stage " + s.name + " depends on " + dep + ", which does not precede it");
            }
        }
        if (s.interactive && s.max_turns < 1) throw std::invalid_argument("stage " + s.name + ": max_turns < 1");
        seen.insert(s.name);
    }
}

std::string Pipeline::stage_input(const StageSpec& stage, const std::map<std::string, std::string>& outputs) const {
    std::string in = stage.instructions;
    for (const auto& dep : stage.depends_on) {
        auto it = outputs.find(dep);
        if (it == outputs.end()) throw std::logic_error("stage " + stage.name + " ran before dependency " + dep);
        in += "\n\n## " + dep + "\n" + it->second;
    }
    return in;
}

PipelineResult Pipeline::run(ReasoningEngine& engine, const ResilientInvoker& invoker, MessageBroker& broker,
                             StageObserver* observer) const {
    PipelineResult result;
    std::map<std::string, std::string> outputs;
    for (const auto& stage : stages_) {
        if (broker.closed()) throw BrokerClosed();
        if (observer) observer->stage_started(stage);
        log_debug("pipeline", "stage " + stage.name + " started");
        std::string input = stage_input(stage, outputs);

        StageResult sr;
        if (stage.interactive) {
            sr = run_interactive(stage, input, engine, invoker, broker, observer);
        } else {
            auto outcome = invoker.invoke([&] { return complete_unless_closed(engine, broker, stage.role, input); },
                                          Audience::Internal);
            if (broker.closed()) throw BrokerClosed();
            sr.name = stage.name;
            sr.output = std::move(outcome.text);
            sr.attempts = outcome.attempts;
            sr.fallback = outcome.fallback;
        }
        outputs[stage.name] = sr.output;
        if (observer) observer->stage_finished(stage, sr);
        log_debug("pipeline", "stage " + stage.name + " finished (" + std::to_string(sr.output.size()) + " chars)");
        result.stages.push_back(std::move(sr));
    }
    result.artifact = result.stages.back().output;
    return result;
}

StageResult Pipeline::run_interactive(const StageSpec& stage, const std::string& input, ReasoningEngine& engine,
                                      const ResilientInvoker& invoker, MessageBroker& broker,
                                      StageObserver* observer) const {
    StageResult sr;
    sr.name = stage.name;
    std::string conversation;
    std::string answers;
    for (int turn = 0; turn < stage.max_turns; ++turn) {
        std::string prompt = input;
        if (turn > 0) {
            prompt += "\n\n## conversation so far\n" + conversation +
                      "\nAsk the next follow-up question, or reply with " + stage.completion_marker +
                      " if you have enough information.";
        }
        Audience audience = turn == 0 ? Audience::HumanOpening : Audience::Human;
        auto outcome = invoker.invoke([&] { return complete_unless_closed(engine, broker, stage.role, prompt); },
                                      audience);
        if (broker.closed()) throw BrokerClosed();
        sr.attempts += outcome.attempts;
        sr.fallback = sr.fallback || outcome.fallback;
        if (turn > 0 && !outcome.fallback && outcome.text.find(stage.completion_marker) != std::string::npos) {
            break;
        }

        const std::string& question = outcome.text;
        if (observer) observer->awaiting_input(stage, question);
        broker.set_question(question);
        std::string answer = broker.get_message();
        if (observer) observer->input_received(stage, question, answer);

        conversation += "Q: " + question + "\nA: " + answer + "\n";
        if (!answers.empty()) answers += "\n";
        answers += answer;
    }
    sr.output = std::move(answers);
    return sr;
}

Pipeline default_interview_pipeline(int max_turns) {
    std::vector<StageSpec> stages;

    StageSpec interview;
    interview.name = "interview";
    interview.role = "communicator";
    interview.interactive = true;
    interview.max_turns = max_turns;
    interview.instructions =
        "You are interviewing a patient about their symptoms. Ask one clear, friendly question at a time "
        "about onset, duration, severity, location and anything that makes the symptoms better or worse. "
        "Reply with the question only.";
    stages.push_back(interview);

    StageSpec validate;
    validate.name = "validate";
    validate.role = "validator";
    validate.depends_on = {"interview"};
    validate.instructions =
        "Review the patient's answers below. List the reported symptoms with their onset, duration and "
        "severity, and flag any red-flag findings or missing details.";
    stages.push_back(validate);

    StageSpec report;
    report.name = "report";
    report.role = "reporter";
    report.depends_on = {"interview", "validate"};
    report.instructions =
        "Write a concise clinical summary for a physician: chief complaint, history of present illness, "
        "symptom review and a preliminary assessment. Do not invent findings that are not in the context.";
    stages.push_back(report);

    return Pipeline(std::move(stages));
}

Pipeline pipeline_from_json(const json& doc) {
    std::vector<StageSpec> stages;
    for (const auto& j : doc.at("stages")) {
        StageSpec s;
        s.name = j.at("name").get<std::string>();
        s.role = j.value("role", s.name);
        s.instructions = j.value("instructions", std::string());
        s.depends_on = j.value("depends_on", std::vector<std::string>{});
        s.interactive = j.value("interactive", false);
        s.max_turns = j.value("max_turns", 1);
        s.completion_marker = j.value("completion_marker", s.completion_marker);
        stages.push_back(std::move(s));
    }
    return Pipeline(std::move(stages));
}

Pipeline load_pipeline_file(const std::filesystem::path& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("cannot open pipeline file: " + path.string());
    return pipeline_from_json(json::parse(f));
}
