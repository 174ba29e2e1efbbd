#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "message_broker.hpp"
#include "reasoning.hpp"
#include "resilient_invoker.hpp"

struct StageSpec {
    std::string name;
    std::string role;                     // which reasoning persona resolves the stage
    std::vector<std::string> depends_on;  // outputs fed into this stage, in this order
    std::string instructions;
    bool interactive{false};              // asks the human through the broker
    int max_turns{1};                     // interactive only
    std::string completion_marker{"[[INTERVIEW_COMPLETE]]"};
};

struct StageResult {
    std::string name;
    std::string output;
    int attempts{0};
    bool fallback{false};
};

struct PipelineResult {
    std::vector<StageResult> stages;
    std::string artifact; // output of the final stage

    const StageResult* find(const std::string& name) const;
};

// Callbacks fired by Pipeline::run on the worker thread.
class StageObserver {
public:
    virtual ~StageObserver() = default;
    virtual void stage_started(const StageSpec&) {}
    // Fired right before the stage blocks on the broker.
    virtual void awaiting_input(const StageSpec&, const std::string& /*question*/) {}
    virtual void input_received(const StageSpec&, const std::string& /*question*/, const std::string& /*answer*/) {}
    virtual void stage_finished(const StageSpec&, const StageResult&) {}
};

class Pipeline {
public:
    // Throws std::invalid_argument unless every dependency names an earlier stage.
    explicit Pipeline(std::vector<StageSpec> stages);

    // Runs every stage in declaration order. Exceptions (BrokerClosed, observer
    // failures) abort the run and propagate to the caller. A broker closed while a
    // reasoning call is in flight aborts the run once that call returns.
    PipelineResult run(ReasoningEngine& engine, const ResilientInvoker& invoker, MessageBroker& broker,
                       StageObserver* observer = nullptr) const;

    std::string stage_input(const StageSpec& stage, const std::map<std::string, std::string>& outputs) const;
    const std::vector<StageSpec>& stages() const { return stages_; }

private:
    StageResult run_interactive(const StageSpec& stage, const std::string& input, ReasoningEngine& engine,
                                const ResilientInvoker& invoker, MessageBroker& broker, StageObserver* observer) const;

    std::vector<StageSpec> stages_;
};

// interview (interactive) -> validate -> report
Pipeline default_interview_pipeline(int max_turns = 1);

// {"stages": [{"name", "role", "instructions", "depends_on", "interactive", "max_turns", "completion_marker"}]}
Pipeline pipeline_from_json(const nlohmann::json& doc);
Pipeline load_pipeline_file(const std::filesystem::path& path);
