#pragma once
#include <chrono>
#include <string>
#include "../../../shared/cpp/agent_sdk/include/ollama_client.hpp"
#include "../../../shared/cpp/interview_core/include/resilient_invoker.hpp"

struct ServiceConfig {
    int port{8000};
    LlmConfig llm;
    RetryPolicy retry;
    std::chrono::seconds answer_timeout{300};
    int max_turns{1};
    std::string pipeline_file;   // empty: built-in interview pipeline
    std::string transcript_dir{"./data/transcripts"};
    std::string reports_dir{"./reports"};
    std::string storage_dir{"./data/storage"};
    std::string storage_db{"./data/reports.db"};
};

ServiceConfig config_from_env();
// Applies command-line flags on top of cfg. Returns false on unknown or incomplete flags.
bool apply_args(ServiceConfig& cfg, int argc, char** argv, std::string* error = nullptr);
void print_usage();
