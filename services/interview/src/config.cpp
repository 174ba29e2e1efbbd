#include "../include/config.hpp"
#include "../include/util.hpp"
#include <iostream>

ServiceConfig config_from_env() {
    ServiceConfig c;
    c.port = getenv_int("INTERVIEW_PORT", c.port);
    c.llm.ollama_url = getenv_or("OLLAMA_URL", c.llm.ollama_url);
    c.llm.llm_model = getenv_or("INTERVIEW_LLM_MODEL", c.llm.llm_model);
    c.llm.timeout_ms = getenv_int("INTERVIEW_LLM_TIMEOUT_MS", c.llm.timeout_ms);
    c.retry.max_attempts = getenv_int("INTERVIEW_RETRY_ATTEMPTS", c.retry.max_attempts);
    c.retry.base_delay = std::chrono::milliseconds(getenv_int("INTERVIEW_RETRY_BASE_MS", (int)c.retry.base_delay.count()));
    c.retry.max_delay = std::chrono::milliseconds(getenv_int("INTERVIEW_RETRY_MAX_MS", (int)c.retry.max_delay.count()));
    c.retry.jitter = getenv_double("INTERVIEW_RETRY_JITTER", c.retry.jitter);
    c.answer_timeout = std::chrono::seconds(getenv_int("INTERVIEW_ANSWER_TIMEOUT_S", (int)c.answer_timeout.count()));
    c.max_turns = getenv_int("INTERVIEW_MAX_TURNS", c.max_turns);
    c.pipeline_file = getenv_or("INTERVIEW_PIPELINE", c.pipeline_file);
    c.transcript_dir = getenv_or("INTERVIEW_TRANSCRIPT_DIR", c.transcript_dir);
    c.reports_dir = getenv_or("INTERVIEW_REPORTS_DIR", c.reports_dir);
    c.storage_dir = getenv_or("INTERVIEW_STORAGE_DIR", c.storage_dir);
    c.storage_db = getenv_or("INTERVIEW_STORAGE_DB", c.storage_db);
    return c;
}

bool apply_args(ServiceConfig& cfg, int argc, char** argv, std::string* error) {
    auto fail = [&](const std::string& msg) {
        if (error) *error = msg;
        return false;
    };
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        bool has_value = i + 1 < argc;
        try {
            if (a == "--port" && has_value) cfg.port = std::stoi(argv[++i]);
            else if (a == "--ollama" && has_value) cfg.llm.ollama_url = argv[++i];
            else if (a == "--llm" && has_value) cfg.llm.llm_model = argv[++i];
            else if (a == "--pipeline" && has_value) cfg.pipeline_file = argv[++i];
            else if (a == "--max-turns" && has_value) cfg.max_turns = std::stoi(argv[++i]);
            else if (a == "--answer-timeout" && has_value) cfg.answer_timeout = std::chrono::seconds(std::stoi(argv[++i]));
            else if (a == "--retries" && has_value) cfg.retry.max_attempts = std::stoi(argv[++i]);
            else if (a == "--transcripts" && has_value) cfg.transcript_dir = argv[++i];
            else if (a == "--reports" && has_value) cfg.reports_dir = argv[++i];
            else if (a == "--storage" && has_value) cfg.storage_dir = argv[++i];
            else if (a == "--db" && has_value) cfg.storage_db = argv[++i];
            else return fail("unknown or incomplete option: " + a);
        } catch (const std::exception&) {
            return fail("invalid value for " + a);
        }
    }
    if (cfg.max_turns < 1) return fail("--max-turns must be at least 1");
    if (cfg.retry.max_attempts < 1) return fail("--retries must be at least 1");
    return true;
}

void print_usage() {
    std::cerr << "interview_server usage:\n"
              << "  interview_server [--port N] [--ollama <url>] [--llm <model>] [--pipeline <file.json>]\n"
              << "                   [--max-turns N] [--answer-timeout SECONDS] [--retries N]\n"
              << "                   [--transcripts <dir>] [--reports <dir>] [--storage <dir>] [--db <file>]\n"
              << "Environment: INTERVIEW_PORT, OLLAMA_URL, INTERVIEW_LLM_MODEL, INTERVIEW_LLM_TIMEOUT_MS,\n"
              << "  INTERVIEW_RETRY_ATTEMPTS, INTERVIEW_RETRY_BASE_MS, INTERVIEW_RETRY_MAX_MS, INTERVIEW_RETRY_JITTER,\n"
              << "  INTERVIEW_ANSWER_TIMEOUT_S, INTERVIEW_MAX_TURNS, INTERVIEW_PIPELINE, INTERVIEW_TRANSCRIPT_DIR,\n"
              << "  INTERVIEW_REPORTS_DIR, INTERVIEW_STORAGE_DIR, INTERVIEW_STORAGE_DB, INTERVIEW_LOG_LEVEL\n";
}
