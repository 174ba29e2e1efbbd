#include <csignal>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <unistd.h>
#include <curl/curl.h>
#include <microhttpd.h>
#include <nlohmann/json.hpp>
#include "../include/config.hpp"
#include "../include/interview_service.hpp"
#include "../include/report.hpp"
#include "../../../shared/cpp/agent_sdk/include/ollama_client.hpp"
#include "../../../shared/cpp/interview_core/include/logging.hpp"
#include "../../../shared/cpp/interview_core/include/pipeline.hpp"

using json = nlohmann::json;

#if MHD_VERSION >= 0x00097002
using MhdResult = MHD_Result;
#else
using MhdResult = int;
#endif

static volatile std::sig_atomic_t g_stop = 0;

struct App {
    InterviewService* service;
    OllamaClient* llm;
};

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
};

static MhdResult send_response(struct MHD_Connection* conn, int status, const std::string& body, const char* ctype = "application/json") {
    struct MHD_Response* resp = MHD_create_response_from_buffer(body.size(), (void*)body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, ctype);
    MhdResult ret = MHD_queue_response(conn, status, resp);
    MHD_destroy_response(resp);
    return ret;
}

static MhdResult send_error(struct MHD_Connection* conn, int status, const std::string& msg) {
    return send_response(conn, status, json({{"error", msg}}).dump());
}

static std::map<std::string,std::string> parse_query(struct MHD_Connection* conn) {
    std::map<std::string,std::string> out;
    MHD_get_connection_values(conn, MHD_GET_ARGUMENT_KIND,
        [](void* cls, enum MHD_ValueKind, const char* key, const char* val) -> MhdResult {
            auto* m = static_cast<std::map<std::string,std::string>*>(cls);
            (*m)[key ? key : ""] = val ? val : "";
            return MHD_YES;
        }, &out);
    return out;
}

static json parse_body(const std::string& body) {
    if (body.empty()) return json::object();
    json j = json::parse(body);
    if (!j.is_object()) throw std::invalid_argument("request body must be a JSON object");
    return j;
}

static void request_completed(void* /*cls*/, struct MHD_Connection*, void** con_cls, enum MHD_RequestTerminationCode) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

static MhdResult handler(void* cls, struct MHD_Connection* connection, const char* url, const char* method,
                         const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    App* app = static_cast<App*>(cls);
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}};
        *con_cls = ci;
        return MHD_YES;
    }

    if (0 == strcmp(method, MHD_HTTP_METHOD_POST)) {
        if (*upload_data_size) {
            ci->body.append(upload_data, *upload_data_size);
            *upload_data_size = 0;
            return MHD_YES;
        }
    }

    std::string path(url);
    try {
        if (ci->method == "POST" && path == "/start") {
            auto j = parse_body(ci->body);
            json out = app->service->start(j.value("session_id", std::string()));
            return send_response(connection, MHD_HTTP_OK, out.dump());
        }
        if (ci->method == "POST" && path == "/answer") {
            auto j = parse_body(ci->body);
            json out = app->service->answer(j.value("session_id", std::string()), j.value("message", std::string()));
            return send_response(connection, MHD_HTTP_OK, out.dump());
        }
        if (ci->method == "GET" && path == "/status") {
            auto q = parse_query(connection);
            auto it = q.find("session_id");
            if (it == q.end() || it->second.empty()) {
                return send_error(connection, MHD_HTTP_BAD_REQUEST, "session_id query parameter required");
            }
            return send_response(connection, MHD_HTTP_OK, app->service->status(it->second).dump());
        }
        if (ci->method == "GET" && path == "/reports") {
            auto q = parse_query(connection);
            auto it = q.find("session_id");
            if (it == q.end() || it->second.empty()) {
                return send_error(connection, MHD_HTTP_BAD_REQUEST, "session_id query parameter required");
            }
            return send_response(connection, MHD_HTTP_OK, app->service->reports(it->second).dump());
        }
        if (ci->method == "DELETE" && path == "/session") {
            auto q = parse_query(connection);
            auto it = q.find("session_id");
            if (it == q.end() || it->second.empty()) {
                return send_error(connection, MHD_HTTP_BAD_REQUEST, "session_id query parameter required");
            }
            if (!app->service->cleanup(it->second)) {
                return send_error(connection, MHD_HTTP_NOT_FOUND, "unknown session: " + it->second);
            }
            return send_response(connection, MHD_HTTP_OK, json({{"ok", true}}).dump());
        }
        if (ci->method == "GET" && path == "/health") {
            json out = app->service->health();
            out["reasoning_backend"] = app->llm->reachable() ? "reachable" : "unreachable";
            return send_response(connection, MHD_HTTP_OK, out.dump());
        }
        return send_error(connection, MHD_HTTP_NOT_FOUND, "not found");
    } catch (const ServiceError& e) {
        return send_error(connection, e.status, e.what());
    } catch (const json::exception& e) {
        return send_error(connection, MHD_HTTP_BAD_REQUEST, e.what());
    } catch (const std::invalid_argument& e) {
        return send_error(connection, MHD_HTTP_BAD_REQUEST, e.what());
    } catch (const std::exception& e) {
        log_error("http", ci->method + " " + path + " failed: " + e.what());
        return send_error(connection, MHD_HTTP_INTERNAL_SERVER_ERROR, e.what());
    }
}

static std::unique_ptr<Pipeline> build_pipeline(const ServiceConfig& cfg) {
    if (cfg.pipeline_file.empty()) return std::make_unique<Pipeline>(default_interview_pipeline(cfg.max_turns));
    return std::make_unique<Pipeline>(load_pipeline_file(cfg.pipeline_file));
}

int main(int argc, char** argv) {
    ServiceConfig cfg = config_from_env();
    std::string arg_error;
    if (!apply_args(cfg, argc, argv, &arg_error)) {
        std::cerr << "[interview] " << arg_error << "\n";
        print_usage();
        return 2;
    }

    std::unique_ptr<Pipeline> pipeline;
    std::unique_ptr<SqliteReportStore> store;
    try {
        pipeline = build_pipeline(cfg);
        store = std::make_unique<SqliteReportStore>(cfg.storage_dir, cfg.storage_db);
    } catch (const std::exception& e) {
        log_error("interview", std::string("startup failed: ") + e.what());
        return 1;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);
    OllamaClient llm(cfg.llm);
    if (!llm.reachable()) log_warn("interview", "reasoning backend at " + cfg.llm.ollama_url + " is not reachable yet");

    TextReportRenderer renderer(cfg.reports_dir);
    SessionRegistry registry(cfg.transcript_dir);
    int status = 0;
    {
        WorkerManager workers(registry, *pipeline, llm, ResilientInvoker(cfg.retry), &renderer, store.get());
        InterviewService service(registry, workers, cfg.answer_timeout, store.get());
        App app{&service, &llm};

        log_info("interview", "Starting HTTP server on port " + std::to_string(cfg.port) + " (model " +
                 cfg.llm.llm_model + ", " + std::to_string(pipeline->stages().size()) + " stages)...");
        // Answer requests block until the worker asks again, so each connection gets its own thread.
        struct MHD_Daemon* d = MHD_start_daemon(MHD_USE_THREAD_PER_CONNECTION | MHD_USE_INTERNAL_POLLING_THREAD,
                                                (uint16_t)cfg.port, nullptr, nullptr, &handler, &app,
                                                MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                                                MHD_OPTION_END);
        if (!d) {
            log_error("interview", "Failed to start HTTP server");
            status = 1;
        } else {
            std::signal(SIGTERM, [](int) { g_stop = 1; });
            std::signal(SIGINT, [](int) { g_stop = 1; });
            while (!g_stop) pause();

            log_info("interview", "shutting down, closing " + std::to_string(registry.size()) + " session(s)");
            registry.close_all();
            MHD_stop_daemon(d);
        }
        registry.close_all();
    }
    curl_global_cleanup();
    return status;
}
