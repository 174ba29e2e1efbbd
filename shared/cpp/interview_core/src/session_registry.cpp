#include "../include/session_registry.hpp"
#include "../include/logging.hpp"
#include <algorithm>
#include <utility>

SessionRegistry::SessionRegistry(std::filesystem::path transcript_dir) : transcript_dir_(std::move(transcript_dir)) {}

std::filesystem::path SessionRegistry::transcript_path(const std::string& id) const {
    if (transcript_dir_.empty()) return {};
    return transcript_dir_ / ("interview_" + file_safe_name(id) + ".jsonl");
}

std::shared_ptr<Session> SessionRegistry::get_or_create(const std::string& id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = sessions_.find(id);
    if (it != sessions_.end()) return it->second;

    std::shared_ptr<TranscriptLog> transcript;
    if (!transcript_dir_.empty()) {
        try {
            transcript = std::make_shared<TranscriptLog>(transcript_path(id));
        } catch (const std::exception& e) {
            log_warn("registry", "session " + id + " runs without a transcript: " + e.what());
        }
    }
    auto session = std::make_shared<Session>(id, std::move(transcript));
    sessions_.emplace(id, session);
    log_info("registry", "created session " + id);
    return session;
}

std::shared_ptr<Session> SessionRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

bool SessionRegistry::cleanup(const std::string& id) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return false;
        session = std::move(it->second);
        sessions_.erase(it);
    }
    session->release();
    log_info("registry", "cleaned up session " + id);
    return true;
}

bool SessionRegistry::cleanup(const std::shared_ptr<Session>& session) {
    if (!session) return false;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = sessions_.find(session->id());
        if (it != sessions_.end() && it->second == session) sessions_.erase(it);
    }
    if (!session->release()) return false;
    log_info("registry", "cleaned up session " + session->id());
    return true;
}

std::size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return sessions_.size();
}

std::vector<std::string> SessionRegistry::ids() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<std::string> out;
    out.reserve(sessions_.size());
    for (const auto& kv : sessions_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::string> SessionRegistry::abandoned() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<std::string> out;
    for (const auto& kv : sessions_) {
        if (kv.second->abandoned()) out.push_back(kv.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}

void SessionRegistry::close_all() {
    std::vector<std::shared_ptr<Session>> all;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        for (const auto& kv : sessions_) all.push_back(kv.second);
    }
    for (auto& s : all) s->broker().close();
}
