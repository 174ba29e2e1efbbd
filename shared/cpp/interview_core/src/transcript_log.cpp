#include "../include/transcript_log.hpp"
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <stdexcept>
#include <utility>

using json = nlohmann::json;

std::string utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[40];
    snprintf(out, sizeof(out), "%s.%03dZ", buf, (int)ms);
    return std::string(out);
}

std::string file_safe_name(const std::string& id) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(id.size());
    for (unsigned char c : id) {
        if (std::isalnum(c) || c == '-' || c == '_') {
            out += (char)c;
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

TranscriptLog::TranscriptLog(std::filesystem::path path) : path_(std::move(path)) {
    if (path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path());
    std::ofstream f(path_, std::ios::app);
    if (!f) throw std::runtime_error("cannot open transcript log: " + path_.string());
}

void TranscriptLog::interaction(const std::string& stage, const std::string& question, const std::string& answer) {
    append("interaction", json{{"stage", stage}, {"question", question}, {"answer", answer}});
}

void TranscriptLog::error(const std::string& stage, const std::string& message) {
    append("error", json{{"stage", stage}, {"error", message}});
}

void TranscriptLog::completion(const std::string& artifact, const std::string& location) {
    append("completion", json{{"artifact", artifact}, {"location", location}});
}

void TranscriptLog::append(const std::string& type, json fields) {
    json rec = {{"timestamp", utc_timestamp()}, {"type", type}};
    for (auto it = fields.begin(); it != fields.end(); ++it) rec[it.key()] = it.value();
    std::lock_guard<std::mutex> lock(mtx_);
    if (removed_) return;
    std::ofstream f(path_, std::ios::app);
    if (!f) throw std::runtime_error("cannot append to transcript log: " + path_.string());
    f << rec.dump() << '\n';
}

std::vector<json> TranscriptLog::read_all() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<json> out;
    std::ifstream f(path_);
    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty()) out.push_back(json::parse(line));
    }
    return out;
}

void TranscriptLog::remove() {
    std::lock_guard<std::mutex> lock(mtx_);
    removed_ = true;
    std::filesystem::remove(path_);
}

bool TranscriptLog::removed() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return removed_;
}
