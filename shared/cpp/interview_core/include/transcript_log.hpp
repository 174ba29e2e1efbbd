#pragma once
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Append-only JSON-lines record of one session:
// {"timestamp": ..., "type": "interaction"|"error"|"completion", ...fields}
class TranscriptLog {
public:
    explicit TranscriptLog(std::filesystem::path path);

    void interaction(const std::string& stage, const std::string& question, const std::string& answer);
    void error(const std::string& stage, const std::string& message);
    void completion(const std::string& artifact, const std::string& location);

    void append(const std::string& type, nlohmann::json fields);
    std::vector<nlohmann::json> read_all() const;
    // Deletes the file; later appends are dropped. Throws std::filesystem::filesystem_error.
    void remove();
    bool removed() const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    mutable std::mutex mtx_;
    bool removed_{false};
};

std::string utc_timestamp();

// Percent-encodes everything but [A-Za-z0-9_-] so distinct ids never share a file name.
std::string file_safe_name(const std::string& id);
