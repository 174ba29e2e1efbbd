#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "session.hpp"

class SessionRegistry {
public:
    // Sessions get a transcript file under transcript_dir; empty disables transcripts.
    explicit SessionRegistry(std::filesystem::path transcript_dir = {});

    std::shared_ptr<Session> get_or_create(const std::string& id);
    std::shared_ptr<Session> find(const std::string& id) const;

    // Removes the session and releases its resources. Returns false if there was none.
    bool cleanup(const std::string& id);
    // Same, but only if id still maps to this exact session.
    bool cleanup(const std::shared_ptr<Session>& session);

    std::size_t size() const;
    std::vector<std::string> ids() const;
    std::vector<std::string> abandoned() const;
    // Closes every broker so blocked workers can exit; sessions stay registered.
    void close_all();

    std::filesystem::path transcript_path(const std::string& id) const;

private:
    std::filesystem::path transcript_dir_;
    mutable std::mutex mtx_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
};
