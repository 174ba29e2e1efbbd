#pragma once
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "../../../shared/cpp/interview_core/include/reporting.hpp"

// Writes a plain-text interview report into reports_dir.
class TextReportRenderer : public ReportRenderer {
public:
    explicit TextReportRenderer(std::filesystem::path reports_dir);
    std::filesystem::path render(const ReportFields& fields) override;

private:
    std::filesystem::path dir_;
};

struct StoredReport {
    std::string session_id;
    std::string location;
    std::string sha1;
    std::string stored_at;
};

// Copies reports under <root>/patients/<session>/reports/ and indexes them in SQLite.
class SqliteReportStore : public ReportStore {
public:
    SqliteReportStore(std::filesystem::path root, const std::string& db_path);
    ~SqliteReportStore() override;

    SqliteReportStore(const SqliteReportStore&) = delete;
    SqliteReportStore& operator=(const SqliteReportStore&) = delete;

    std::string store(const std::filesystem::path& report, const std::string& session_id) override;
    std::vector<StoredReport> reports_for(const std::string& session_id);

private:
    void init();
    void exec(const std::string& sql);
    void prepare_statements();
    void close_statements();

    std::filesystem::path root_;
    std::mutex mtx_;
    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* insert_stmt_ {nullptr};
    struct sqlite3_stmt* by_session_stmt_ {nullptr};
};
