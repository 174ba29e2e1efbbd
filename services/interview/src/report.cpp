#include "../include/report.hpp"
#include "../include/util.hpp"
#include "../../../shared/cpp/interview_core/include/transcript_log.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace {
std::string heading(std::string name) {
    std::replace(name.begin(), name.end(), '_', ' ');
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return (char)std::toupper(c); });
    return name;
}

void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

std::string column_text(sqlite3_stmt* st, int idx) {
    const unsigned char* t = sqlite3_column_text(st, idx);
    return t ? std::string(reinterpret_cast<const char*>(t)) : std::string();
}
}

TextReportRenderer::TextReportRenderer(std::filesystem::path reports_dir) : dir_(std::move(reports_dir)) {}

std::filesystem::path TextReportRenderer::render(const ReportFields& fields) {
    std::filesystem::create_directories(dir_);
    auto path = dir_ / ("interview_report_" + file_timestamp() + "_" + file_safe_name(fields.session_id) + ".txt");
    std::ofstream f(path);
    if (!f) throw std::runtime_error("cannot write report " + path.string());

    f << "PATIENT INTERVIEW REPORT\n"
      << "========================\n\n"
      << "Session:   " << fields.session_id << "\n"
      << "Generated: " << fields.generated_at << "\n"
      << "Source:    AI-assisted patient interview\n\n";
    int n = 1;
    for (const auto& [name, text] : fields.sections) {
        f << n++ << ". " << heading(name) << "\n" << std::string(40, '-') << "\n"
          << (text.empty() ? "No information recorded." : text) << "\n\n";
    }
    f << "This report was produced from an automated interview and is not a diagnosis.\n";
    f.flush();
    if (!f.good()) throw std::runtime_error("failed writing report " + path.string());
    return path;
}

SqliteReportStore::SqliteReportStore(std::filesystem::path root, const std::string& db_path) : root_(std::move(root)) {
    std::filesystem::path db(db_path);
    if (db.has_parent_path()) std::filesystem::create_directories(db.parent_path());
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open SQLite DB: " + db_path + " (" + msg + ")");
    }
    try {
        init();
        prepare_statements();
    } catch (...) {
        close_statements();
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteReportStore::~SqliteReportStore() {
    close_statements();
    if (db_) sqlite3_close(db_);
}

void SqliteReportStore::init() {
    exec("PRAGMA journal_mode=WAL;");
    exec("CREATE TABLE IF NOT EXISTS reports (\n"
         "  id INTEGER PRIMARY KEY AUTOINCREMENT,\n"
         "  session_id TEXT NOT NULL,\n"
         "  location TEXT NOT NULL,\n"
         "  sha1 TEXT,\n"
         "  stored_at TEXT\n"
         ");");
    exec("CREATE INDEX IF NOT EXISTS idx_reports_session ON reports(session_id);");
}

void SqliteReportStore::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw std::runtime_error("SQLite error: " + msg);
    }
}

void SqliteReportStore::prepare_statements() {
    const char* ins = "INSERT INTO reports (session_id, location, sha1, stored_at) VALUES (?, ?, ?, ?);";
    if (sqlite3_prepare_v2(db_, ins, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        throw std::runtime_error("prepare insert failed");
    }
    const char* sel = "SELECT session_id, location, sha1, stored_at FROM reports WHERE session_id = ? ORDER BY id;";
    if (sqlite3_prepare_v2(db_, sel, -1, &by_session_stmt_, nullptr) != SQLITE_OK) {
        throw std::runtime_error("prepare select failed");
    }
}

void SqliteReportStore::close_statements() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (by_session_stmt_) { sqlite3_finalize(by_session_stmt_); by_session_stmt_ = nullptr; }
}

std::string SqliteReportStore::store(const std::filesystem::path& report, const std::string& session_id) {
    if (!std::filesystem::is_regular_file(report)) {
        throw std::runtime_error("report not found: " + report.string());
    }
    auto dest_dir = root_ / "patients" / file_safe_name(session_id) / "reports";
    std::filesystem::create_directories(dest_dir);
    auto dest = dest_dir / report.filename();
    std::filesystem::copy_file(report, dest, std::filesystem::copy_options::overwrite_existing);
    std::string digest = sha1_file(dest);
    std::string location = dest.lexically_relative(root_).generic_string();

    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_reset(insert_stmt_);
    sqlite3_clear_bindings(insert_stmt_);
    bind_text(insert_stmt_, 1, session_id);
    bind_text(insert_stmt_, 2, location);
    bind_text(insert_stmt_, 3, digest);
    bind_text(insert_stmt_, 4, utc_timestamp());
    if (sqlite3_step(insert_stmt_) != SQLITE_DONE) {
        throw std::runtime_error(std::string("insert report failed: ") + sqlite3_errmsg(db_));
    }
    return location;
}

std::vector<StoredReport> SqliteReportStore::reports_for(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<StoredReport> out;
    sqlite3_reset(by_session_stmt_);
    sqlite3_clear_bindings(by_session_stmt_);
    bind_text(by_session_stmt_, 1, session_id);
    int rc;
    while ((rc = sqlite3_step(by_session_stmt_)) == SQLITE_ROW) {
        StoredReport r;
        r.session_id = column_text(by_session_stmt_, 0);
        r.location = column_text(by_session_stmt_, 1);
        r.sha1 = column_text(by_session_stmt_, 2);
        r.stored_at = column_text(by_session_stmt_, 3);
        out.push_back(std::move(r));
    }
    if (rc != SQLITE_DONE) throw std::runtime_error(std::string("select reports failed: ") + sqlite3_errmsg(db_));
    return out;
}
