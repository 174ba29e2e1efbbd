#pragma once
#include <filesystem>
#include <string>

std::string getenv_or(const char* key, const std::string& def);
int getenv_int(const char* key, int def);
double getenv_double(const char* key, double def);

// Lowercase hex SHA-1 of the file contents. Throws std::runtime_error.
std::string sha1_file(const std::filesystem::path& p);

// "session_20250101_120000_1a2b3c4d"
std::string gen_session_id();
// Local time as YYYYmmdd_HHMMSS, for file names.
std::string file_timestamp();
