#pragma once
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

struct ReportFields {
    std::string session_id;
    std::string generated_at;
    std::vector<std::pair<std::string, std::string>> sections; // stage name -> output, pipeline order
    std::string summary;                                       // final stage output
};

// Turns collected stage outputs into a document and returns its path.
class ReportRenderer {
public:
    virtual ~ReportRenderer() = default;
    virtual std::filesystem::path render(const ReportFields& fields) = 0;
};

// Durable storage for rendered reports. Returns the stored location.
class ReportStore {
public:
    virtual ~ReportStore() = default;
    virtual std::string store(const std::filesystem::path& report, const std::string& session_id) = 0;
};
