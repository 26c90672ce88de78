#pragma once

#include <mutex>
#include <string>
#include <vector>

namespace tabula {

// A failure that was recovered from: which layer, which file/sheet/table, what happened.
struct report_entry {
    std::string scope;      // "file", "sheet", "relations", "table", "exporter"
    std::string subject;
    std::string message;
};

// Collects recoverable failures across workers and exporters. Thread-safe.
class run_report {
public:
    run_report() = default;
    run_report(const run_report& other);
    run_report& operator=(const run_report& other);

    void add_error(const std::string& scope, const std::string& subject, const std::string& message);

    std::vector<report_entry> entries() const;
    bool has_errors() const;
    size_t size() const;

    // One "[scope] subject: message" line per entry.
    std::string to_string() const;

private:
    mutable std::mutex mutex_;
    std::vector<report_entry> entries_;
};

} // namespace tabula
