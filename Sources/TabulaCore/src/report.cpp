#include "tabula/report.hpp"
#include "tabula/log.hpp"

namespace tabula {

run_report::run_report(const run_report& other) : entries_(other.entries()) {}

run_report& run_report::operator=(const run_report& other) {
    if (this != &other) {
        auto copy = other.entries();
        std::lock_guard<std::mutex> lock(mutex_);
        entries_ = std::move(copy);
    }
    return *this;
}

void run_report::add_error(const std::string& scope, const std::string& subject, const std::string& message) {
    LOG_ERROR(scope.c_str(), "%s: %s", subject.c_str(), message.c_str());
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back({scope, subject, message});
}

std::vector<report_entry> run_report::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

bool run_report::has_errors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !entries_.empty();
}

size_t run_report::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::string run_report::to_string() const {
    std::string out;
    for (const auto& e : entries()) {
        out += "[" + e.scope + "] " + e.subject + ": " + e.message + "\n";
    }
    return out;
}

} // namespace tabula
