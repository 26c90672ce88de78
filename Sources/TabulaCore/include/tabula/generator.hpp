#pragma once

#include "report.hpp"
#include "schema.hpp"
#include "workbook.hpp"
#include <mutex>
#include <queue>
#include <string>
#include <vector>

namespace tabula {

// Parses many workbooks in parallel into one table list.
//
// A fixed pool of worker threads drains a shared queue of paths; each worker
// handles one workbook end to end. Parsed tables and relations are appended
// under a single lock. Failures are recorded in the run_report at the scope
// they happen (file, sheet, relation sheet) and never stop other work.
class generator {
public:
    // worker_count 0 uses std::thread::hardware_concurrency().
    explicit generator(workbook_opener opener = open_workbook, size_t worker_count = 0);

    generator(const generator&) = delete;
    generator& operator=(const generator&) = delete;

    // Blocks until every path is processed. May be called more than once;
    // results accumulate. When two workbooks define the same table name, the
    // one from the lexicographically first source file is kept.
    void run(const std::vector<std::string>& paths, run_report& report);

    // Sorted by name, relations assigned.
    std::vector<table> tables() const;

    std::vector<relation> relations() const;

    size_t worker_count() const { return worker_count_; }

private:
    void work(std::queue<std::string>& queue, std::mutex& queue_mutex, run_report& report);
    void process(const std::string& path, run_report& report);
    void drop_duplicates(run_report& report);

    workbook_opener opener_;
    size_t worker_count_;

    mutable std::mutex mutex_;
    std::vector<table> tables_;
    std::vector<relation> relations_;
};

} // namespace tabula
