#include "tabula/generator.hpp"
#include "tabula/errors.hpp"
#include "tabula/log.hpp"
#include "tabula/sheet_parser.hpp"
#include <algorithm>
#include <thread>

namespace tabula {

generator::generator(workbook_opener opener, size_t worker_count)
    : opener_(std::move(opener))
    , worker_count_(worker_count)
{
    if (worker_count_ == 0) {
        worker_count_ = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
}

void generator::run(const std::vector<std::string>& paths, run_report& report) {
    std::queue<std::string> queue;
    for (const auto& p : paths) {
        queue.push(p);
    }
    std::mutex queue_mutex;

    size_t threads = std::min(worker_count_, std::max<size_t>(1, paths.size()));
    LOG_INFO("generator", "Processing %zu workbook(s) with %zu worker(s)", paths.size(), threads);

    std::vector<std::thread> workers;
    workers.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers.emplace_back([this, &queue, &queue_mutex, &report] {
            work(queue, queue_mutex, report);
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    drop_duplicates(report);
}

void generator::work(std::queue<std::string>& queue, std::mutex& queue_mutex, run_report& report) {
    while (true) {
        std::string path;
        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            if (queue.empty()) {
                return;
            }
            path = std::move(queue.front());
            queue.pop();
        }

        try {
            process(path, report);
        } catch (const std::exception& e) {
            report.add_error("file", path, e.what());
        }
    }
}

void generator::process(const std::string& path, run_report& report) {
    if (is_lock_file(path)) {
        LOG_DEBUG("generator", "Skipping lock file %s", path.c_str());
        return;
    }

    std::unique_ptr<workbook> book;
    std::vector<std::string> sheets;
    try {
        book = opener_(path);
        sheets = book->sheet_names();
    } catch (const io_error& e) {
        report.add_error("file", path, e.what());
        return;
    }

    std::vector<relation> relations;
    if (std::find(sheets.begin(), sheets.end(), relation_sheet_name) != sheets.end()) {
        try {
            relations = parse_relation_sheet(book->rows(relation_sheet_name));
        } catch (const schema_error& e) {
            report.add_error("relations", path, e.what());
        } catch (const io_error& e) {
            report.add_error("relations", path, e.what());
        }
    }

    std::vector<table> tables;
    for (const auto& sheet : sheets) {
        if (is_metadata_sheet(sheet)) {
            continue;
        }
        try {
            tables.push_back(parse_sheet(sheet, book->rows(sheet), path));
        } catch (const schema_error& e) {
            report.add_error("sheet", path + ":" + sheet, e.what());
        } catch (const io_error& e) {
            report.add_error("sheet", path + ":" + sheet, e.what());
        }
    }

    LOG_INFO("generator", "%s: %zu table(s), %zu relation(s)", path.c_str(), tables.size(), relations.size());

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& t : tables) {
        tables_.push_back(std::move(t));
    }
    for (auto& r : relations) {
        relations_.push_back(std::move(r));
    }
}

void generator::drop_duplicates(run_report& report) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::stable_sort(tables_.begin(), tables_.end(), [](const table& a, const table& b) {
        if (a.name != b.name) return a.name < b.name;
        return a.source_file < b.source_file;
    });

    std::vector<table> unique;
    unique.reserve(tables_.size());
    for (auto& t : tables_) {
        if (!unique.empty() && unique.back().name == t.name) {
            report.add_error("sheet", t.source_file + ":" + t.sheet_name,
                             "table " + t.name + " is already defined in " + unique.back().source_file);
            continue;
        }
        unique.push_back(std::move(t));
    }
    tables_ = std::move(unique);
}

std::vector<table> generator::tables() const {
    std::vector<table> result;
    std::vector<relation> rels;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = tables_;
        rels = relations_;
    }

    std::sort(result.begin(), result.end(), [](const table& a, const table& b) {
        return a.name < b.name;
    });
    std::stable_sort(rels.begin(), rels.end(), [](const relation& a, const relation& b) {
        if (a.source_table != b.source_table) return a.source_table < b.source_table;
        if (a.target_table != b.target_table) return a.target_table < b.target_table;
        return a.foreign_key < b.foreign_key;
    });
    assign_relations(result, rels);
    return result;
}

std::vector<relation> generator::relations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return relations_;
}

} // namespace tabula
