#include "tabula/workbook.hpp"
#include "tabula/errors.hpp"
#include "tabula/log.hpp"
#include "tabula/util.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace tabula {

// ============================================================================
// memory_workbook
// ============================================================================

void memory_workbook::add_sheet(std::string name, sheet_rows rows) {
    sheets_.emplace_back(std::move(name), std::move(rows));
}

std::vector<std::string> memory_workbook::sheet_names() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : sheets_) {
        names.push_back(name);
    }
    return names;
}

sheet_rows memory_workbook::rows(const std::string& sheet) const {
    for (const auto& [name, rows] : sheets_) {
        if (name == sheet) {
            return rows;
        }
    }
    throw io_error("no sheet named " + sheet);
}

// ============================================================================
// csv_workbook
// ============================================================================

bool is_lock_file(const fs::path& path) {
    return starts_with(path.filename().string(), "~$");
}

csv_workbook::csv_workbook(const fs::path& path) : path_(path) {
    try {
        if (fs::is_directory(path_)) {
            for (const auto& entry : fs::directory_iterator(path_)) {
                const auto& p = entry.path();
                if (!entry.is_regular_file() || to_lower(p.extension().string()) != ".csv") {
                    continue;
                }
                if (is_lock_file(p)) {
                    LOG_DEBUG("workbook", "Ignoring lock file %s", p.string().c_str());
                    continue;
                }
                files_.emplace_back(p.stem().string(), p);
            }
        } else if (fs::is_regular_file(path_)) {
            files_.emplace_back(path_.stem().string(), path_);
        } else {
            throw io_error("workbook not found: " + path_.string());
        }
    } catch (const fs::filesystem_error& e) {
        throw io_error("failed to read workbook " + path_.string() + ": " + e.what());
    }

    std::sort(files_.begin(), files_.end());
}

std::vector<std::string> csv_workbook::sheet_names() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : files_) {
        names.push_back(name);
    }
    return names;
}

sheet_rows csv_workbook::rows(const std::string& sheet) const {
    for (const auto& [name, file] : files_) {
        if (name != sheet) continue;

        std::ifstream in(file, std::ios::binary);
        if (!in) {
            throw io_error("failed to open " + file.string());
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        if (in.bad()) {
            throw io_error("failed to read " + file.string());
        }
        return parse_csv(buffer.str());
    }
    throw io_error("no sheet named " + sheet + " in " + path_.string());
}

sheet_rows parse_csv(const std::string& text) {
    sheet_rows rows;
    std::vector<std::string> row;
    std::string field;
    bool in_quotes = false;
    bool row_has_content = false;

    size_t i = 0;
    if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        i = 3;
    }

    auto end_field = [&]() {
        row.push_back(std::move(field));
        field.clear();
    };
    auto end_row = [&]() {
        end_field();
        rows.push_back(std::move(row));
        row.clear();
        row_has_content = false;
    };

    for (; i < text.size(); ++i) {
        char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        switch (c) {
            case '"':
                in_quotes = true;
                row_has_content = true;
                break;
            case ',':
                end_field();
                row_has_content = true;
                break;
            case '\r':
                if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
                end_row();
                break;
            case '\n':
                end_row();
                break;
            default:
                field += c;
                row_has_content = true;
                break;
        }
    }

    if (row_has_content || !field.empty() || !row.empty()) {
        end_row();
    }
    return rows;
}

std::unique_ptr<workbook> open_workbook(const std::string& path) {
    return std::make_unique<csv_workbook>(fs::path(path));
}

} // namespace tabula
