#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tabula {

using sheet_rows = std::vector<std::vector<std::string>>;

// Source of named sheets, each a grid of raw cell strings.
class workbook {
public:
    virtual ~workbook() = default;

    virtual std::vector<std::string> sheet_names() const = 0;

    // Throws io_error when the sheet does not exist or cannot be read.
    virtual sheet_rows rows(const std::string& sheet) const = 0;
};

class memory_workbook : public workbook {
public:
    memory_workbook() = default;

    void add_sheet(std::string name, sheet_rows rows);

    std::vector<std::string> sheet_names() const override;
    sheet_rows rows(const std::string& sheet) const override;

private:
    std::vector<std::pair<std::string, sheet_rows>> sheets_;
};

// A directory of .csv files (one sheet per file, named by the file stem) or a
// single .csv file. Files starting with "~$" are editor lock files and ignored.
class csv_workbook : public workbook {
public:
    explicit csv_workbook(const std::filesystem::path& path);

    std::vector<std::string> sheet_names() const override;
    sheet_rows rows(const std::string& sheet) const override;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::vector<std::pair<std::string, std::filesystem::path>> files_;  // sorted by sheet name
};

// RFC 4180 parsing: quoted fields, doubled quotes, CRLF or LF line ends,
// line breaks inside quoted fields. A leading UTF-8 BOM is dropped.
sheet_rows parse_csv(const std::string& text);

bool is_lock_file(const std::filesystem::path& path);

using workbook_opener = std::function<std::unique_ptr<workbook>(const std::string& path)>;

// Default opener used by the generator: csv_workbook over the path.
std::unique_ptr<workbook> open_workbook(const std::string& path);

} // namespace tabula
