#pragma once

#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace tabula {

struct options {
    std::string output_dir;
    std::string package_name;               // namespace of generated code
    std::string db_name;                    // file name inside output_dir
    size_t workers = 0;                     // 0: one per hardware thread
    std::string log_level;
    std::vector<std::string> exporters;     // empty or "all": every registered exporter
    nlohmann::json extra = nlohmann::json::object();

    /// Reads output_dir, package_name, db_name, workers, log_level,
    /// exporters and extra. Unknown keys are ignored.
    /// Throws config_error when a known key has the wrong JSON type.
    static options from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;

    bool extra_bool(const std::string& key, bool default_value) const;
    std::string extra_string(const std::string& key, const std::string& default_value) const;
};

// Throws config_error for unreadable files or malformed JSON.
options load_options(const std::filesystem::path& path);

// Non-empty fields of user override defaults; extra is merged key by key.
options merge_options(const options& defaults, const options& user);

} // namespace tabula
