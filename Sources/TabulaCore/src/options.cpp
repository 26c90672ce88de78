#include "tabula/options.hpp"
#include "tabula/errors.hpp"
#include <fstream>

namespace tabula {

namespace {

template <typename T>
void read_key(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw config_error(std::string("option '") + key + "' has the wrong type: " + e.what());
    }
}

} // namespace

options options::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw config_error("configuration must be a JSON object");
    }

    options opts;
    read_key(j, "output_dir", opts.output_dir);
    read_key(j, "package_name", opts.package_name);
    read_key(j, "db_name", opts.db_name);
    read_key(j, "workers", opts.workers);
    read_key(j, "log_level", opts.log_level);
    read_key(j, "exporters", opts.exporters);

    auto extra = j.find("extra");
    if (extra != j.end() && !extra->is_null()) {
        if (!extra->is_object()) {
            throw config_error("option 'extra' must be a JSON object");
        }
        opts.extra = *extra;
    }
    return opts;
}

nlohmann::json options::to_json() const {
    return {
        {"output_dir", output_dir},
        {"package_name", package_name},
        {"db_name", db_name},
        {"workers", workers},
        {"log_level", log_level},
        {"exporters", exporters},
        {"extra", extra}
    };
}

bool options::extra_bool(const std::string& key, bool default_value) const {
    auto it = extra.find(key);
    if (it != extra.end() && it->is_boolean()) {
        return it->get<bool>();
    }
    return default_value;
}

std::string options::extra_string(const std::string& key, const std::string& default_value) const {
    auto it = extra.find(key);
    if (it != extra.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return default_value;
}

options load_options(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw config_error("cannot open configuration file " + path.string());
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw config_error("malformed configuration file " + path.string() + ": " + e.what());
    }
    return options::from_json(j);
}

options merge_options(const options& defaults, const options& user) {
    options result = defaults;

    if (!user.output_dir.empty()) result.output_dir = user.output_dir;
    if (!user.package_name.empty()) result.package_name = user.package_name;
    if (!user.db_name.empty()) result.db_name = user.db_name;
    if (user.workers != 0) result.workers = user.workers;
    if (!user.log_level.empty()) result.log_level = user.log_level;
    if (!user.exporters.empty()) result.exporters = user.exporters;

    if (!result.extra.is_object()) {
        result.extra = nlohmann::json::object();
    }
    if (user.extra.is_object()) {
        for (auto it = user.extra.begin(); it != user.extra.end(); ++it) {
            result.extra[it.key()] = it.value();
        }
    }
    return result;
}

} // namespace tabula
