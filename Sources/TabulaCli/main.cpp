#include <TabulaCore.hpp>
#include <tabula/util.hpp>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [options] <workbook>...\n"
              << "\n"
              << "A workbook is a directory of .csv sheets or a single .csv file.\n"
              << "\n"
              << "Options:\n"
              << "  --config <file>      JSON configuration file\n"
              << "  --output <dir>       output directory (default: generated)\n"
              << "  --package <name>     namespace for generated models\n"
              << "  --db <name>          database file name\n"
              << "  --workers <n>        worker threads (default: one per core)\n"
              << "  --lang <a,b|all>     exporters to run (default: all)\n"
              << "  --log-level <level>  off, error, warn, info or debug\n"
              << "  --help               show this message\n";
}

struct cli_args {
    std::string config_path;
    tabula::options opts;
    std::vector<std::string> workbooks;
};

// Returns false on malformed arguments.
bool parse_args(int argc, char** argv, cli_args& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.size() < 2 || arg.compare(0, 2, "--") != 0) {
            args.workbooks.push_back(arg);
            continue;
        }

        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << "\n";
            return false;
        }
        std::string value = argv[++i];

        if (arg == "--config") {
            args.config_path = value;
        } else if (arg == "--output") {
            args.opts.output_dir = value;
        } else if (arg == "--package") {
            args.opts.package_name = value;
        } else if (arg == "--db") {
            args.opts.db_name = value;
        } else if (arg == "--workers") {
            char* end = nullptr;
            unsigned long n = std::strtoul(value.c_str(), &end, 10);
            if (value.empty() || *end != '\0' || n == 0) {
                std::cerr << "Invalid worker count: " << value << "\n";
                return false;
            }
            args.opts.workers = n;
        } else if (arg == "--lang") {
            for (const auto& name : tabula::split(value, ',')) {
                std::string trimmed = tabula::trim(name);
                if (!trimmed.empty()) {
                    args.opts.exporters.push_back(trimmed);
                }
            }
        } else if (arg == "--log-level") {
            args.opts.log_level = value;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--help") {
            print_usage(argv[0]);
            return 0;
        }
    }

    cli_args args;
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 2;
    }

    tabula::options opts;
    opts.output_dir = "generated";
    try {
        if (!args.config_path.empty()) {
            opts = tabula::merge_options(opts, tabula::load_options(args.config_path));
        }
    } catch (const tabula::config_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
    opts = tabula::merge_options(opts, args.opts);

    if (!opts.log_level.empty()) {
        tabula::log_level level;
        if (!tabula::parse_log_level(opts.log_level, level)) {
            std::cerr << "Invalid log level: " << opts.log_level << "\n";
            return 2;
        }
        tabula::set_log_level(level);
    }

    if (args.workbooks.empty()) {
        std::cerr << "No workbooks given\n";
        print_usage(argv[0]);
        return 2;
    }

    tabula::run_report report;

    tabula::generator gen(tabula::open_workbook, opts.workers);
    gen.run(args.workbooks, report);
    auto tables = gen.tables();
    LOG_INFO("tabula", "Parsed %zu table(s)", tables.size());

    auto registry = tabula::make_default_registry();
    std::vector<std::string> exporters = opts.exporters;
    if (exporters.empty() || (exporters.size() == 1 && exporters[0] == "all")) {
        exporters = registry.names();
    }

    for (const auto& name : exporters) {
        tabula::options exporter_opts = opts;
        exporter_opts.output_dir = (fs::path(opts.output_dir) / name).string();
        if (registry.export_with(name, tables, exporter_opts, report)) {
            LOG_INFO("tabula", "Exported %s to %s", name.c_str(), exporter_opts.output_dir.c_str());
        }
    }

    if (report.has_errors()) {
        std::cerr << report.size() << " error(s):\n" << report.to_string();
        return 1;
    }
    return 0;
}
