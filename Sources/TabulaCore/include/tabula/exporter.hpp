#pragma once

#include "options.hpp"
#include "report.hpp"
#include "schema.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tabula {

class exporter {
public:
    virtual ~exporter() = default;

    virtual std::string name() const = 0;

    // Per-table failures go to the report; failures that stop the whole
    // export (output directory, database open) throw io_error or db_error.
    virtual void export_tables(const std::vector<table>& tables, const options& opts,
                               run_report& report) = 0;
};

// Writes <output_dir>/<db_name> with every table's schema and rows, plus
// <output_dir>/schema.sql. extra "overwrite" (default true) replaces an
// existing database file instead of appending to it.
class sqlite_exporter : public exporter {
public:
    std::string name() const override { return "sqlite"; }

    void export_tables(const std::vector<table>& tables, const options& opts,
                       run_report& report) override;
};

// Writes <output_dir>/<table_lower>.hpp and, unless extra "write_sql" is
// false, <output_dir>/<table_lower>.sql for every table.
class model_exporter : public exporter {
public:
    std::string name() const override { return "cpp"; }

    void export_tables(const std::vector<table>& tables, const options& opts,
                       run_report& report) override;
};

// Named exporter factories with their default options, kept in registration order.
class exporter_registry {
public:
    using factory_fn = std::function<std::unique_ptr<exporter>()>;

    // Re-registering a name replaces the earlier entry in place.
    void register_exporter(const std::string& name, factory_fn factory, options defaults = {});

    bool contains(const std::string& name) const;

    // Throws config_error for unknown names.
    std::unique_ptr<exporter> create(const std::string& name) const;
    const options& default_options(const std::string& name) const;

    std::vector<std::string> names() const;

    // Runs one exporter with merge_options(default_options(name), user).
    // Failures are recorded in the report; returns false when the exporter
    // could not run to completion.
    bool export_with(const std::string& name, const std::vector<table>& tables,
                     const options& user, run_report& report) const;

private:
    struct entry {
        std::string name;
        factory_fn factory;
        options defaults;
    };

    const entry& find(const std::string& name) const;

    std::vector<entry> entries_;
};

// Registry with "sqlite" and "cpp".
exporter_registry make_default_registry();

} // namespace tabula
