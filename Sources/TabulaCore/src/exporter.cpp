#include "tabula/exporter.hpp"
#include "tabula/codegen.hpp"
#include "tabula/db.hpp"
#include "tabula/errors.hpp"
#include "tabula/log.hpp"
#include "tabula/row_converter.hpp"
#include "tabula/sql.hpp"
#include "tabula/util.hpp"
#include <filesystem>
#include <fstream>
#include <set>

namespace fs = std::filesystem;

namespace tabula {

namespace {

void ensure_directory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw io_error("failed to create output directory " + dir.string() + ": " + ec.message());
    }
}

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw io_error("failed to open " + path.string() + " for writing");
    }
    out << content;
    out.close();
    if (!out) {
        throw io_error("failed to write " + path.string());
    }
}

// Inserts every row of one table. A failure rolls back this table's rows only.
size_t insert_rows(database& db, const table& t, run_report& report) {
    db.execute("SAVEPOINT table_rows");
    try {
        statement insert(db, insert_sql(t));
        row_converter converter(t);
        for (const auto& row : t.rows) {
            insert.execute(converter.convert(row));
        }
        db.execute("RELEASE table_rows");
        return t.rows.size();
    } catch (const db_error& e) {
        db.execute("ROLLBACK TO table_rows");
        db.execute("RELEASE table_rows");
        report.add_error("table", t.name, std::string("insert failed: ") + e.what());
        return 0;
    }
}

// belongsTo targets are filled before the tables that reference them.
// Tables caught in a cycle keep their input order.
std::vector<const table*> insertion_order(const std::vector<const table*>& tables) {
    std::vector<const table*> ordered;
    std::vector<const table*> pending = tables;
    std::set<std::string> waiting;
    for (const auto* t : tables) {
        waiting.insert(t->name);
    }

    while (!pending.empty()) {
        std::vector<const table*> blocked;
        for (const auto* t : pending) {
            bool ready = true;
            for (const auto& rel : t->relations) {
                if (rel.type == relation_type::belongs_to && rel.target_table != t->name &&
                    waiting.count(rel.target_table)) {
                    ready = false;
                    break;
                }
            }
            if (ready) {
                ordered.push_back(t);
            } else {
                blocked.push_back(t);
            }
        }
        for (size_t i = ordered.size() - (pending.size() - blocked.size()); i < ordered.size(); ++i) {
            waiting.erase(ordered[i]->name);
        }

        if (blocked.size() == pending.size()) {
            ordered.insert(ordered.end(), blocked.begin(), blocked.end());
            break;
        }
        pending = std::move(blocked);
    }
    return ordered;
}

} // namespace

// ============================================================================
// sqlite_exporter
// ============================================================================

void sqlite_exporter::export_tables(const std::vector<table>& tables, const options& opts,
                                    run_report& report) {
    fs::path dir = opts.output_dir.empty() ? fs::path(".") : fs::path(opts.output_dir);
    ensure_directory(dir);

    fs::path db_path = dir / (opts.db_name.empty() ? "tabula.db" : opts.db_name);
    if (opts.extra_bool("overwrite", true)) {
        std::error_code ec;
        fs::remove(db_path, ec);
        if (ec) {
            throw io_error("failed to replace " + db_path.string() + ": " + ec.message());
        }
    }

    database db(db_path.string());

    std::vector<const table*> created;
    {
        transaction tx(db);
        for (const auto& t : tables) {
            try {
                db.execute(create_table_sql(t));
                for (const auto& index : create_index_sql(t)) {
                    db.execute(index);
                }
                created.push_back(&t);
            } catch (const db_error& e) {
                report.add_error("table", t.name, std::string("create failed: ") + e.what());
            }
        }
        tx.commit();
    }

    size_t inserted = 0;
    {
        transaction tx(db);
        for (const auto* t : insertion_order(created)) {
            inserted += insert_rows(db, *t, report);
        }
        tx.commit();
    }

    write_file(dir / "schema.sql", schema_script(tables));

    LOG_INFO("sqlite", "Wrote %zu table(s), %zu row(s) to %s",
             created.size(), inserted, db_path.string().c_str());
}

// ============================================================================
// model_exporter
// ============================================================================

void model_exporter::export_tables(const std::vector<table>& tables, const options& opts,
                                   run_report& report) {
    fs::path dir = opts.output_dir.empty() ? fs::path(".") : fs::path(opts.output_dir);
    ensure_directory(dir);

    std::string ns = opts.package_name.empty() ? "models" : opts.package_name;
    bool write_sql = opts.extra_bool("write_sql", true);

    for (const auto& t : tables) {
        std::string stem = to_lower(t.name);
        try {
            write_file(dir / (stem + ".hpp"), model_header(t, ns));
            if (write_sql) {
                write_file(dir / (stem + ".sql"), model_sql(t));
            }
        } catch (const io_error& e) {
            report.add_error("table", t.name, e.what());
        }
    }

    LOG_INFO("cpp", "Wrote %zu model(s) to %s", tables.size(), dir.string().c_str());
}

// ============================================================================
// exporter_registry
// ============================================================================

void exporter_registry::register_exporter(const std::string& name, factory_fn factory, options defaults) {
    for (auto& e : entries_) {
        if (e.name == name) {
            e.factory = std::move(factory);
            e.defaults = std::move(defaults);
            return;
        }
    }
    entries_.push_back({name, std::move(factory), std::move(defaults)});
}

bool exporter_registry::contains(const std::string& name) const {
    for (const auto& e : entries_) {
        if (e.name == name) return true;
    }
    return false;
}

const exporter_registry::entry& exporter_registry::find(const std::string& name) const {
    for (const auto& e : entries_) {
        if (e.name == name) return e;
    }
    throw config_error("no exporter registered for: " + name);
}

std::unique_ptr<exporter> exporter_registry::create(const std::string& name) const {
    return find(name).factory();
}

const options& exporter_registry::default_options(const std::string& name) const {
    return find(name).defaults;
}

std::vector<std::string> exporter_registry::names() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& e : entries_) {
        result.push_back(e.name);
    }
    return result;
}

bool exporter_registry::export_with(const std::string& name, const std::vector<table>& tables,
                                    const options& user, run_report& report) const {
    try {
        const auto& registered = find(name);
        auto exp = registered.factory();
        exp->export_tables(tables, merge_options(registered.defaults, user), report);
        return true;
    } catch (const config_error& e) {
        report.add_error("exporter", name, e.what());
    } catch (const io_error& e) {
        report.add_error("exporter", name, e.what());
    } catch (const db_error& e) {
        report.add_error("exporter", name, e.what());
    }
    return false;
}

exporter_registry make_default_registry() {
    exporter_registry registry;

    options sqlite_defaults;
    sqlite_defaults.db_name = "tabula.db";
    sqlite_defaults.extra = {{"overwrite", true}};
    registry.register_exporter("sqlite", [] { return std::make_unique<sqlite_exporter>(); },
                               sqlite_defaults);

    options cpp_defaults;
    cpp_defaults.package_name = "models";
    cpp_defaults.extra = {{"write_sql", true}};
    registry.register_exporter("cpp", [] { return std::make_unique<model_exporter>(); },
                               cpp_defaults);

    return registry;
}

} // namespace tabula
