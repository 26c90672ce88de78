#pragma once

#include <tabula/sql.hpp>
#include <tabula/sheet_parser.hpp>
#include <tabula/db.hpp>
#include <cassert>
#include <iostream>

namespace sql_tests {

// ============================================================================
// test_quote_identifier - keywords and special characters are quoted
// ============================================================================

void test_quote_identifier() {
    std::cout << "  test_quote_identifier..." << std::flush;

    assert(tabula::quote_identifier("select") == "\"select\"");
    assert(tabula::quote_identifier("Order") == "\"Order\"");
    assert(tabula::quote_identifier("name") == "name");
    assert(tabula::quote_identifier("Level Req") == "\"Level Req\"");
    assert(tabula::quote_identifier("a-b") == "\"a-b\"");
    assert(tabula::quote_identifier("say\"hi") == "\"say\"\"hi\"");
    assert(tabula::is_sql_keyword("REFERENCES"));
    assert(!tabula::is_sql_keyword("Skills"));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_column_definition - tag order and default literals
// ============================================================================

void test_column_definition() {
    std::cout << "  test_column_definition..." << std::flush;

    auto columns = tabula::build_columns({"Score", "Title", "Key"},
                                         {"int32", "string", "string"},
                                         {"unique,default:0", "notnull,default:it's", "pk"});
    // Sorted: Key, Score, Title
    assert(tabula::column_definition(columns[0]) == "\"Key\" TEXT PRIMARY KEY");
    assert(tabula::column_definition(columns[1]) == "Score INTEGER UNIQUE DEFAULT 0");
    assert(tabula::column_definition(columns[2]) == "Title TEXT NOT NULL DEFAULT 'it''s'");

    assert(tabula::default_literal("-1.5") == "-1.5");
    assert(tabula::default_literal("current_timestamp") == "CURRENT_TIMESTAMP");
    assert(tabula::default_literal("'x'") == "'x'");
    assert(tabula::default_literal("(1 + 2)") == "(1 + 2)");
    assert(tabula::default_literal("abc") == "'abc'");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_relations_ddl - belongsTo adds a foreign key clause and an index
// ============================================================================

void test_relations_ddl() {
    std::cout << "  test_relations_ddl..." << std::flush;

    auto relations = tabula::parse_relation_sheet({
        {"SourceTable", "TargetTable", "RelationType", "ForeignKey", "ReferenceKey"},
        {"post", "user", "belongsTo", "", ""},
        {"User", "Post", "hasMany", "", ""},
    });
    assert(relations.size() == 2);
    assert(relations[0].source_table == "Post");
    assert(relations[0].target_table == "User");
    assert(relations[0].foreign_key == "PostID");
    assert(relations[0].reference_key == "ID");

    auto post = tabula::parse_sheet("Post", {
        {"Title", "PostID"},
        {"index", ""},
        {"string", "int"},
        {"Hello", "1"},
    });
    auto user = tabula::parse_sheet("User", {
        {"Name"},
        {""},
        {"string"},
        {"Alice"},
    });
    std::vector<tabula::table> tables = {post, user};
    tabula::assign_relations(tables, relations);
    assert(tables[0].relations.size() == 1);
    assert(tables[1].relations.size() == 1);

    auto ddl = tabula::create_table_sql(tables[0]);
    assert(ddl.find("CREATE TABLE IF NOT EXISTS Post (\n  id INTEGER PRIMARY KEY AUTOINCREMENT") == 0);
    assert(ddl.find("FOREIGN KEY(PostID) REFERENCES User(id)") != std::string::npos);

    auto indices = tabula::create_index_sql(tables[0]);
    assert(indices.size() == 2);
    assert(indices[0] == "CREATE INDEX IF NOT EXISTS idx_Post_Title ON Post(Title);");
    assert(indices[1] == "CREATE INDEX IF NOT EXISTS idx_Post_PostID ON Post(PostID);");

    // hasMany has no DDL effect
    auto user_ddl = tabula::create_table_sql(tables[1]);
    assert(user_ddl.find("FOREIGN KEY") == std::string::npos);
    assert(tabula::create_index_sql(tables[1]).empty());

    auto script = tabula::schema_script(tables);
    assert(script.find("PRAGMA foreign_keys=ON;") != std::string::npos);
    assert(script.find(ddl) != std::string::npos);
    assert(script.find(user_ddl) != std::string::npos);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_ddl_insert_alignment - DDL and INSERT list the same columns in order
// ============================================================================

void test_ddl_insert_alignment() {
    std::cout << "  test_ddl_insert_alignment..." << std::flush;

    auto t = tabula::parse_sheet("Order", {
        {"Name", "Skills", "Skills", "Level Req"},
        {"", "", "", ""},
        {"string", "array<string>", "array<string>", "int"},
        {"a", "b", "c", "1"},
    });

    auto insert = tabula::insert_sql(t);
    assert(insert == "INSERT INTO \"Order\" (LevelReq, Name, Skills, Skills_0, Skills_1) "
                     "VALUES (?, ?, ?, ?, ?)");

    // Column order in DDL matches the INSERT column list
    auto ddl = tabula::create_table_sql(t);
    size_t last = 0;
    for (const auto& name : tabula::column_names(t)) {
        size_t at = ddl.find("\n  " + tabula::quote_identifier(name) + " ");
        assert(at != std::string::npos);
        assert(at > last);
        last = at;
        assert(insert.find(tabula::quote_identifier(name)) != std::string::npos);
    }

    // Both statements are accepted by SQLite and agree on the column count
    tabula::database db(":memory:");
    db.execute(ddl);
    auto info = db.table_info("Order");
    assert(info.size() == t.columns.size() + 1);
    assert(info["Skills"] == "TEXT");
    assert(info["LevelReq"] == "INTEGER");

    tabula::statement stmt(db, insert);
    stmt.execute({int64_t{3}, std::string("x"), std::string("[\"b\",\"c\"]"), std::string("b"), std::string("c")});
    auto rows = db.query("SELECT Skills_1 FROM \"Order\"");
    assert(rows.size() == 1);
    assert(std::get<std::string>(rows[0]["Skills_1"]) == "c");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_design_only_table - a table without storable columns still takes rows
// ============================================================================

void test_design_only_table() {
    std::cout << "  test_design_only_table..." << std::flush;

    auto t = tabula::parse_sheet("Notes", {{"Memo"}, {"design"}, {"string"}, {"hello"}});
    assert(t.columns.empty());
    assert(t.rows.size() == 1);
    assert(tabula::insert_sql(t) == "INSERT INTO Notes DEFAULT VALUES");

    tabula::database db(":memory:");
    db.execute(tabula::create_table_sql(t));
    tabula::statement stmt(db, tabula::insert_sql(t));
    stmt.execute({});
    stmt.execute({});
    auto rows = db.query("SELECT id FROM Notes ORDER BY id");
    assert(rows.size() == 2);
    assert(std::get<int64_t>(rows[1]["id"]) == 2);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_transactions - guard rolls back unless committed
// ============================================================================

void test_transactions() {
    std::cout << "  test_transactions..." << std::flush;

    tabula::database db(":memory:");
    db.execute("CREATE TABLE t (v INTEGER)");

    {
        tabula::transaction tx(db);
        db.execute("INSERT INTO t (v) VALUES (?)", {int64_t{1}});
        assert(db.is_in_transaction());
    }
    assert(!db.is_in_transaction());
    assert(db.query("SELECT v FROM t").empty());

    {
        tabula::transaction tx(db);
        db.execute("INSERT INTO t (v) VALUES (?)", {int64_t{1}});
        tx.rollback();
        assert(!db.is_in_transaction());
    }
    assert(db.query("SELECT v FROM t").empty());

    {
        tabula::transaction tx(db);
        db.execute("INSERT INTO t (v) VALUES (?)", {int64_t{2}});
        tx.commit();
    }
    assert(db.last_insert_rowid() == 1);
    auto rows = db.query("SELECT v FROM t");
    assert(rows.size() == 1);
    assert(std::get<int64_t>(rows[0]["v"]) == 2);
    assert(db.table_exists("t"));
    assert(!db.table_exists("missing"));

    bool threw = false;
    try {
        db.execute("INSERT INTO missing VALUES (1)");
    } catch (const tabula::db_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Run all SQL tests
// ============================================================================

void run_all() {
    std::cout << std::endl;
    std::cout << "--- SQL Tests ---" << std::endl;

    test_quote_identifier();
    test_column_definition();
    test_relations_ddl();
    test_ddl_insert_alignment();
    test_design_only_table();
    test_transactions();

    std::cout << "--- SQL Tests: All passed ---" << std::endl;
}

} // namespace sql_tests
