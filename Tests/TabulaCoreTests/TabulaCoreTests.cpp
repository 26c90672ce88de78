#include <TabulaCore.hpp>
#include <cassert>
#include <iostream>
#include <algorithm>
#include <cstdint>

#include "SqlTests.hpp"
#include "WorkbookTests.hpp"
#include "ExportTests.hpp"

// ============================================================================
// Test: Declared type parsing
// ============================================================================

void test_column_types() {
    std::cout << "Testing column types..." << std::endl;

    assert(tabula::parse_column_type("int").kind == tabula::column_kind::int32);
    assert(tabula::parse_column_type(" Integer ").kind == tabula::column_kind::int32);
    assert(tabula::parse_column_type("bigint").kind == tabula::column_kind::int64);
    assert(tabula::parse_column_type("double").kind == tabula::column_kind::float64);
    assert(tabula::parse_column_type("BOOL").kind == tabula::column_kind::boolean);
    assert(tabula::parse_column_type("timestamp").kind == tabula::column_kind::date_time);
    assert(tabula::parse_column_type("[]byte").kind == tabula::column_kind::bytes);

    // Unknown tokens degrade to string
    auto unknown = tabula::parse_column_type("money");
    assert(unknown.kind == tabula::column_kind::string);
    assert(!unknown.is_array);

    auto ints = tabula::parse_column_type("array<int>");
    assert(ints.is_array);
    assert(ints.base_type);
    assert(!ints.base_type->is_array);
    assert(ints.element().kind == tabula::column_kind::int32);
    assert(tabula::type_name(ints) == "array<int32>");

    // Nested arrays flatten to the scalar element
    auto nested = tabula::parse_column_type("array<array<string>>");
    assert(nested.is_array);
    assert(!nested.base_type->is_array);
    assert(nested == tabula::parse_column_type("array<string>"));

    // Copies are deep
    auto copy = ints;
    assert(copy == ints);
    assert(copy.base_type.get() != ints.base_type.get());

    assert(tabula::sql_type_string(tabula::parse_column_type("int")) == "INTEGER");
    assert(tabula::sql_type_string(tabula::parse_column_type("int64")) == "BIGINT");
    assert(tabula::sql_type_string(tabula::parse_column_type("float")) == "REAL");
    assert(tabula::sql_type_string(tabula::parse_column_type("bool")) == "INTEGER");
    assert(tabula::sql_type_string(tabula::parse_column_type("datetime")) == "DATETIME");
    assert(tabula::sql_type_string(tabula::parse_column_type("blob")) == "BLOB");
    assert(tabula::sql_type_string(ints) == "TEXT");
    assert(tabula::cpp_type_string(ints) == "std::vector<int32_t>");

    std::cout << "  Column types test passed!" << std::endl;
}

// ============================================================================
// Test: Name normalization and tags
// ============================================================================

void test_names_and_tags() {
    std::cout << "Testing names and tags..." << std::endl;

    assert(tabula::format_name("level req") == "LevelReq");
    assert(tabula::format_name("  max   hp ") == "MaxHp");
    assert(tabula::format_name("Name") == "Name");
    assert(tabula::format_name("   ").empty());

    // Idempotent
    for (const char* raw : {"level req", "item_name", "  a b  c", "HP"}) {
        auto once = tabula::format_name(raw);
        assert(tabula::format_name(once) == once);
    }

    assert(tabula::is_reserved_column_name("id"));
    assert(tabula::is_reserved_column_name("ID"));
    assert(tabula::is_reserved_column_name("Created_At"));
    assert(!tabula::is_reserved_column_name("Identifier"));

    auto tags = tabula::parse_tags("unique, Not_Null ,default:42, size:16, bogus, pk");
    assert(tags.size() == 5);
    assert(tabula::has_tag(tags, tabula::tag::unique));
    assert(tabula::has_tag(tags, tabula::tag::not_null));
    assert(tabula::has_tag(tags, tabula::tag::primary_key));
    assert(tabula::tag_value_of(tags, tabula::tag::default_value) == std::optional<std::string>("42"));
    assert(tabula::tag_value_of(tags, tabula::tag::size) == std::optional<std::string>("16"));
    assert(!tabula::tag_value_of(tags, tabula::tag::index));

    // Values on non value-bearing tags are dropped
    auto unique = tabula::parse_tag_with_value("unique:yes");
    assert(unique);
    assert(unique->kind == tabula::tag::unique);
    assert(unique->value.empty());

    assert(tabula::parse_tag("DesignOnly") == std::optional<tabula::tag>(tabula::tag::design_only));
    assert(!tabula::parse_tag("nonsense"));
    assert(tabula::parse_tags("").empty());

    assert(tabula::parse_relation_type("Belongs-To") == std::optional<tabula::relation_type>(tabula::relation_type::belongs_to));
    assert(tabula::parse_relation_type("hasMany") == std::optional<tabula::relation_type>(tabula::relation_type::has_many));
    assert(!tabula::parse_relation_type("owns"));

    std::cout << "  Names and tags test passed!" << std::endl;
}

// ============================================================================
// Test: Column builder
// ============================================================================

void test_column_builder() {
    std::cout << "Testing column builder..." << std::endl;

    // Reserved id column
    bool threw = false;
    try {
        tabula::build_columns({"id", "Name"}, {"int", "string"}, {"", ""});
    } catch (const tabula::schema_error&) {
        threw = true;
    }
    assert(threw);

    // Repeated array header expands to aggregate + slots
    auto columns = tabula::build_columns(
        {"Name", "Skills", "Skills", "Skills"},
        {"string", "array<string>", "array<string>", "array<string>"},
        {"", "", "", ""});

    std::vector<std::string> names;
    for (const auto& c : columns) names.push_back(c.name);
    assert((names == std::vector<std::string>{"Name", "Skills", "Skills_0", "Skills_1", "Skills_2"}));

    const auto& skills = columns[1];
    assert(skills.is_aggregate());
    assert(skills.array_size == 3);
    assert((skills.source_positions == std::vector<size_t>{1, 2, 3}));
    assert(tabula::sql_type_string(skills.type) == "TEXT");

    const auto& slot1 = columns[3];
    assert(slot1.is_array_element());
    assert(slot1.array_index == 1);
    assert(slot1.type.kind == tabula::column_kind::string);
    assert(!slot1.type.is_array);
    assert((slot1.source_positions == std::vector<size_t>{2}));

    assert(tabula::tag_string(skills) == "type:text");
    assert(tabula::tag_string(slot1) == "column:skills_1");

    // Design-only columns and blank headers never reach the model
    auto trimmed = tabula::build_columns(
        {"Name", "", "Notes", "level req"},
        {"string", "int", "string", "int"},
        {"unique", "", "design", "index,default:1"});
    assert(trimmed.size() == 2);
    assert(trimmed[0].name == "LevelReq");
    assert(trimmed[1].name == "Name");
    assert(trimmed[1].is_unique);
    assert(tabula::tag_string(trimmed[0]) == "index;default:1");

    // Duplicate plain names
    threw = false;
    try {
        tabula::build_columns({"hp", "Hp"}, {"int", "int"}, {"", ""});
    } catch (const tabula::schema_error&) {
        threw = true;
    }
    assert(threw);

    // Expansion name collides with a plain column
    threw = false;
    try {
        tabula::build_columns({"Tags", "Tags_0"}, {"array<int>", "int"}, {"", ""});
    } catch (const tabula::schema_error&) {
        threw = true;
    }
    assert(threw);

    // Expansion name collides with the aggregate of another array
    threw = false;
    try {
        tabula::build_columns({"A", "A", "A_0"}, {"array<int>", "array<int>", "array<int>"}, {"", "", ""});
    } catch (const tabula::schema_error& e) {
        threw = true;
        assert(std::string(e.what()).find("A_0") != std::string::npos);
    }
    assert(threw);

    std::cout << "  Column builder test passed!" << std::endl;
}

// ============================================================================
// Test: Value parsers
// ============================================================================

void test_value_parsers() {
    std::cout << "Testing value parsers..." << std::endl;

    auto ints = tabula::make_parser("Hp", tabula::parse_column_type("int"));
    assert(std::get<int32_t>(ints->parse(" 42 ").scalar()) == 42);
    assert(std::get<int32_t>(ints->parse("-7").scalar()) == -7);
    assert(ints->parse("").is_zero());
    bool threw = false;
    try {
        ints->parse("4x");
    } catch (const tabula::parse_error& e) {
        threw = true;
        assert(e.column() == "Hp");
    }
    assert(threw);

    threw = false;
    try {
        ints->parse("99999999999");
    } catch (const tabula::parse_error&) {
        threw = true;
    }
    assert(threw);

    auto big = tabula::make_parser("Gold", tabula::parse_column_type("int64"));
    assert(std::get<int64_t>(big->parse("99999999999").scalar()) == 99999999999LL);

    auto doubles = tabula::make_parser("Rate", tabula::parse_column_type("float"));
    assert(std::get<double>(doubles->parse("0.25").scalar()) == 0.25);

    auto bools = tabula::make_parser("Active", tabula::parse_column_type("bool"));
    assert(std::get<bool>(bools->parse("True").scalar()));
    assert(!std::get<bool>(bools->parse("f").scalar()));
    threw = false;
    try {
        bools->parse("yes");
    } catch (const tabula::parse_error&) {
        threw = true;
    }
    assert(threw);

    // Storage conversion
    assert(std::get<int64_t>(bools->parse("1").to_column_value()) == 1);
    assert(std::get<int64_t>(ints->parse("42").to_column_value()) == 42);

    std::cout << "  Value parsers test passed!" << std::endl;
}

// ============================================================================
// Test: Timestamps
// ============================================================================

void test_timestamps() {
    std::cout << "Testing timestamps..." << std::endl;

    auto plain = tabula::parse_timestamp("2024-01-02 15:04:05");
    assert(plain);
    assert(std::chrono::duration_cast<std::chrono::seconds>(plain->time_since_epoch()).count() == 1704207845);
    assert(tabula::format_timestamp(*plain) == "2024-01-02 15:04:05");
    assert(tabula::format_timestamp_rfc3339(*plain) == "2024-01-02T15:04:05Z");

    assert(tabula::parse_timestamp("2024-01-02T15:04:05Z") == plain);
    assert(tabula::parse_timestamp("2024-01-02T15:04:05") == plain);

    auto fractional = tabula::parse_timestamp("2024-01-02 15:04:05.250");
    assert(fractional);
    assert(tabula::format_timestamp(*fractional) == "2024-01-02 15:04:05.25");

    auto date_only = tabula::parse_timestamp("2024-02-29");
    assert(date_only);
    assert(tabula::format_timestamp(*date_only) == "2024-02-29 00:00:00");

    assert(!tabula::parse_timestamp("2023-02-29"));
    assert(!tabula::parse_timestamp("2024-13-01"));
    assert(!tabula::parse_timestamp("not-a-date"));
    assert(!tabula::parse_timestamp("2024-01-02 25:00:00"));

    auto dates = tabula::make_parser("Opened", tabula::parse_column_type("datetime"));
    bool threw = false;
    try {
        dates->parse("not-a-date");
    } catch (const tabula::parse_error& e) {
        threw = true;
        assert(std::string(e.what()).find("failed to parse date") != std::string::npos);
    }
    assert(threw);
    assert(std::get<std::string>(dates->parse("2024-01-02 15:04:05").to_column_value()) ==
           "2024-01-02 15:04:05");

    // The epoch is a real date; only a blank cell is zero
    assert(!dates->parse("1970-01-01").is_zero());
    assert(dates->parse("").is_zero());
    assert(tabula::format_timestamp(tabula::zero_timestamp()) == "0001-01-01 00:00:00");
    assert(tabula::parse_timestamp("0001-01-01 00:00:00") == tabula::zero_timestamp());
    assert(std::get<std::string>(dates->parse("").to_column_value()) == "0001-01-01 00:00:00");

    auto date_list = tabula::make_parser("Dates", tabula::parse_column_type("array<datetime>"));
    auto kept = date_list->parse("1970-01-01,2024-01-02");
    assert(kept.elements().size() == 2);
    assert(std::get<std::string>(kept.to_column_value()) ==
           R"(["1970-01-01T00:00:00Z","2024-01-02T00:00:00Z"])");
    auto epoch_back = tabula::decode_array(std::get<std::string>(kept.to_column_value()),
                                           tabula::column_kind::date_time);
    assert(epoch_back.size() == 2);
    assert(!tabula::is_zero(epoch_back[0]));

    std::cout << "  Timestamps test passed!" << std::endl;
}

// ============================================================================
// Test: Array fields
// ============================================================================

void test_arrays() {
    std::cout << "Testing array fields..." << std::endl;

    auto parser = tabula::make_parser("Skills", tabula::parse_column_type("array<string>"));
    auto parsed = parser->parse("fire, ,ice");
    assert(parsed.is_array());
    assert(parsed.elements().size() == 2);
    assert(std::get<std::string>(parsed.to_column_value()) == R"(["fire","ice"])");
    assert(std::get<std::string>(parser->parse("").to_column_value()) == "[]");

    // Zeros are dropped on encode
    std::vector<tabula::scalar_value> with_zero = {int32_t{3}, int32_t{0}, int32_t{5}};
    assert(tabula::encode_array(with_zero) == "[3,5]");

    auto decoded = tabula::decode_array("[3,5]", tabula::column_kind::int32);
    assert(decoded.size() == 2);
    assert(std::get<int32_t>(decoded[1]) == 5);

    bool threw = false;
    try {
        tabula::decode_array("{\"a\":1}", tabula::column_kind::int32);
    } catch (const tabula::parse_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        tabula::decode_array("[\"x\"]", tabula::column_kind::int32);
    } catch (const tabula::parse_error&) {
        threw = true;
    }
    assert(threw);

    // Values outside the element range are rejected, not truncated
    threw = false;
    try {
        tabula::decode_array("[3000000000]", tabula::column_kind::int32);
    } catch (const tabula::parse_error& e) {
        threw = true;
        assert(std::string(e.what()).find("out of range") != std::string::npos);
    }
    assert(threw);

    threw = false;
    try {
        tabula::decode_array("[18446744073709551615]", tabula::column_kind::int64);
    } catch (const tabula::parse_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        tabula::from_column_value(tabula::column_value_t{int64_t{5000000000}}, tabula::column_kind::int32);
    } catch (const tabula::parse_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        tabula::from_column_value(tabula::column_value_t{1e20}, tabula::column_kind::int64);
    } catch (const tabula::parse_error&) {
        threw = true;
    }
    assert(threw);

    assert(std::get<int32_t>(tabula::from_column_value(tabula::column_value_t{int64_t{-2147483648LL}},
                                                       tabula::column_kind::int32)) == INT32_MIN);
    assert(std::get<int32_t>(tabula::decode_array("[2147483647]", tabula::column_kind::int32)[0]) == INT32_MAX);

    // Expansion pads and truncates to the slot count
    auto slots = tabula::expand_array(decoded, 4, tabula::column_kind::int32);
    assert(slots.size() == 4);
    assert(tabula::is_zero(slots[2]));
    assert(tabula::collect_array(slots).size() == 2);

    auto truncated = tabula::expand_array(decoded, 1, tabula::column_kind::int32);
    assert(truncated.size() == 1);
    assert(std::get<int32_t>(truncated[0]) == 3);

    // A gap ends the array
    std::vector<tabula::scalar_value> gapped = {std::string("a"), std::string(), std::string("c")};
    auto collected = tabula::collect_array(gapped);
    assert(collected.size() == 1);
    assert(std::get<std::string>(collected[0]) == "a");

    // Rebuild from a fetched row using the stored slot count
    auto columns = tabula::build_columns({"Loot", "Loot", "Loot"},
                                         {"array<int>", "array<int>", "array<int>"},
                                         {"", "", ""});
    const tabula::column* loot = nullptr;
    for (const auto& c : columns) {
        if (c.is_aggregate()) loot = &c;
    }
    assert(loot);

    std::unordered_map<std::string, tabula::column_value_t> row = {
        {"Loot_0", int64_t{7}},
        {"Loot_1", int64_t{9}},
        {"Loot_2", nullptr},
    };
    auto rebuilt = tabula::reconstruct_array(row, *loot);
    assert(rebuilt.size() == 2);
    assert(std::get<int32_t>(rebuilt[0]) == 7);
    assert(std::get<int32_t>(rebuilt[1]) == 9);

    row["Loot_1"] = int64_t{0};
    row["Loot_2"] = int64_t{4};
    assert(tabula::reconstruct_array(row, *loot).size() == 1);

    std::cout << "  Array fields test passed!" << std::endl;
}

// ============================================================================
// Test: Row conversion
// ============================================================================

void test_row_converter() {
    std::cout << "Testing row converter..." << std::endl;

    auto t = tabula::parse_sheet("Events", {
        {"Name", "Opened", "Days", "Days"},
        {"", "", "", ""},
        {"string", "datetime", "array<int>", "array<int>"},
        {"Launch", "2024-01-02 15:04:05", "1", "2"},
        {"Broken", "not-a-date", "3"},
    });

    tabula::row_converter converter(t);
    auto names = tabula::column_names(t);
    assert((names == std::vector<std::string>{"Days", "Days_0", "Days_1", "Name", "Opened"}));

    auto first = converter.convert(t.rows[0]);
    assert(first.size() == names.size());
    assert(std::get<std::string>(first[0]) == "[1,2]");
    assert(std::get<int64_t>(first[1]) == 1);
    assert(std::get<int64_t>(first[2]) == 2);
    assert(std::get<std::string>(first[3]) == "Launch");
    assert(std::get<std::string>(first[4]) == "2024-01-02 15:04:05");
    assert(converter.error_count() == 0);

    // Unparsable date becomes NULL, missing cells become NULL
    auto second = converter.convert(t.rows[1]);
    assert(std::get<std::string>(second[0]) == "[3]");
    assert(std::holds_alternative<std::nullptr_t>(second[2]));
    assert(std::holds_alternative<std::nullptr_t>(second[4]));
    assert(converter.error_count() == 1);

    std::cout << "  Row converter test passed!" << std::endl;
}

// ============================================================================
// Test: Generated models
// ============================================================================

void test_codegen() {
    std::cout << "Testing model generation..." << std::endl;

    auto t = tabula::parse_sheet("hero stats", {
        {"Name", "Skills", "Skills", "Max Hp"},
        {"unique", "", "", "default:100"},
        {"string", "array<string>", "array<string>", "int"},
        {"Alice", "fire", "ice", "120"},
    });
    assert(t.name == "HeroStats");

    auto fields = tabula::model_fields(t);
    assert(fields.size() == t.columns.size());
    for (size_t i = 0; i < fields.size(); ++i) {
        assert(fields[i].name == t.columns[i].name);
    }

    auto arrays = tabula::array_fields(t);
    assert(arrays.size() == 1);
    assert(arrays[0].name == "Skills");
    assert(arrays[0].array_size == 2);
    assert(arrays[0].cpp_type == "std::vector<std::string>");
    assert(arrays[0].tag_string == "type:text");

    assert(tabula::cpp_identifier("Max-Hp") == "Max_Hp");
    assert(tabula::cpp_identifier("2x") == "_2x");

    auto header = tabula::model_header(t, "game");
    assert(header.find("namespace game {") != std::string::npos);
    assert(header.find("struct HeroStats {") != std::string::npos);
    assert(header.find("std::vector<std::string> Skills{};") != std::string::npos);
    assert(header.find("std::string Skills_1{};") != std::string::npos);
    assert(header.find("int32_t MaxHp{};") != std::string::npos);
    assert(header.find("static constexpr std::size_t Skills_slots = 2;") != std::string::npos);
    assert(header.find("void pack_Skills()") != std::string::npos);
    assert(header.find("void unpack_Skills()") != std::string::npos);
    assert(header.find("{\"Name\", \"TEXT\", \"unique\"}") != std::string::npos);

    assert(header.find("static constexpr std::size_t field_count = 5;") != std::string::npos);

    auto sql = tabula::model_sql(t);
    assert(sql.find("CREATE TABLE IF NOT EXISTS HeroStats") != std::string::npos);
    assert(sql.find("MaxHp INTEGER DEFAULT 100") != std::string::npos);

    // Date slots use a sentinel so the epoch survives unpacking
    auto events = tabula::parse_sheet("Events", {
        {"When", "When"},
        {"", ""},
        {"array<datetime>", "array<datetime>"},
        {"1970-01-01", "2024-01-02"},
    });
    auto events_header = tabula::model_header(events, "game");
    assert(events_header.find("if (When_0 == std::chrono::system_clock::time_point::min()) return;") !=
           std::string::npos);

    // A sheet of design-only columns has no field table
    auto notes = tabula::parse_sheet("Notes", {{"Memo"}, {"design"}, {"string"}, {"hello"}});
    assert(notes.columns.empty());
    auto notes_header = tabula::model_header(notes, "game");
    assert(notes_header.find("static constexpr std::size_t field_count = 0;") != std::string::npos);
    assert(notes_header.find("fields[]") == std::string::npos);
    assert(notes_header.find("struct Notes {") != std::string::npos);

    std::cout << "  Model generation test passed!" << std::endl;
}

int main() {
    std::cout << "=== TabulaCore Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        // Schema tests
        test_column_types();
        test_names_and_tags();
        test_column_builder();

        // Value tests
        test_value_parsers();
        test_timestamps();
        test_arrays();
        test_row_converter();

        // Output tests
        test_codegen();

        sql_tests::run_all();
        workbook_tests::run_all();
        export_tests::run_all();

        std::cout << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << "All tests passed!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
