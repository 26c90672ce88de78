#include "tabula/codegen.hpp"
#include "tabula/sql.hpp"
#include <cctype>
#include <sstream>

namespace tabula {

namespace {

generated_field make_field(const column& c) {
    generated_field f;
    f.name = c.name;
    f.storage_type = sql_type_string(c.type);
    f.cpp_type = cpp_type_string(c.type);
    f.tag_string = tag_string(c);
    f.array_size = c.array_size;
    return f;
}

std::string string_literal(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            default: out += c; break;
        }
    }
    out += '"';
    return out;
}

// Value an empty array slot holds in generated code
std::string zero_literal(const column_type& element) {
    if (element.kind == column_kind::date_time) {
        return "std::chrono::system_clock::time_point::min()";
    }
    return cpp_type_string(element) + "{}";
}

} // namespace

std::vector<generated_field> model_fields(const table& t) {
    std::vector<generated_field> fields;
    fields.reserve(t.columns.size());
    for (const auto& c : t.columns) {
        fields.push_back(make_field(c));
    }
    return fields;
}

std::vector<generated_field> array_fields(const table& t) {
    std::vector<generated_field> fields;
    for (const auto& c : t.columns) {
        if (c.is_aggregate()) {
            fields.push_back(make_field(c));
        }
    }
    return fields;
}

std::string cpp_identifier(const std::string& name) {
    std::string out;
    for (char c : name) {
        out += (std::isalnum(static_cast<unsigned char>(c)) || c == '_') ? c : '_';
    }
    if (out.empty() || std::isdigit(static_cast<unsigned char>(out[0]))) {
        out.insert(out.begin(), '_');
    }
    return out;
}

std::string model_header(const table& t, const std::string& ns) {
    std::string type_name = cpp_identifier(t.name);
    auto fields = model_fields(t);

    std::ostringstream out;
    out << "// Generated by tabula";
    if (!t.sheet_name.empty()) {
        out << " from sheet " << t.sheet_name;
    }
    out << ". Do not edit.\n";
    out << "#pragma once\n\n";
    out << "#include <chrono>\n";
    out << "#include <cstddef>\n";
    out << "#include <cstdint>\n";
    out << "#include <string>\n";
    out << "#include <vector>\n\n";
    out << "namespace " << cpp_identifier(ns) << " {\n\n";

    out << "struct " << type_name << " {\n";
    out << "    static constexpr const char* table_name = " << string_literal(t.name) << ";\n\n";

    out << "    int64_t id = 0;\n";
    for (const auto& f : fields) {
        out << "    " << f.cpp_type << " " << cpp_identifier(f.name) << "{};\n";
    }
    out << "\n";

    out << "    struct field {\n";
    out << "        const char* name;\n";
    out << "        const char* storage_type;\n";
    out << "        const char* tags;\n";
    out << "    };\n\n";
    out << "    static constexpr std::size_t field_count = " << fields.size() << ";\n";
    if (!fields.empty()) {
        out << "    static constexpr field fields[] = {\n";
        for (const auto& f : fields) {
            out << "        {" << string_literal(f.name) << ", " << string_literal(f.storage_type)
                << ", " << string_literal(f.tag_string) << "},\n";
        }
        out << "    };\n";
    }

    for (const auto& c : t.columns) {
        if (!c.is_aggregate()) continue;

        std::string member = cpp_identifier(c.name);
        std::string zero = zero_literal(c.type.element());

        out << "\n";
        out << "    static constexpr std::size_t " << member << "_slots = " << c.array_size << ";\n\n";

        out << "    void pack_" << member << "() {\n";
        for (size_t i = 0; i < c.array_size; ++i) {
            std::string slot = cpp_identifier(c.name + "_" + std::to_string(i));
            out << "        " << slot << " = " << member << ".size() > " << i << " ? "
                << member << "[" << i << "] : " << zero << ";\n";
        }
        out << "    }\n\n";

        out << "    void unpack_" << member << "() {\n";
        out << "        " << member << ".clear();\n";
        for (size_t i = 0; i < c.array_size; ++i) {
            std::string slot = cpp_identifier(c.name + "_" + std::to_string(i));
            out << "        if (" << slot << " == " << zero << ") return;\n";
            out << "        " << member << ".push_back(" << slot << ");\n";
        }
        out << "    }\n";
    }

    out << "};\n\n";
    out << "} // namespace " << cpp_identifier(ns) << "\n";
    return out.str();
}

std::string model_sql(const table& t) {
    std::string out = create_table_sql(t) + "\n";
    for (const auto& index : create_index_sql(t)) {
        out += index + "\n";
    }
    return out;
}

} // namespace tabula
