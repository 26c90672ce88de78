#pragma once

// TabulaCore - spreadsheet schemas to SQLite databases and C++ models
//
// Usage:
//   #include <TabulaCore.hpp>
//
//   int main() {
//       tabula::run_report report;
//
//       tabula::generator gen;                 // CSV workbooks, one worker per core
//       gen.run({"data/items", "data/skills.csv"}, report);
//
//       auto registry = tabula::make_default_registry();
//       tabula::options opts;
//       opts.output_dir = "out";
//       registry.export_with("sqlite", gen.tables(), opts, report);
//
//       return report.has_errors() ? 1 : 0;
//   }

#include "tabula/log.hpp"
#include "tabula/errors.hpp"
#include "tabula/types.hpp"
#include "tabula/tags.hpp"
#include "tabula/schema.hpp"
#include "tabula/column_builder.hpp"
#include "tabula/value_parser.hpp"
#include "tabula/array_codec.hpp"
#include "tabula/sql.hpp"
#include "tabula/db.hpp"
#include "tabula/workbook.hpp"
#include "tabula/sheet_parser.hpp"
#include "tabula/row_converter.hpp"
#include "tabula/codegen.hpp"
#include "tabula/options.hpp"
#include "tabula/report.hpp"
#include "tabula/exporter.hpp"
#include "tabula/generator.hpp"
