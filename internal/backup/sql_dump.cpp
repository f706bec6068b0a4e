#include "sql_dump.hpp"

#include <charconv>
#include <cmath>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace sqlvault::backup {

namespace {

constexpr const char* kSystemName = "SQLVault";

std::string ColumnText(sqlite3_stmt* stmt, int col) {
  const auto* text = sqlite3_column_text(stmt, col);
  const int   len  = sqlite3_column_bytes(stmt, col);
  return text ? std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(len)) : std::string();
}

std::string RenderReal(double value) {
  if (std::isinf(value)) {
    // sqlite parses out-of-range literals as +/-Inf
    return value > 0 ? "9.0e999" : "-9.0e999";
  }

  char buf[64];
  auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
  if (ec != std::errc()) {
    throw std::runtime_error("failed to render REAL value");
  }

  std::string out(buf, end);
  // keep REAL affinity on replay: 3 must come back as 3.0
  if (out.find_first_of(".eEn") == std::string::npos) {
    out += ".0";
  }
  return out;
}

std::string RenderBlob(sqlite3_stmt* stmt, int col) {
  static constexpr char kHex[] = "0123456789ABCDEF";

  const auto* data = static_cast<const unsigned char*>(sqlite3_column_blob(stmt, col));
  const int   len  = sqlite3_column_bytes(stmt, col);

  std::string out;
  out.reserve(static_cast<size_t>(len) * 2 + 3);
  out += "X'";
  for (int i = 0; i < len; ++i) {
    out.push_back(kHex[(data[i] >> 4) & 0x0F]);
    out.push_back(kHex[data[i] & 0x0F]);
  }
  out += "'";
  return out;
}

std::string Join(const std::vector<std::string>& parts, std::string_view sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i) out += sep;
    out += parts[i];
  }
  return out;
}

} // namespace

std::string QuoteIdentifier(std::string_view name) {
  std::string out;
  out.reserve(name.size() + 2);
  out.push_back('"');
  for (char c : name) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::string QuoteLiteral(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 2);
  out.push_back('\'');
  for (char c : text) {
    if (c == '\'') out.push_back('\'');
    out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

std::string RenderValue(sqlite3_stmt* stmt, int col) {
  switch (sqlite3_column_type(stmt, col)) {
    case SQLITE_NULL:
      return "NULL";
    case SQLITE_INTEGER:
      return std::to_string(sqlite3_column_int64(stmt, col));
    case SQLITE_FLOAT:
      return RenderReal(sqlite3_column_double(stmt, col));
    case SQLITE_BLOB:
      return RenderBlob(stmt, col);
    case SQLITE_TEXT:
    default:
      return QuoteLiteral(ColumnText(stmt, col));
  }
}

SqlDumper::SqlDumper(std::shared_ptr<db::sqlite::SqliteDB> db, std::unordered_set<std::string> exclude_tables, uint32_t batch_size)
    : db_(std::move(db)), exclude_tables_(std::move(exclude_tables)), batch_size_(batch_size == 0 ? 1 : batch_size) {
  if (!db_) {
    throw std::invalid_argument("SqlDumper requires a database");
  }
}

std::vector<SqlDumper::TableDef> SqlDumper::ListTables() const {
  auto stmt = db_->Prepare(
      "SELECT name, sql FROM sqlite_master "
      "WHERE type='table' AND name NOT LIKE 'sqlite\\_%' ESCAPE '\\' "
      "ORDER BY name;");

  std::vector<TableDef> tables;
  int                   rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    TableDef def;
    def.name = ColumnText(stmt.get(), 0);
    def.sql  = ColumnText(stmt.get(), 1);
    if (exclude_tables_.count(def.name)) continue;
    tables.push_back(std::move(def));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("failed to read table catalog: ") + sqlite3_errmsg(db_->Handle()));
  }
  return tables;
}

std::vector<std::string> SqlDumper::ListColumns(const std::string& table) const {
  auto stmt = db_->Prepare("PRAGMA table_xinfo(" + QuoteIdentifier(table) + ");");

  // cid | name | type | notnull | dflt_value | pk | hidden
  std::vector<std::string> columns;
  int                      rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    // generated and hidden columns cannot be inserted into
    if (sqlite3_column_int(stmt.get(), 6) != 0) continue;
    columns.push_back(ColumnText(stmt.get(), 1));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error("failed to read columns of " + table + ": " + sqlite3_errmsg(db_->Handle()));
  }
  return columns;
}

std::vector<std::string> SqlDumper::ListSchemaObjects(const char* type, const std::unordered_set<std::string>& tables) const {
  auto stmt = db_->Prepare(
      "SELECT tbl_name, sql FROM sqlite_master "
      "WHERE type=? AND name NOT LIKE 'sqlite\\_%' ESCAPE '\\' AND sql IS NOT NULL "
      "ORDER BY name;");
  sqlite3_bind_text(stmt.get(), 1, type, -1, SQLITE_STATIC);

  std::vector<std::string> statements;
  int                      rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    // objects of excluded tables already exist on the target and would collide
    if (!tables.count(ColumnText(stmt.get(), 0))) continue;
    statements.push_back(ColumnText(stmt.get(), 1) + ";");
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("failed to read ") + type + " catalog: " + sqlite3_errmsg(db_->Handle()));
  }
  return statements;
}

uint64_t SqlDumper::DumpRows(const std::string& table, std::vector<std::string>& out) const {
  const auto columns = ListColumns(table);
  if (columns.empty()) return 0;

  std::vector<std::string> quoted;
  quoted.reserve(columns.size());
  for (const auto& column : columns) {
    quoted.push_back(QuoteIdentifier(column));
  }
  const auto column_list = Join(quoted, ", ");

  auto stmt = db_->Prepare("SELECT " + column_list + " FROM " + QuoteIdentifier(table) + ";");

  const auto insert_prefix = "INSERT INTO " + QuoteIdentifier(table) + " (" + column_list + ") VALUES";

  uint64_t                 count = 0;
  std::vector<std::string> batch;
  batch.reserve(batch_size_);

  auto flush = [&]() {
    if (batch.empty()) return;
    if (count == batch.size()) {
      out.push_back("-- Data for table: " + table);
    }
    out.push_back(insert_prefix);
    out.push_back("  " + Join(batch, ",\n  ") + ";");
    batch.clear();
  };

  int rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    std::vector<std::string> values;
    values.reserve(columns.size());
    for (int i = 0; i < static_cast<int>(columns.size()); ++i) {
      values.push_back(RenderValue(stmt.get(), i));
    }
    batch.push_back("(" + Join(values, ", ") + ")");
    ++count;
    if (batch.size() >= batch_size_) flush();
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error("failed to read rows of " + table + ": " + sqlite3_errmsg(db_->Handle()));
  }
  flush();

  if (count > 0) out.push_back("");
  return count;
}

DumpOutput SqlDumper::Dump(BackupKind kind, const std::string& created_at) const {
  DumpOutput               output;
  std::vector<std::string> statements;

  const auto tables = ListTables();
  std::unordered_set<std::string> dumped;

  for (const auto& table : tables) {
    output.tables.push_back(table.name);
    dumped.insert(table.name);

    statements.push_back("-- Table: " + table.name);
    statements.push_back("DROP TABLE IF EXISTS " + QuoteIdentifier(table.name) + ";");
    statements.push_back(table.sql + ";");
    statements.push_back("");

    if (kind != BackupKind::kSchema) {
      output.record_count += DumpRows(table.name, statements);
    }
  }

  const auto indexes = ListSchemaObjects("index", dumped);
  if (!indexes.empty()) {
    statements.push_back("-- Indexes");
    statements.insert(statements.end(), indexes.begin(), indexes.end());
    statements.push_back("");
  }

  const auto triggers = ListSchemaObjects("trigger", dumped);
  if (!triggers.empty()) {
    statements.push_back("-- Triggers");
    statements.insert(statements.end(), triggers.begin(), triggers.end());
    statements.push_back("");
  }

  std::vector<std::string> script = {
      std::string("-- ") + kSystemName + " Database Backup",
      "-- Type: " + std::string(ToString(kind)),
      "-- Created: " + created_at,
      "-- Tables: " + std::to_string(output.tables.size()),
      "-- Records: " + std::to_string(output.record_count),
      std::string("-- Generated by ") + kSystemName + " Backup System",
      "",
      "PRAGMA foreign_keys=OFF;",
      std::string(kBeginMarker),
      "",
  };
  script.insert(script.end(), std::make_move_iterator(statements.begin()), std::make_move_iterator(statements.end()));
  script.push_back("");
  script.push_back(std::string(kCommitMarker));
  script.push_back("PRAGMA foreign_keys=ON;");

  output.sql = Join(script, "\n");
  return output;
}

std::optional<std::string> ExtractDumpBody(std::string_view script) {
  const std::string begin_line  = "\n" + std::string(kBeginMarker) + "\n";
  const std::string commit_line = "\n" + std::string(kCommitMarker) + "\n";

  const auto begin = script.find(begin_line);
  if (begin == std::string_view::npos) return std::nullopt;

  const auto commit = script.rfind(commit_line);
  if (commit == std::string_view::npos || commit < begin + begin_line.size() - 1) return std::nullopt;

  const auto body_start = begin + begin_line.size();
  if (commit + 1 < body_start) return std::nullopt;
  return std::string(script.substr(body_start, commit + 1 - body_start));
}

} // namespace sqlvault::backup
