#include "internal/backup/sql_dump.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"

namespace {

using sqlvault::backup::BackupKind;
using sqlvault::backup::ExtractDumpBody;
using sqlvault::backup::QuoteIdentifier;
using sqlvault::backup::QuoteLiteral;
using sqlvault::backup::RenderValue;
using sqlvault::backup::SqlDumper;
using sqlvault::db::sqlite::SqliteDB;

size_t CountOccurrences(const std::string& haystack, const std::string& needle) {
  size_t count = 0;
  for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + needle.size())) {
    ++count;
  }
  return count;
}

std::shared_ptr<SqliteDB> MakeSampleDb() {
  auto db = std::make_shared<SqliteDB>(":memory:");
  db->Exec(R"(
    CREATE TABLE venues (id INTEGER PRIMARY KEY, name TEXT NOT NULL, rating REAL, logo BLOB);
    CREATE TABLE "odd ""name""" (v TEXT);
    CREATE TABLE error_logs (id INTEGER PRIMARY KEY, message TEXT);
    CREATE INDEX idx_venues_name ON venues(name);
    CREATE INDEX idx_error_logs_message ON error_logs(message);
    CREATE TRIGGER venues_touch AFTER UPDATE ON venues BEGIN SELECT 1; END;

    INSERT INTO venues VALUES (1, 'Bar O''Neil', 4.5, X'CAFE');
    INSERT INTO venues VALUES (2, 'Club', NULL, NULL);
    INSERT INTO venues VALUES (3, 'Line
break', 3.0, X'');
    INSERT INTO "odd ""name""" VALUES ('x');
    INSERT INTO error_logs VALUES (1, 'boom');
  )");
  return db;
}

void TestQuoting() {
  assert(QuoteIdentifier("users") == "\"users\"");
  assert(QuoteIdentifier("a\"b") == "\"a\"\"b\"");
  assert(QuoteLiteral("it's") == "'it''s'");
  assert(QuoteLiteral("") == "''");
}

void TestRenderValueByStorageClass() {
  SqliteDB db(":memory:");
  auto     stmt = db.Prepare("SELECT NULL, 42, -7, 3.0, 0.1, 'it''s', X'00FF', 1e999, -1e999, 1.5e300;");
  assert(sqlite3_step(stmt.get()) == SQLITE_ROW);

  assert(RenderValue(stmt.get(), 0) == "NULL");
  assert(RenderValue(stmt.get(), 1) == "42");
  assert(RenderValue(stmt.get(), 2) == "-7");
  assert(RenderValue(stmt.get(), 3) == "3.0");
  assert(RenderValue(stmt.get(), 4) == "0.1");
  assert(RenderValue(stmt.get(), 5) == "'it''s'");
  assert(RenderValue(stmt.get(), 6) == "X'00FF'");
  assert(RenderValue(stmt.get(), 7) == "9.0e999");
  assert(RenderValue(stmt.get(), 8) == "-9.0e999");
  assert(RenderValue(stmt.get(), 9) == "1.5e+300");
}

void TestFullDumpLayout() {
  auto db = MakeSampleDb();

  SqlDumper dumper(db, {"error_logs"}, 100);
  auto      out = dumper.Dump(BackupKind::kFull, "2026-10-19T03:00:00.000Z");

  // ordered by name, exclusions skipped
  assert(out.tables.size() == 2);
  assert(out.tables[0] == "odd \"name\"");
  assert(out.tables[1] == "venues");
  assert(out.record_count == 4);

  const auto& sql = out.sql;
  assert(sql.rfind("-- SQLVault Database Backup\n", 0) == 0);
  assert(sql.find("-- Type: full\n") != std::string::npos);
  assert(sql.find("-- Created: 2026-10-19T03:00:00.000Z\n") != std::string::npos);
  assert(sql.find("-- Tables: 2\n") != std::string::npos);
  assert(sql.find("-- Records: 4\n") != std::string::npos);
  assert(sql.find("PRAGMA foreign_keys=OFF;\nBEGIN TRANSACTION;\n") != std::string::npos);
  const std::string footer = "\nCOMMIT;\nPRAGMA foreign_keys=ON;";
  assert(sql.size() > footer.size() && sql.compare(sql.size() - footer.size(), footer.size(), footer) == 0);

  assert(sql.find("DROP TABLE IF EXISTS \"venues\";") != std::string::npos);
  assert(sql.find("DROP TABLE IF EXISTS \"odd \"\"name\"\"\";") != std::string::npos);
  assert(sql.find("'Bar O''Neil'") != std::string::npos);
  assert(sql.find("X'CAFE'") != std::string::npos);
  assert(sql.find("'Line\nbreak'") != std::string::npos);

  assert(sql.find("error_logs") == std::string::npos);
  assert(sql.find("CREATE INDEX idx_venues_name ON venues(name);") != std::string::npos);
  assert(sql.find("CREATE TRIGGER venues_touch") != std::string::npos);

  // schema objects follow all table data
  assert(sql.find("-- Indexes") > sql.find("INSERT INTO \"venues\""));
}

void TestSchemaDumpHasNoRows() {
  auto db = MakeSampleDb();

  SqlDumper dumper(db, {"error_logs"});
  auto      out = dumper.Dump(BackupKind::kSchema, "2026-10-19T03:00:00.000Z");

  assert(out.record_count == 0);
  assert(out.tables.size() == 2);
  assert(out.sql.find("INSERT INTO") == std::string::npos);
  assert(out.sql.find("-- Type: schema\n") != std::string::npos);
  assert(out.sql.find("CREATE TABLE venues") != std::string::npos);
}

void TestRowsAreBatched() {
  auto db = std::make_shared<SqliteDB>(":memory:");
  db->Exec("CREATE TABLE t (id INTEGER PRIMARY KEY);");
  for (int i = 0; i < 5; ++i) {
    db->Exec("INSERT INTO t VALUES (" + std::to_string(i) + ");");
  }

  SqlDumper dumper(db, {}, 2);
  auto      out = dumper.Dump(BackupKind::kFull, "2026-10-19T03:00:00.000Z");

  assert(out.record_count == 5);
  assert(CountOccurrences(out.sql, "INSERT INTO \"t\"") == 3);
}

void TestGeneratedColumnsAreSkipped() {
  auto db = std::make_shared<SqliteDB>(":memory:");
  db->Exec("CREATE TABLE g (a INTEGER, b INTEGER GENERATED ALWAYS AS (a * 2) VIRTUAL);");
  db->Exec("INSERT INTO g (a) VALUES (21);");

  SqlDumper dumper(db, {});
  auto      out = dumper.Dump(BackupKind::kFull, "2026-10-19T03:00:00.000Z");

  assert(out.sql.find("INSERT INTO \"g\" (\"a\") VALUES") != std::string::npos);
}

void TestOnlyInternalSqliteTablesAreExcluded() {
  auto db = std::make_shared<SqliteDB>(":memory:");
  db->Exec(R"(
    CREATE TABLE sqliteXstats (v INTEGER);
    CREATE TABLE SQLiteUsers (name TEXT);
    CREATE INDEX idx_sqlite_users_name ON SQLiteUsers(name);
    CREATE TABLE counter (id INTEGER PRIMARY KEY AUTOINCREMENT, v INTEGER);
    INSERT INTO sqliteXstats VALUES (1);
    INSERT INTO SQLiteUsers VALUES ('ada');
    INSERT INTO counter (v) VALUES (7);
  )");

  SqlDumper dumper(db, {});
  auto      out = dumper.Dump(BackupKind::kFull, "2026-10-19T03:00:00.000Z");

  const auto has_table = [&](const std::string& name) { return std::find(out.tables.begin(), out.tables.end(), name) != out.tables.end(); };
  assert(has_table("sqliteXstats"));
  assert(has_table("SQLiteUsers"));
  assert(has_table("counter"));
  assert(!has_table("sqlite_sequence"));
  assert(out.tables.size() == 3);
  assert(out.record_count == 3);
  assert(out.sql.find("idx_sqlite_users_name") != std::string::npos);

  SqliteDB target(":memory:");
  target.Exec(out.sql);
  assert(target.QueryInt64("SELECT COUNT(*) FROM sqliteXstats;") == 1);
  assert(target.QueryInt64("SELECT COUNT(*) FROM SQLiteUsers;") == 1);
}

void TestDumpReplaysIntoFreshDatabase() {
  auto source = MakeSampleDb();

  SqlDumper dumper(source, {"error_logs"});
  auto      out = dumper.Dump(BackupKind::kFull, "2026-10-19T03:00:00.000Z");

  SqliteDB target(":memory:");
  target.Exec(out.sql);

  assert(target.QueryInt64("SELECT COUNT(*) FROM venues;") == 3);
  assert(target.QueryInt64("SELECT COUNT(*) FROM \"odd \"\"name\"\"\";") == 1);
  assert(target.QueryInt64("SELECT typeof(rating) = 'real' FROM venues WHERE id = 3;") == 1);
  assert(target.QueryInt64("SELECT logo = X'CAFE' FROM venues WHERE id = 1;") == 1);
  assert(target.QueryInt64("SELECT COUNT(*) FROM sqlite_master WHERE name = 'idx_venues_name';") == 1);
}

void TestExtractDumpBody() {
  const std::string script = "-- header\nPRAGMA foreign_keys=OFF;\nBEGIN TRANSACTION;\nCREATE TABLE t (x);\n\nCOMMIT;\nPRAGMA foreign_keys=ON;";

  auto body = ExtractDumpBody(script);
  assert(body);
  assert(*body == "CREATE TABLE t (x);\n\n");

  assert(!ExtractDumpBody("CREATE TABLE t (x);"));
  assert(!ExtractDumpBody("-- x\nBEGIN TRANSACTION;\nCREATE TABLE t (x);"));
}

} // namespace

int main() {
  TestQuoting();
  TestRenderValueByStorageClass();
  TestFullDumpLayout();
  TestSchemaDumpHasNoRows();
  TestRowsAreBatched();
  TestGeneratedColumnsAreSkipped();
  TestOnlyInternalSqliteTablesAreExcluded();
  TestDumpReplaysIntoFreshDatabase();
  TestExtractDumpBody();

  std::cout << "sqlvault_unit_sql_dump: pass\n";
  return 0;
}
