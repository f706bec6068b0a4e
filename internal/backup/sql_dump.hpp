#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "internal/backup/backup_types.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace sqlvault::backup {

inline constexpr std::string_view kBeginMarker  = "BEGIN TRANSACTION;";
inline constexpr std::string_view kCommitMarker = "COMMIT;";

// "na""me" style identifier quoting.
std::string QuoteIdentifier(std::string_view name);

// 'it''s' style string literal.
std::string QuoteLiteral(std::string_view text);

// SQL literal for column `col` of the current row, chosen by its storage class.
std::string RenderValue(sqlite3_stmt* stmt, int col);

struct DumpOutput {
  std::string              sql;
  std::vector<std::string> tables;
  uint64_t                 record_count = 0;
};

/*
  Serializes a live SQLite database into a replayable SQL script:

    header comments
    PRAGMA foreign_keys=OFF; BEGIN TRANSACTION;
    per table: DROP TABLE IF EXISTS + original CREATE, batched INSERTs (full only)
    indexes and triggers of the dumped tables
    COMMIT; PRAGMA foreign_keys=ON;

  Only SELECT-class statements are issued against the database.
*/
class SqlDumper {
 public:
  SqlDumper(std::shared_ptr<db::sqlite::SqliteDB> db, std::unordered_set<std::string> exclude_tables, uint32_t batch_size = 100);

  DumpOutput Dump(BackupKind kind, const std::string& created_at) const;

 private:
  struct TableDef {
    std::string name;
    std::string sql;
  };

  std::vector<TableDef>    ListTables() const;
  std::vector<std::string> ListColumns(const std::string& table) const;
  std::vector<std::string> ListSchemaObjects(const char* type, const std::unordered_set<std::string>& tables) const;

  uint64_t DumpRows(const std::string& table, std::vector<std::string>& out) const;

  std::shared_ptr<db::sqlite::SqliteDB> db_;
  std::unordered_set<std::string>       exclude_tables_;
  uint32_t                              batch_size_;
};

// Script text between the header's BEGIN TRANSACTION and the footer's COMMIT.
std::optional<std::string> ExtractDumpBody(std::string_view script);

} // namespace sqlvault::backup
