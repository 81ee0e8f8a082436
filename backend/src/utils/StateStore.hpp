#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <sqlite3.h>

namespace tf::storage {

struct DispatchRecord {
  std::string run_id;
  std::uint64_t unit_id = 0;
  std::vector<std::string> names;
  std::uint64_t bytes = 0;
  std::int64_t dispatched_at = 0;
  std::optional<std::int64_t> confirmed_at;
};

class Database {
public:
  explicit Database(std::filesystem::path path);
  ~Database();

  Database(Database const &) = delete;
  Database &operator=(Database const &) = delete;

  bool is_valid() const noexcept { return db_ != nullptr; }

  bool insert_dispatch(DispatchRecord const &record) const;
  // False if no such unit exists or it was already confirmed.
  bool mark_confirmed(std::string const &run_id, std::uint64_t unit_id,
                      std::int64_t confirmed_at) const;
  std::optional<DispatchRecord> find_dispatch(std::string const &run_id,
                                              std::uint64_t unit_id) const;
  // Oldest first. An empty run_id matches every run.
  std::vector<DispatchRecord> unconfirmed(std::string const &run_id) const;
  bool delete_confirmed_before(std::int64_t timestamp) const;
  std::optional<std::int64_t> count_dispatches() const;

private:
  bool ensure_schema();
  void close();
  bool execute(std::string const &sql) const;
  std::optional<int> schema_version() const;
  bool apply_migration_v1() const;
  sqlite3_stmt *prepare_cached(std::string const &sql) const;

  std::filesystem::path path_;
  sqlite3 *db_ = nullptr;
  mutable std::unordered_map<std::string, sqlite3_stmt *> stmt_cache_;
};

} // namespace tf::storage
