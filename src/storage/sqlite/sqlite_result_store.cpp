#include "lexrisk/storage/sqlite/sqlite_result_store.h"

#include <nlohmann/json.hpp>

#include <sqlite3.h>

#include <exception>
#include <utility>

namespace lexrisk::storage::sqlite {

SqliteResultStore::SqliteResultStore(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

core::Result<bool, std::string> SqliteResultStore::put(const EvaluationKey& key,
                                                       const engine::RuleEngineResult& result) {
  using R = core::Result<bool, std::string>;
  const char* sql = R"(
    INSERT INTO engine_results
      (evaluation_key, case_id, rulebook_version, case_variables_hash, legal_context_hash,
       engine_version, result_hash, result_json, evaluated_at)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(evaluation_key) DO UPDATE SET
      engine_version = excluded.engine_version,
      result_hash    = excluded.result_hash,
      result_json    = excluded.result_json,
      evaluated_at   = excluded.evaluated_at
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return R::err("Failed to prepare insert: " + stmt.error());
  }

  const std::string result_json = engine::rule_engine_result_to_json(result).dump();
  const std::string result_hash = engine::deterministic_hash(result);
  const std::string digest = key.digest();

  const bool bound = stmt.bind_text(1, digest) && stmt.bind_text(2, key.case_id) &&
                     stmt.bind_text(3, key.rulebook_version) &&
                     stmt.bind_text(4, key.case_variables_hash) &&
                     stmt.bind_text(5, key.legal_context_hash) &&
                     stmt.bind_text(6, result.engine_version) &&
                     stmt.bind_text(7, result_hash) && stmt.bind_text(8, result_json) &&
                     stmt.bind_text(9, result.evaluated_at);
  if (!bound) {
    return R::err(std::string("Failed to bind result: ") + sqlite3_errmsg(db_->connection()));
  }

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return R::err(std::string("Failed to store result: ") + sqlite3_errmsg(db_->connection()));
  }
  return R::ok(true);
}

core::Result<std::optional<engine::RuleEngineResult>, std::string> SqliteResultStore::get(
    const EvaluationKey& key) const {
  using R = core::Result<std::optional<engine::RuleEngineResult>, std::string>;
  PreparedStatement stmt(db_->connection(),
                         "SELECT result_json, result_hash FROM engine_results "
                         "WHERE evaluation_key = ?");
  if (!stmt.is_valid()) {
    return R::err("Failed to prepare select: " + stmt.error());
  }
  if (!stmt.bind_text(1, key.digest())) {
    return R::err(std::string("Failed to bind key: ") + sqlite3_errmsg(db_->connection()));
  }

  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) {
    return R::ok(std::nullopt);
  }
  if (rc != SQLITE_ROW) {
    return R::err(std::string("Failed to read result: ") + sqlite3_errmsg(db_->connection()));
  }

  const std::string stored_hash = stmt.column_text(1);
  engine::RuleEngineResult result;
  try {
    result = engine::rule_engine_result_from_json(nlohmann::json::parse(stmt.column_text(0)));
  } catch (const std::exception& e) {
    return R::err(std::string("Stored result is unreadable: ") + e.what());
  }

  const std::string actual_hash = engine::deterministic_hash(result);
  if (actual_hash != stored_hash) {
    return R::err("Stored result hash mismatch for case '" + key.case_id + "': expected " +
                  stored_hash + ", decoded " + actual_hash);
  }
  return R::ok(std::move(result));
}

core::Result<std::size_t, std::string> SqliteResultStore::count() const {
  using R = core::Result<std::size_t, std::string>;
  PreparedStatement stmt(db_->connection(), "SELECT COUNT(*) FROM engine_results");
  if (!stmt.is_valid()) {
    return R::err("Failed to prepare count: " + stmt.error());
  }
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return R::err(std::string("Failed to count results: ") + sqlite3_errmsg(db_->connection()));
  }
  return R::ok(static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0)));
}

}  // namespace lexrisk::storage::sqlite
