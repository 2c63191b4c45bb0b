#pragma once

#include "lexrisk/storage/result_store.h"
#include "lexrisk/storage/sqlite/sqlite_db.h"

#include <memory>

namespace lexrisk::storage::sqlite {

// SqliteResultStore persists results in the engine_results table (schema v1).
// The full result is stored as JSON together with its deterministic hash; get() recomputes the
// hash of the decoded result and reports a mismatch as an error instead of replaying it.
class SqliteResultStore final : public IResultStore {
 public:
  // db must have schema v1 applied.
  explicit SqliteResultStore(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::Result<bool, std::string> put(
      const EvaluationKey& key, const engine::RuleEngineResult& result) override;

  [[nodiscard]] core::Result<std::optional<engine::RuleEngineResult>, std::string> get(
      const EvaluationKey& key) const override;

  [[nodiscard]] core::Result<std::size_t, std::string> count() const override;

 private:
  std::shared_ptr<SqliteDb> db_;
};

}  // namespace lexrisk::storage::sqlite
