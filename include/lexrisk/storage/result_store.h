#pragma once

#include "lexrisk/core/result.h"
#include "lexrisk/engine/rule_engine_result.h"
#include "lexrisk/storage/evaluation_key.h"

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace lexrisk::storage {

// IResultStore persists RuleEngineResults for replay, keyed by EvaluationKey.
// put() overwrites an existing entry for the same key. Failures are returned, never thrown.
class IResultStore {
 public:
  virtual ~IResultStore() = default;

  [[nodiscard]] virtual core::Result<bool, std::string> put(
      const EvaluationKey& key, const engine::RuleEngineResult& result) = 0;

  // Ok(nullopt) when the key is unknown.
  [[nodiscard]] virtual core::Result<std::optional<engine::RuleEngineResult>, std::string> get(
      const EvaluationKey& key) const = 0;

  [[nodiscard]] virtual core::Result<std::size_t, std::string> count() const = 0;

 protected:
  IResultStore() = default;
  IResultStore(const IResultStore&) = default;
  IResultStore& operator=(const IResultStore&) = default;
  IResultStore(IResultStore&&) = default;
  IResultStore& operator=(IResultStore&&) = default;
};

// In-memory implementation. Ephemeral; used by tests and by the CLI when no --db is given.
class InMemoryResultStore final : public IResultStore {
 public:
  [[nodiscard]] core::Result<bool, std::string> put(
      const EvaluationKey& key, const engine::RuleEngineResult& result) override;

  [[nodiscard]] core::Result<std::optional<engine::RuleEngineResult>, std::string> get(
      const EvaluationKey& key) const override;

  [[nodiscard]] core::Result<std::size_t, std::string> count() const override;

 private:
  std::map<std::string, engine::RuleEngineResult> results_;  // by EvaluationKey::digest()
};

}  // namespace lexrisk::storage
