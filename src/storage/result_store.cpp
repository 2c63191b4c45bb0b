#include "lexrisk/storage/result_store.h"

namespace lexrisk::storage {

core::Result<bool, std::string> InMemoryResultStore::put(const EvaluationKey& key,
                                                         const engine::RuleEngineResult& result) {
  results_[key.digest()] = result;
  return core::Result<bool, std::string>::ok(true);
}

core::Result<std::optional<engine::RuleEngineResult>, std::string> InMemoryResultStore::get(
    const EvaluationKey& key) const {
  using R = core::Result<std::optional<engine::RuleEngineResult>, std::string>;
  const auto it = results_.find(key.digest());
  if (it == results_.end()) {
    return R::ok(std::nullopt);
  }
  return R::ok(it->second);
}

core::Result<std::size_t, std::string> InMemoryResultStore::count() const {
  return core::Result<std::size_t, std::string>::ok(results_.size());
}

}  // namespace lexrisk::storage
