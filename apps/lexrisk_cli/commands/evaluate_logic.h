#pragma once

#include "lexrisk/core/clock.h"
#include "lexrisk/expression/value.h"
#include "lexrisk/rules/rule.h"
#include "lexrisk/storage/result_store.h"

#include <ostream>
#include <string>

struct EvaluateInput {
  std::string case_id;                            // NOLINT(readability-identifier-naming)
  lexrisk::expression::VariableEnvironment variables;  // NOLINT(readability-identifier-naming)
  std::string legal_context;                      // NOLINT(readability-identifier-naming)
};

// Exit codes of execute_evaluate.
constexpr int kEvaluateOk = 0;
constexpr int kEvaluateStoreError = 1;
constexpr int kEvaluateReplayMismatch = 2;

// execute_evaluate runs one case through the engine and writes the JSON report to `out`:
//   {analysis, evaluation_key, replayed, result, result_hash}
// With a store, a previously stored result for the same evaluation key is replayed after
// checking that the fresh evaluation hashes identically; otherwise the fresh result is stored.
// Takes only interface types so it can run against any IResultStore.
int execute_evaluate(const lexrisk::rules::Rulebook& rulebook, const EvaluateInput& input,
                     lexrisk::storage::IResultStore* store, const lexrisk::core::IClock& clock,
                     std::ostream& out);
