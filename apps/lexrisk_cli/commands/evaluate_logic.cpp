#include "evaluate_logic.h"

#include "lexrisk/core/logging.h"
#include "lexrisk/engine/legal_analysis.h"
#include "lexrisk/engine/rule_engine.h"
#include "lexrisk/engine/rule_engine_result.h"
#include "lexrisk/storage/evaluation_key.h"

#include <nlohmann/json.hpp>

#include <iostream>

int execute_evaluate(const lexrisk::rules::Rulebook& rulebook, const EvaluateInput& input,
                     lexrisk::storage::IResultStore* store, const lexrisk::core::IClock& clock,
                     std::ostream& out) {
  namespace engine = lexrisk::engine;

  const engine::RuleEngine rule_engine(rulebook, input.legal_context);
  engine::CaseAnalysis fresh = rule_engine.analyze(input.case_id, input.variables, clock);
  const std::string fresh_hash = engine::deterministic_hash(fresh.result);

  const auto key = lexrisk::storage::make_evaluation_key(input.case_id, rulebook,
                                                         input.variables, input.legal_context);

  engine::RuleEngineResult reported = fresh.result;
  bool replayed = false;

  if (store != nullptr) {
    auto stored = store->get(key);
    if (!stored.has_value()) {
      std::cerr << "Failed to read result store: " << stored.error() << "\n";
      return kEvaluateStoreError;
    }

    if (stored.value().has_value()) {
      const std::string stored_hash = engine::deterministic_hash(*stored.value());
      if (stored_hash != fresh_hash) {
        std::cerr << "Replay mismatch for case " << input.case_id << ": stored " << stored_hash
                  << ", evaluated " << fresh_hash << "\n";
        return kEvaluateReplayMismatch;
      }
      lexrisk::core::log().info("case {}: replaying stored result {}", input.case_id,
                                stored_hash);
      reported = *stored.value();
      replayed = true;
    } else {
      auto put = store->put(key, fresh.result);
      if (!put.has_value()) {
        std::cerr << "Failed to store result: " << put.error() << "\n";
        return kEvaluateStoreError;
      }
    }
  }

  nlohmann::json report;
  report["analysis"] = engine::legal_analysis_to_json(fresh.analysis);
  report["evaluation_key"] = key.digest();
  report["replayed"] = replayed;
  report["result"] = engine::rule_engine_result_to_json(reported);
  report["result_hash"] = fresh_hash;
  out << report.dump(2) << "\n";
  return kEvaluateOk;
}
