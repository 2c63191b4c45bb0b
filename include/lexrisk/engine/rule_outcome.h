#pragma once

#include "lexrisk/engine/legal_risk.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lexrisk::engine {

// Tagged result of evaluating one rule. Per-rule failures are values, not exceptions, so one bad
// rule never unwinds the batch.

// Some trigger.variables_required are absent from the case.
struct NotEvaluable {
  std::vector<std::string> missing_variables;  // NOLINT(readability-identifier-naming)
};

// Trigger evaluated to false or null.
struct Discarded {
  std::optional<bool> trigger_result;  // nullopt when the condition evaluated to null
};

struct Triggered {
  LegalRisk risk;  // NOLINT(readability-identifier-naming)
};

// An exception escaped the rule's evaluation.
struct Errored {
  std::string error;  // NOLINT(readability-identifier-naming)
};

using RuleOutcome = std::variant<NotEvaluable, Discarded, Triggered, Errored>;

}  // namespace lexrisk::engine
