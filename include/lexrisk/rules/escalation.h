#pragma once

#include "lexrisk/expression/evaluator.h"
#include "lexrisk/rules/levels.h"
#include "lexrisk/rules/rule.h"

namespace lexrisk::rules {

// Escalation ladders. Levels are tried from the highest down; the first level whose expression
// evaluates to exactly true wins. A null or failed evaluation never matches. When no level
// matches the result is kIndeterminate.
//
// Simultaneous matches resolve to the highest matching level (first match, top-down).

[[nodiscard]] Severity resolve_severity(const SeverityLogic& logic,
                                        const expression::ExpressionEvaluator& evaluator);

[[nodiscard]] Confidence resolve_confidence(const ConfidenceLogic& logic,
                                            const expression::ExpressionEvaluator& evaluator);

}  // namespace lexrisk::rules
