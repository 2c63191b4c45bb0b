#include "lexrisk/rules/escalation.h"

#include <array>
#include <optional>
#include <string>
#include <utility>

namespace lexrisk::rules {

namespace {

bool matches(const std::optional<std::string>& condition,
             const expression::ExpressionEvaluator& evaluator) {
  if (!condition.has_value()) {
    return false;
  }
  return evaluator.evaluate(*condition) == true;
}

}  // namespace

Severity resolve_severity(const SeverityLogic& logic,
                          const expression::ExpressionEvaluator& evaluator) {
  const std::array<std::pair<Severity, const std::optional<std::string>*>, 4> ladder{{
      {Severity::kCritical, &logic.critical},
      {Severity::kHigh, &logic.high},
      {Severity::kMedium, &logic.medium},
      {Severity::kLow, &logic.low},
  }};
  for (const auto& [level, condition] : ladder) {
    if (matches(*condition, evaluator)) {
      return level;
    }
  }
  return Severity::kIndeterminate;
}

Confidence resolve_confidence(const ConfidenceLogic& logic,
                              const expression::ExpressionEvaluator& evaluator) {
  const std::array<std::pair<Confidence, const std::optional<std::string>*>, 4> ladder{{
      {Confidence::kHigh, &logic.high},
      {Confidence::kMedium, &logic.medium},
      {Confidence::kLow, &logic.low},
      {Confidence::kIndeterminate, &logic.indeterminate},
  }};
  for (const auto& [level, condition] : ladder) {
    if (matches(*condition, evaluator)) {
      return level;
    }
  }
  return Confidence::kIndeterminate;
}

}  // namespace lexrisk::rules
