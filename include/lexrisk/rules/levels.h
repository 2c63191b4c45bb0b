#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace lexrisk::rules {

// Ordered by rank: a larger enumerator is a more severe finding.
enum class Severity {
  kIndeterminate,
  kLow,
  kMedium,
  kHigh,
  kCritical,
};

// Ordered by rank: a larger enumerator is a more confident finding.
enum class Confidence {
  kIndeterminate,
  kLow,
  kMedium,
  kHigh,
};

enum class EvidenceStatus {
  kSufficient,    // "suficiente"
  kInsufficient,  // "insuficiente"
  kMissing,       // "falta"
};

// Terminal state of one rule in one evaluation.
enum class RuleState {
  kNotEvaluable,
  kDiscarded,
  kTriggered,
  kErrored,
};

// Localized output terms: critica / alta / media / baja / indeterminado.
[[nodiscard]] std::string to_string(Severity severity);
// alta / media / baja / indeterminado.
[[nodiscard]] std::string to_string(Confidence confidence);
// suficiente / insuficiente / falta.
[[nodiscard]] std::string to_string(EvidenceStatus status);
// not_evaluable / discarded / triggered / errored.
[[nodiscard]] std::string to_string(RuleState state);

// Parsers accept exactly the localized terms produced by to_string().
[[nodiscard]] std::optional<Severity> severity_from_string(std::string_view text);
[[nodiscard]] std::optional<Confidence> confidence_from_string(std::string_view text);
[[nodiscard]] std::optional<EvidenceStatus> evidence_status_from_string(std::string_view text);
[[nodiscard]] std::optional<RuleState> rule_state_from_string(std::string_view text);

}  // namespace lexrisk::rules
