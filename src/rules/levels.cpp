#include "lexrisk/rules/levels.h"

namespace lexrisk::rules {

std::string to_string(Severity severity) {
  switch (severity) {
    case Severity::kCritical:
      return "critica";
    case Severity::kHigh:
      return "alta";
    case Severity::kMedium:
      return "media";
    case Severity::kLow:
      return "baja";
    case Severity::kIndeterminate:
      break;
  }
  return "indeterminado";
}

std::string to_string(Confidence confidence) {
  switch (confidence) {
    case Confidence::kHigh:
      return "alta";
    case Confidence::kMedium:
      return "media";
    case Confidence::kLow:
      return "baja";
    case Confidence::kIndeterminate:
      break;
  }
  return "indeterminado";
}

std::string to_string(EvidenceStatus status) {
  switch (status) {
    case EvidenceStatus::kSufficient:
      return "suficiente";
    case EvidenceStatus::kInsufficient:
      return "insuficiente";
    case EvidenceStatus::kMissing:
      break;
  }
  return "falta";
}

std::string to_string(RuleState state) {
  switch (state) {
    case RuleState::kNotEvaluable:
      return "not_evaluable";
    case RuleState::kDiscarded:
      return "discarded";
    case RuleState::kTriggered:
      return "triggered";
    case RuleState::kErrored:
      break;
  }
  return "errored";
}

std::optional<Severity> severity_from_string(std::string_view text) {
  if (text == "critica") {
    return Severity::kCritical;
  }
  if (text == "alta") {
    return Severity::kHigh;
  }
  if (text == "media") {
    return Severity::kMedium;
  }
  if (text == "baja") {
    return Severity::kLow;
  }
  if (text == "indeterminado") {
    return Severity::kIndeterminate;
  }
  return std::nullopt;
}

std::optional<Confidence> confidence_from_string(std::string_view text) {
  if (text == "alta") {
    return Confidence::kHigh;
  }
  if (text == "media") {
    return Confidence::kMedium;
  }
  if (text == "baja") {
    return Confidence::kLow;
  }
  if (text == "indeterminado") {
    return Confidence::kIndeterminate;
  }
  return std::nullopt;
}

std::optional<EvidenceStatus> evidence_status_from_string(std::string_view text) {
  if (text == "suficiente") {
    return EvidenceStatus::kSufficient;
  }
  if (text == "insuficiente") {
    return EvidenceStatus::kInsufficient;
  }
  if (text == "falta") {
    return EvidenceStatus::kMissing;
  }
  return std::nullopt;
}

std::optional<RuleState> rule_state_from_string(std::string_view text) {
  if (text == "not_evaluable") {
    return RuleState::kNotEvaluable;
  }
  if (text == "discarded") {
    return RuleState::kDiscarded;
  }
  if (text == "triggered") {
    return RuleState::kTriggered;
  }
  if (text == "errored") {
    return RuleState::kErrored;
  }
  return std::nullopt;
}

}  // namespace lexrisk::rules
