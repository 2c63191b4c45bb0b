#pragma once

#include "lexrisk/expression/value.h"
#include "lexrisk/rules/rule.h"

#include <string>
#include <string_view>

namespace lexrisk::storage {

// EvaluationKey identifies an evaluation whose result may be replayed: evaluation is a pure
// function of these inputs. case_id is included because it is part of the result content.
struct EvaluationKey {
  std::string case_id;              // NOLINT(readability-identifier-naming)
  std::string rulebook_version;     // metadata.version, or "sha256:<digest>" of the rulebook
  std::string case_variables_hash;  // NOLINT(readability-identifier-naming)
  std::string legal_context_hash;   // NOLINT(readability-identifier-naming)

  // SHA-256 (hex) over the four components; used as the storage primary key.
  [[nodiscard]] std::string digest() const;

  friend bool operator==(const EvaluationKey&, const EvaluationKey&) = default;
};

// rulebook_fingerprint: metadata.version when present, otherwise a content digest so that two
// unversioned rulebooks never share a key.
[[nodiscard]] std::string rulebook_fingerprint(const rules::Rulebook& rulebook);

[[nodiscard]] std::string legal_context_hash(std::string_view legal_context);

[[nodiscard]] EvaluationKey make_evaluation_key(const std::string& case_id,
                                                const rules::Rulebook& rulebook,
                                                const expression::VariableEnvironment& variables,
                                                std::string_view legal_context);

}  // namespace lexrisk::storage
