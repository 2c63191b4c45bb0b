#include "lexrisk/storage/evaluation_key.h"

#include "lexrisk/core/sha256.h"
#include "lexrisk/expression/case_variables.h"
#include "lexrisk/rules/rulebook_loader.h"

#include <initializer_list>

namespace lexrisk::storage {

std::string EvaluationKey::digest() const {
  // Length-prefixed so that no component boundary can be forged by the contents.
  core::Sha256 hasher;
  for (const std::string* part :
       {&case_id, &rulebook_version, &case_variables_hash, &legal_context_hash}) {
    hasher.update(std::to_string(part->size()));
    hasher.update(":");
    hasher.update(*part);
  }
  return hasher.hex_digest();
}

std::string rulebook_fingerprint(const rules::Rulebook& rulebook) {
  if (auto version = rulebook.version()) {
    return *version;
  }
  return "sha256:" + core::sha256_hex(rules::rulebook_to_json(rulebook).dump());
}

std::string legal_context_hash(std::string_view legal_context) {
  return core::sha256_hex(legal_context);
}

EvaluationKey make_evaluation_key(const std::string& case_id, const rules::Rulebook& rulebook,
                                  const expression::VariableEnvironment& variables,
                                  std::string_view legal_context) {
  EvaluationKey key;
  key.case_id = case_id;
  key.rulebook_version = rulebook_fingerprint(rulebook);
  key.case_variables_hash = expression::case_variables_hash(variables);
  key.legal_context_hash = legal_context_hash(legal_context);
  return key;
}

}  // namespace lexrisk::storage
