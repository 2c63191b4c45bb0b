#pragma once

namespace lexrisk::core {

// kEngineVersion identifies the evaluation semantics. It is part of every canonical result
// hash, so it must change whenever a rule could evaluate differently for the same input.
constexpr const char* kEngineVersion = "2.0.0";

// kBuildVersion is the software release string printed by the CLI.
constexpr const char* kBuildVersion = "0.3";

}  // namespace lexrisk::core
