#pragma once

#include "lexrisk/expression/value.h"

#include <string>
#include <string_view>

namespace lexrisk::expression {

// Rendered in place of a placeholder whose variable is absent or null.
constexpr const char* kUnavailablePlaceholder = "[unavailable]";

// render_template replaces every "{name}" with the display form of variables[name].
// The name is trimmed of ASCII whitespace before lookup. A '{' without a closing '}' is copied
// literally. Pure function of its inputs; never throws for any template content.
[[nodiscard]] std::string render_template(std::string_view text,
                                          const VariableEnvironment& variables);

}  // namespace lexrisk::expression
