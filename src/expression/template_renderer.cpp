#include "lexrisk/expression/template_renderer.h"

#include "lexrisk/core/normalization.h"

namespace lexrisk::expression {

std::string render_template(std::string_view text, const VariableEnvironment& variables) {
  std::string out;
  out.reserve(text.size());

  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t open = text.find('{', pos);
    if (open == std::string_view::npos) {
      out.append(text.substr(pos));
      break;
    }
    const std::size_t close = text.find('}', open + 1);
    if (close == std::string_view::npos) {
      out.append(text.substr(pos));
      break;
    }

    out.append(text.substr(pos, open - pos));
    const std::string name = core::trim(text.substr(open + 1, close - open - 1));
    const auto it = variables.find(name);
    if (it == variables.end() || is_null(it->second)) {
      out.append(kUnavailablePlaceholder);
    } else {
      out.append(to_display_string(it->second));
    }
    pos = close + 1;
  }

  return out;
}

}  // namespace lexrisk::expression
