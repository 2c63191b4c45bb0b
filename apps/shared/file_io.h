#pragma once

#include "lexrisk/core/result.h"

#include <fstream>
#include <sstream>
#include <string>

namespace lexrisk::apps {

// read_text_file returns the whole file, or an error naming the path.
inline core::Result<std::string, std::string> read_text_file(const std::string& path) {
  using R = core::Result<std::string, std::string>;
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return R::err("cannot open " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return R::err("failed reading " + path);
  }
  return R::ok(buffer.str());
}

}  // namespace lexrisk::apps
