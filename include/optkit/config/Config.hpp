// optcat configuration (C++98 POD-style)
#pragma once

#include <string>

namespace optkit {

struct ToolConfig {
  std::string input;   // input path, "-" for stdin
  int base;            // radix for number parsing (2..36)
  std::string suffix;  // appended to each value by the map step
  bool verbose;        // log every absent line with its cause
  bool strict;         // fail when any line is absent
  ToolConfig() : input("-"), base(10), suffix("!"), verbose(false), strict(false) {}
};

}  // namespace optkit
