#pragma once

#include <string>
#include <vector>

#include "optkit/config/Config.hpp"

namespace optkit {

class ConfigParser {
 public:
  ConfigParser();
  bool ParseFile(const char *path, ToolConfig &out);
  bool ParseString(const std::string &text, ToolConfig &out);

 private:
  bool parseLine(const std::string &line, ToolConfig &out);
  std::vector<std::string> tokenize(const std::string &line) const;
};

}  // namespace optkit
