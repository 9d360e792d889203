#include "optkit/config/ConfigParser.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace optkit {

namespace {
bool parseSwitch(const std::string &val, bool &out) {
  if (val == "on" || val == "1" || val == "true") {
    out = true;
    return true;
  }
  if (val == "off" || val == "0" || val == "false") {
    out = false;
    return true;
  }
  return false;
}

bool parseBase(const std::string &val, int &out) {
  char *end = 0;
  long base = std::strtol(val.c_str(), &end, 10);
  if (end == val.c_str() || *end != '\0') return false;
  if (base < 2 || base > 36) return false;
  out = (int)base;
  return true;
}
}  // namespace

ConfigParser::ConfigParser() {}

bool ConfigParser::ParseFile(const char *path, ToolConfig &out) {
  std::ifstream in(path);
  if (!in) {
    std::perror("open config");
    return false;
  }
  std::string s;
  while (std::getline(in, s)) {
    if (!parseLine(s, out)) {
      std::cerr << "Config parse error on line: " << s << "\n";
      return false;
    }
  }
  return true;
}

bool ConfigParser::ParseString(const std::string &text, ToolConfig &out) {
  std::string::size_type start = 0;
  while (start < text.size()) {
    std::string::size_type nl = text.find('\n', start);
    if (nl == std::string::npos) nl = text.size();
    std::string s = text.substr(start, nl - start);
    if (!parseLine(s, out)) {
      std::cerr << "Config parse error on line: " << s << "\n";
      return false;
    }
    start = nl + 1;
  }
  return true;
}

std::vector<std::string> ConfigParser::tokenize(const std::string &line) const {
  std::string::size_type start = 0;
  std::vector<std::string> tokens;
  while (start < line.size()) {
    while (start < line.size() && (line[start] == ' ' || line[start] == '\t' ||
                                   line[start] == '\r' || line[start] == '\n'))
      ++start;
    if (start >= line.size()) break;
    std::string::size_type end = start;
    while (end < line.size() && line[end] != ' ' && line[end] != '\t' &&
           line[end] != '\r' && line[end] != '\n')
      ++end;
    tokens.push_back(line.substr(start, end - start));
    start = end;
  }
  return tokens;
}

bool ConfigParser::parseLine(const std::string &line, ToolConfig &out) {
  std::vector<std::string> tokens = tokenize(line);
  if (tokens.empty() || tokens[0][0] == '#') return true;
  if (tokens[0] == "input") {
    if (tokens.size() < 2) return false;
    out.input = tokens[1];
    return true;
  } else if (tokens[0] == "base") {
    if (tokens.size() < 2) return false;
    return parseBase(tokens[1], out.base);
  } else if (tokens[0] == "suffix") {
    // an empty suffix is spelled by omitting the value
    out.suffix = tokens.size() < 2 ? std::string() : tokens[1];
    return true;
  } else if (tokens[0] == "verbose") {
    if (tokens.size() < 2) return false;
    return parseSwitch(tokens[1], out.verbose);
  } else if (tokens[0] == "strict") {
    if (tokens.size() < 2) return false;
    return parseSwitch(tokens[1], out.strict);
  }
  std::cerr << "Ignoring unknown config directive: " << tokens[0] << "\n";
  return true;
}

}  // namespace optkit
