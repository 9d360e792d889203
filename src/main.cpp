// Entry point: read configuration, parse numbers from the input, print the
// compacted and mapped results.

#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "optkit.h"
#include "optkit/config/Config.hpp"
#include "optkit/config/ConfigParser.hpp"
#include "optkit/option/Error.hpp"
#include "optkit/option/Option.hpp"
#include "optkit/text/NumberParser.hpp"
#include "optkit/tool/Report.hpp"

using optkit::BadOptionAccess;
using optkit::Option;
using optkit::Report;
using optkit::ToolConfig;

static std::string defaultConfigPath() {
  return "conf/optcat.conf";  // relative to working directory
}

static void logAbsentLines(const std::vector<Option<long> > &options,
                           const Report &report) {
  for (size_t i = 0; i < report.absentLines.size(); ++i) {
    size_t line = report.absentLines[i];
    const optkit::Error *cause = options[line - 1].Cause();
    std::cerr << "line " << line << ": ";
    if (cause)
      std::cerr << cause->Name() << ": " << cause->what() << "\n";
    else
      std::cerr << "absent\n";
  }
}

// Extracts the first absent line the unsafe way so the chained cause is
// reported exactly as a caller misusing Get() would see it.
static void reportStrictFailure(const std::vector<Option<long> > &options,
                                const Report &report) {
  size_t line = report.absentLines[0];
  try {
    options[line - 1].Get();
  } catch (const BadOptionAccess &e) {
    std::cerr << "strict: line " << line << ": " << e.what() << "\n";
  }
}

int main(int argc, char **argv) {
  std::string path = defaultConfigPath();
  if (argc > 1) {
    if (std::strcmp(argv[1], "--version") == 0) {
      std::cout << "optcat " << OPTKIT_VERSION_STRING << "\n";
      return 0;
    }
    path = argv[1];
  }

  ToolConfig config;
  optkit::ConfigParser parser;
  if (!parser.ParseFile(path.c_str(), config)) {
    std::cerr << "Failed to parse config: " << path << "\n";
    return 1;
  }

  std::vector<Option<long> > options;
  if (config.input == "-") {
    options = optkit::ParseLines(std::cin, config.base);
  } else {
    std::ifstream in(config.input.c_str());
    if (!in) {
      std::perror(config.input.c_str());
      return 1;
    }
    options = optkit::ParseLines(in, config.base);
  }

  Report report = optkit::BuildReport(options, config);
  if (config.verbose) logAbsentLines(options, report);
  optkit::PrintReport(std::cout, report);

  if (config.strict && report.absent > 0) {
    reportStrictFailure(options, report);
    return 1;
  }
  return 0;
}
