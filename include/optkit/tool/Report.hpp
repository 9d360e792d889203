#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "optkit/config/Config.hpp"
#include "optkit/option/Option.hpp"

namespace optkit {

/**
 * Renders a number in decimal followed by a fixed suffix.
 */
class AppendSuffix {
 public:
  typedef std::string result_type;

  explicit AppendSuffix(const std::string& suffix);
  std::string operator()(long value) const;

 private:
  std::string m_suffix;
};

struct Report {
  std::size_t present;
  std::size_t absent;
  std::vector<long> values;              // present values, in input order
  std::vector<std::string> decorated;    // values mapped through AppendSuffix
  std::vector<std::size_t> absentLines;  // 1-based
  Report() : present(0), absent(0) {}
};

Report BuildReport(const std::vector<Option<long> >& options,
                   const ToolConfig& config);

void PrintReport(std::ostream& os, const Report& report);

}  // namespace optkit
