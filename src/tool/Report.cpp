#include "optkit/tool/Report.hpp"

#include <sstream>

#include "optkit/option/Sequence.hpp"

namespace optkit {

AppendSuffix::AppendSuffix(const std::string& suffix) : m_suffix(suffix) {}

std::string AppendSuffix::operator()(long value) const {
  std::ostringstream oss;
  oss << value << m_suffix;
  return oss.str();
}

Report BuildReport(const std::vector<Option<long> >& options,
                   const ToolConfig& config) {
  Report report;
  for (size_t i = 0; i < options.size(); ++i) {
    if (options[i].IsPresent()) {
      ++report.present;
    } else {
      ++report.absent;
      report.absentLines.push_back(i + 1);
    }
  }
  report.values = Compact(options);
  report.decorated = MapPresent(AppendSuffix(config.suffix), options);
  return report;
}

void PrintReport(std::ostream& os, const Report& report) {
  os << "values:";
  for (size_t i = 0; i < report.values.size(); ++i) os << " " << report.values[i];
  os << "\n";
  os << "mapped:";
  for (size_t i = 0; i < report.decorated.size(); ++i)
    os << " " << report.decorated[i];
  os << "\n";
  os << "present=" << report.present << " absent=" << report.absent << "\n";
}

}  // namespace optkit
