#include "optkit/text/NumberParser.hpp"

#include <cerrno>
#include <cstdlib>

namespace optkit {

namespace {
bool isBlank(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' ||
         c == '\v';
}

std::string trim(const std::string& s) {
  std::string::size_type start = 0;
  while (start < s.size() && isBlank(s[start])) ++start;
  std::string::size_type end = s.size();
  while (end > start && isBlank(s[end - 1])) --end;
  return s.substr(start, end - start);
}

Option<long> reject(const std::string& text, const char* reason) {
  return Option<long>::Absent(NumberFormatError(text, reason));
}
}  // namespace

// NumberFormatError implementation
NumberFormatError::NumberFormatError(const std::string& input,
                                     const std::string& reason)
    : Error(reason + ": \"" + input + "\""), m_input(input) {}

NumberFormatError::~NumberFormatError() throw() {}

Error* NumberFormatError::Clone() const { return new NumberFormatError(*this); }

const char* NumberFormatError::Name() const { return "NumberFormatError"; }

const std::string& NumberFormatError::Input() const { return m_input; }

Option<long> ParseLong(const std::string& text, int base) {
  if (base < 2 || base > 36) return reject(text, "invalid base");
  std::string digits = trim(text);
  if (digits.empty()) return reject(text, "empty input");
  // strtol would skip inner whitespace after a sign
  if ((digits[0] == '+' || digits[0] == '-') &&
      (digits.size() == 1 || isBlank(digits[1]))) {
    return reject(text, "sign without digits");
  }

  const char* begin = digits.c_str();
  char* end = 0;
  errno = 0;
  long value = std::strtol(begin, &end, base);
  if (end == begin) return reject(text, "no digits");
  if (*end != '\0') return reject(text, "trailing characters");
  if (errno == ERANGE) return reject(text, "out of range");
  return Option<long>::Present(value);
}

std::vector<Option<long> > ParseLines(std::istream& in, int base) {
  std::vector<Option<long> > results;
  std::string line;
  while (std::getline(in, line)) {
    results.push_back(ParseLong(line, base));
  }
  return results;
}

}  // namespace optkit
