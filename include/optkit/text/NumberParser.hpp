#pragma once

#include <istream>
#include <string>
#include <vector>

#include "optkit/option/Error.hpp"
#include "optkit/option/Option.hpp"

namespace optkit {

/**
 * Cause attached to an absent parse result: the text could not be read as a
 * number.
 */
class NumberFormatError : public Error {
 public:
  NumberFormatError(const std::string& input, const std::string& reason);
  virtual ~NumberFormatError() throw();

  virtual Error* Clone() const;
  virtual const char* Name() const;

  /**
   * @return the text that failed to parse, before trimming
   */
  const std::string& Input() const;

 private:
  std::string m_input;
};

/**
 * Parses a signed integer written in base (2..36), ignoring surrounding
 * whitespace. Never throws on bad input: the result is Absent with a
 * NumberFormatError cause instead.
 */
Option<long> ParseLong(const std::string& text, int base);

/**
 * One ParseLong result per line of in, in order.
 */
std::vector<Option<long> > ParseLines(std::istream& in, int base);

}  // namespace optkit
