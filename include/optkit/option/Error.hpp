#pragma once

#include <stdexcept>
#include <string>

namespace optkit {

/**
 * Base class for causes attached to an absent Option.
 *
 * Options own their cause, so every subclass must override Clone() to return
 * a deep copy of its own dynamic type (caller owns the memory) and Name() to
 * report its kind in diagnostics.
 */
class Error : public std::runtime_error {
 public:
  explicit Error(const std::string& message);
  virtual ~Error() throw();

  virtual Error* Clone() const;
  virtual const char* Name() const;
};

/**
 * Thrown by Option::Get() on an absent value. When the absent value carried a
 * cause, the exception holds its own copy of it.
 */
class BadOptionAccess : public std::runtime_error {
 public:
  BadOptionAccess(const char* msg, const Error* cause);
  BadOptionAccess(const BadOptionAccess& other);
  BadOptionAccess& operator=(const BadOptionAccess& other);
  virtual ~BadOptionAccess() throw();

  // NULL when the absent value had no cause.
  const Error* Cause() const;

 private:
  Error* m_cause;
};

/**
 * Thrown when an Option iterator is dereferenced or advanced past its end.
 */
class EndOfSequence : public std::runtime_error {
 public:
  explicit EndOfSequence(const char* msg) : std::runtime_error(msg) {}
};

}  // namespace optkit
