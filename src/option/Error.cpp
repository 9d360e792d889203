#include "optkit/option/Error.hpp"

namespace optkit {

namespace {
std::string describe(const char* msg, const Error* cause) {
  std::string text(msg);
  if (cause) {
    text += " (caused by ";
    text += cause->Name();
    text += ": ";
    text += cause->what();
    text += ")";
  }
  return text;
}
}  // namespace

// Error implementation
Error::Error(const std::string& message) : std::runtime_error(message) {}

Error::~Error() throw() {}

Error* Error::Clone() const { return new Error(*this); }

const char* Error::Name() const { return "Error"; }

// BadOptionAccess implementation
BadOptionAccess::BadOptionAccess(const char* msg, const Error* cause)
    : std::runtime_error(describe(msg, cause)),
      m_cause(cause ? cause->Clone() : 0) {}

BadOptionAccess::BadOptionAccess(const BadOptionAccess& other)
    : std::runtime_error(other),
      m_cause(other.m_cause ? other.m_cause->Clone() : 0) {}

BadOptionAccess& BadOptionAccess::operator=(const BadOptionAccess& other) {
  if (this != &other) {
    Error* copy = other.m_cause ? other.m_cause->Clone() : 0;
    std::runtime_error::operator=(other);
    delete m_cause;
    m_cause = copy;
  }
  return *this;
}

BadOptionAccess::~BadOptionAccess() throw() { delete m_cause; }

const Error* BadOptionAccess::Cause() const { return m_cause; }

}  // namespace optkit
