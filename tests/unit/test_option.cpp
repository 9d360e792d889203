// Unit tests for Option construction, extraction, predicates and equality
#include <cstddef>
#include <string>

#include <criterion/criterion.h>

#include "optkit/option/Error.hpp"
#include "optkit/option/Option.hpp"

using optkit::BadOptionAccess;
using optkit::Error;
using optkit::Option;

namespace {
// Stand-in for a failure reported by some lower layer.
class DiskError : public Error {
 public:
  explicit DiskError(const std::string &msg) : Error(msg) {}
  virtual Error *Clone() const { return new DiskError(*this); }
  virtual const char *Name() const { return "DiskError"; }
};
}  // namespace

Test(Option, absent_get_throws_without_cause) {
  Option<int> none = Option<int>::Absent();
  bool thrown = false;
  try {
    none.Get();
  } catch (const BadOptionAccess &e) {
    thrown = true;
    cr_assert_null(e.Cause());
    cr_assert(std::string(e.what()).find("absent") != std::string::npos);
  }
  cr_assert(thrown, "Get() on Absent must throw BadOptionAccess");
}

Test(Option, absent_get_chains_cause) {
  Option<int> none = Option<int>::Absent(DiskError("sector 7 unreadable"));
  bool thrown = false;
  try {
    none.Get();
  } catch (const BadOptionAccess &e) {
    thrown = true;
    cr_assert_not_null(e.Cause());
    const DiskError *cause = dynamic_cast<const DiskError *>(e.Cause());
    cr_assert_not_null(cause, "cause keeps its dynamic type");
    cr_assert_str_eq(cause->what(), "sector 7 unreadable");
    std::string msg(e.what());
    cr_assert(msg.find("DiskError") != std::string::npos);
    cr_assert(msg.find("sector 7 unreadable") != std::string::npos);
  }
  cr_assert(thrown);
}

Test(Option, cause_is_readable_without_throwing) {
  Option<int> none = Option<int>::Absent(DiskError("gone"));
  cr_assert_not_null(none.Cause());
  cr_assert_str_eq(none.Cause()->Name(), "DiskError");
  cr_assert_null(Option<int>::Absent().Cause());
  cr_assert_null(Option<int>::Present(3).Cause());
}

Test(Option, cause_survives_copies) {
  Option<std::string> original =
      Option<std::string>::Absent(DiskError("copied"));
  Option<std::string> copied(original);
  Option<std::string> assigned = Option<std::string>::Present("x");
  assigned = copied;
  cr_assert_not_null(copied.Cause());
  cr_assert_not_null(assigned.Cause());
  cr_assert_neq(copied.Cause(), original.Cause(), "causes are deep copies");
  cr_assert_str_eq(assigned.Cause()->what(), "copied");
}

Test(Option, present_wraps_value) {
  Option<int> some = Option<int>::Present(10);
  cr_assert(some.IsPresent());
  cr_assert_not(some.IsAbsent());
  cr_assert_eq(some.Get(), 10);
}

Test(Option, present_of_null_pointer_is_absent) {
  Option<const char *> result = Option<const char *>::Present(NULL);
  cr_assert(result.IsAbsent());
  cr_assert_not(result.IsPresent());
  cr_assert(result == Option<const char *>::Absent());
}

Test(Option, present_of_non_null_pointer) {
  int target = 5;
  Option<int *> some = Option<int *>::Present(&target);
  cr_assert(some.IsPresent());
  cr_assert_eq(some.Get(), &target);
}

Test(Option, from_nullable) {
  std::string text("hello");
  Option<std::string> some = Option<std::string>::FromNullable(&text);
  cr_assert(some.IsPresent());
  cr_assert(some.Get() == "hello");

  const std::string *missing = NULL;
  Option<std::string> none = Option<std::string>::FromNullable(missing);
  cr_assert(none.IsAbsent());
  cr_assert_null(none.Cause());
}

Test(Option, from_nullable_pointer_to_null_pointer) {
  int *inner = NULL;
  Option<int *> none = Option<int *>::FromNullable(&inner);
  cr_assert(none.IsAbsent(), "the pointee is still checked for null");
}

Test(Option, default_constructed_is_absent) {
  Option<std::string> none;
  cr_assert(none.IsAbsent());
  cr_assert(none == Option<std::string>::Absent());
}

Test(Option, get_or) {
  cr_assert_eq(Option<int>::Present(4).GetOr(9), 4);
  cr_assert_eq(Option<int>::Absent().GetOr(9), 9);
  cr_assert_eq(Option<int>::Absent(DiskError("x")).GetOr(9), 9);
}

Test(Option, predicates_on_absent) {
  Option<std::string> none = Option<std::string>::Absent();
  cr_assert_not(none.IsPresent());
  cr_assert(none.IsAbsent());
  Option<std::string> some = Option<std::string>::Present("some");
  cr_assert(some.IsPresent());
  cr_assert_not(some.IsAbsent());
}

Test(Option, reads_are_idempotent) {
  Option<std::string> some = Option<std::string>::Present("same");
  for (int i = 0; i < 3; ++i) {
    cr_assert(some.IsPresent());
    cr_assert_not(some.IsAbsent());
    cr_assert(some.Get() == "same");
  }
  Option<std::string> none = Option<std::string>::Absent(DiskError("d"));
  for (int i = 0; i < 3; ++i) {
    cr_assert(none.IsAbsent());
    bool thrown = false;
    try {
      none.Get();
    } catch (const BadOptionAccess &e) {
      thrown = true;
      cr_assert_not_null(e.Cause());
    }
    cr_assert(thrown);
  }
}

Test(Option, equality) {
  cr_assert(Option<int>::Present(1) == Option<int>::Present(1));
  cr_assert(Option<int>::Present(1) != Option<int>::Present(2));
  cr_assert(Option<int>::Present(1) != Option<int>::Absent());
  cr_assert(Option<int>::Absent() != Option<int>::Present(1));
  cr_assert(Option<int>::Present(0) != Option<int>::Absent(),
            "a zero value is still present");
  cr_assert(Option<int>::Absent() == Option<int>::Absent());
}

Test(Option, absent_equality_ignores_cause) {
  Option<int> plain = Option<int>::Absent();
  Option<int> first = Option<int>::Absent(DiskError("first"));
  Option<int> second = Option<int>::Absent(Error("second"));
  cr_assert(first == second);
  cr_assert(first == plain);
  cr_assert(plain == second);
}

Test(Option, assignment_switches_variant) {
  Option<std::string> value = Option<std::string>::Present("hello");
  Option<std::string> none = Option<std::string>::Absent(DiskError("d"));
  value = none;
  cr_assert(value.IsAbsent());
  cr_assert_not_null(value.Cause());
  none = Option<std::string>::Present("world");
  cr_assert(none.IsPresent());
  cr_assert(none.Get() == "world");
  cr_assert_null(none.Cause());
}
