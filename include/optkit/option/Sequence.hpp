#pragma once

#include <iterator>
#include <vector>

#include "optkit/option/Option.hpp"

namespace optkit {

/**
 * ResultOf<F>::type - the return type of a unary callable. Functor classes
 * declare it as result_type (the std::unary_function convention); plain
 * function pointers carry it in their signature.
 */
template <typename F>
struct ResultOf {
  typedef typename F::result_type type;
};

template <typename R, typename A>
struct ResultOf<R (*)(A)> {
  typedef R type;
};

/**
 * Compact - copies the value of every present Option in [first, last) to
 * out, in order. Absent elements are skipped and never extracted from.
 * @return out advanced past the last value written
 */
template <typename InputIt, typename OutputIt>
OutputIt Compact(InputIt first, InputIt last, OutputIt out) {
  for (; first != last; ++first) {
    if (first->IsPresent()) {
      *out = first->Get();
      ++out;
    }
  }
  return out;
}

/**
 * Compact over any container of Option<T> (vector, list, deque, ...).
 */
template <typename Container>
std::vector<typename Container::value_type::value_type> Compact(
    const Container& options) {
  std::vector<typename Container::value_type::value_type> values;
  Compact(options.begin(), options.end(), std::back_inserter(values));
  return values;
}

/**
 * MapPresent - writes f(value) to out for every present Option in
 * [first, last), in order. f is called exactly once per present element and
 * never for absent ones. Whatever f throws propagates unchanged; results of
 * the calls before it have already been written.
 * @return out advanced past the last result written
 */
template <typename F, typename InputIt, typename OutputIt>
OutputIt MapPresent(F f, InputIt first, InputIt last, OutputIt out) {
  for (; first != last; ++first) {
    if (first->IsPresent()) {
      *out = f(first->Get());
      ++out;
    }
  }
  return out;
}

/**
 * MapPresent over any container of Option<T>, collecting into a vector.
 * The element type comes from ResultOf<F>, so f must be a functor class with
 * a result_type or a one-argument function pointer. Other callables
 * (lambdas, functors without result_type) go through the iterator form with
 * an output iterator of the caller's choice.
 */
template <typename F, typename Container>
std::vector<typename ResultOf<F>::type> MapPresent(F f,
                                                   const Container& options) {
  std::vector<typename ResultOf<F>::type> results;
  MapPresent(f, options.begin(), options.end(), std::back_inserter(results));
  return results;
}

}  // namespace optkit
