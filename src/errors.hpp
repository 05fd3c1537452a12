#pragma once
/*
 * Errors
 *
 * Purpose: exception kinds thrown by the etab core.
 * Note: all derive from standard exception types; InternalConsistencyError
 *       means the width bookkeeping is broken, not that the caller erred.
 */
#include <stdexcept>
#include <string>

class ConfigurationError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

class IndexError : public std::out_of_range {
public:
  using std::out_of_range::out_of_range;
};

class InternalConsistencyError : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

class MultisetValueNotFound : public InternalConsistencyError {
public:
  explicit MultisetValueNotFound(int value)
      : InternalConsistencyError("column width multiset: value not present: " + std::to_string(value)) {}
};

class MultisetEmpty : public InternalConsistencyError {
public:
  MultisetEmpty() : InternalConsistencyError("column width multiset: max of empty set") {}
};
