#pragma once

#include "util/Exception.hpp"

namespace brinksmanship {

// A payoff parameter set violates the strict ordering its matrix type requires, or the shared
// scale/weight contract.
class ConstraintError : public util::CleanException {
 public:
  using util::CleanException::CleanException;
};

// An unrecognized matrix type tag or alias. The message lists every valid tag and alias.
class UnknownTagError : public util::CleanException {
 public:
  using util::CleanException::CleanException;
};

// A value type was constructed outside its documented numeric bounds.
class RangeError : public util::Exception {
 public:
  using util::Exception::Exception;
};

// A scenario file or scenario JSON object could not be read.
class ScenarioError : public util::CleanException {
 public:
  using util::CleanException::CleanException;
};

}  // namespace brinksmanship
