/**
 * \file flow_error.hpp
 * \brief exception types thrown by the compressible-flow relations
 * \version 1.0
 */

#pragma once

#include <stdexcept>
#include <string>

/*!
 * \class FlowError
 * \brief base class for all errors raised by the nozzle flow routines
 */
class FlowError : public std::runtime_error {
 public:
  explicit FlowError(const std::string & what_arg) :
      std::runtime_error(what_arg) {}
};

/*!
 * \class DomainError
 * \brief an argument lies outside the domain of a relation
 *
 * Raised, for example, for an area ratio below one, a pressure ratio
 * that does not exceed one, or a negative Mach number.
 */
class DomainError : public FlowError {
 public:
  explicit DomainError(const std::string & what_arg) :
      FlowError(what_arg) {}
};

/*!
 * \class ConvergenceError
 * \brief an iterative inverse relation did not converge
 */
class ConvergenceError : public FlowError {
 public:
  explicit ConvergenceError(const std::string & what_arg) :
      FlowError(what_arg) {}
};

/*!
 * \class InconsistentStateError
 * \brief an object was queried before it held a valid solution
 */
class InconsistentStateError : public FlowError {
 public:
  explicit InconsistentStateError(const std::string & what_arg) :
      FlowError(what_arg) {}
};
