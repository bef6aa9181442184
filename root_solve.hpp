/**
 * \file root_solve.hpp
 * \brief bounded Newton iteration shared by the inverse flow relations
 * \version 1.0
 */

#pragma once

#include <math.h>

#include <ostream>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>

#include <boost/cstdint.hpp>
#include <boost/math/policies/error_handling.hpp>
#include <boost/math/tools/roots.hpp>

#include "./flow_error.hpp"

const int kMaxNewtonIter = 100; ///< iteration limit for the inverse relations
const double kNewtonStepTol = 1.E-8; ///< relative size of an accepted step

/*!
 * \brief finds the root of f in [min_range, max_range] using Newton's method
 * \param[in] f - functor returning a tuple of the residual and its derivative
 * \param[in] guess - initial estimate of the root
 * \param[in] min_range - lower bound on the root
 * \param[in] max_range - upper bound on the root
 * \param[in] caller - name of the calling routine, used in messages
 * \param[in] max_iter - maximum number of Newton iterations
 * \returns the root
 *
 * The value returned by Boost is accepted only if one more Newton step
 * from it is smaller than kNewtonStepTol relative to the root; this
 * rejects iterations that stalled on a bound of a range holding no root
 * and iterations cut off by max_iter.  Throws ConvergenceError otherwise,
 * or if Boost reports that the range does not bracket a root.
 */
template <class F, class T>
T SolveNewton(F f, const T & guess, const T & min_range, const T & max_range,
              const std::string & caller,
              const int & max_iter = kMaxNewtonIter) {
  // step-size tolerance; the root itself is then accurate to full precision
  int digits = static_cast<int>(std::numeric_limits<T>::digits*0.6);
  boost::uintmax_t num_iter = max_iter;
  T root;
  try {
    root = boost::math::tools::
        newton_raphson_iterate(f, guess, min_range, max_range, digits,
                               num_iter);
  } catch (const boost::math::evaluation_error & err) {
    std::cerr << caller << ": Newton iteration failed" << std::endl;
    std::cerr << err.what() << std::endl;
    throw ConvergenceError(caller + ": " + err.what());
  }
  T fun, dfun;
  boost::math::tie(fun, dfun) = f(root);
  if ( (fun != 0) &&
       ( (dfun == 0) || (fabs(fun/dfun) > kNewtonStepTol*fabs(root)) ) ) {
    std::cerr << caller << ": Newton iteration did not converge after "
              << num_iter << " of " << max_iter << " iterations" << std::endl;
    std::cerr << "last iterate = " << root << ": residual = " << fun
              << std::endl;
    std::ostringstream msg;
    msg << caller << ": no convergence after " << num_iter
        << " iterations, last iterate = " << root;
    throw ConvergenceError(msg.str());
  }
  return root;
}
