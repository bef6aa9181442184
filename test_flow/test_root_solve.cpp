/**
 * \file test_root_solve.cpp
 * \brief unit tests for the bounded Newton iteration
 * \version 1.0
 */

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE RootSolve
#include <boost/test/unit_test.hpp>

#include <math.h>

#include <string>

#include <boost/math/tools/tuple.hpp>

#include "../flow_error.hpp"
#include "../root_solve.hpp"

using std::string;

/*!
 * \class SquareRelation
 * \brief residual M^2 - c and its derivative; no root in [1, 100] if c < 1
 */
class SquareRelation {
 public:
  explicit SquareRelation(const double & c) : c_(c) {}

  boost::math::tuple<double, double> operator()(const double & M) {
    return boost::math::make_tuple(M*M - c_, 2.0*M);
  }

 private:
  double c_;
};

BOOST_AUTO_TEST_SUITE(RootSolve)

BOOST_AUTO_TEST_CASE(Converges) {
  double root = SolveNewton(SquareRelation(2.0), 100.0, 1.0, 100.0,
                            string("RootSolve(Converges)"));
  BOOST_CHECK_CLOSE(root, sqrt(2.0), 1.e-6);
}

BOOST_AUTO_TEST_CASE(NoRootInRange) {
  // M^2 + 1 has no real root; the iteration runs into the lower bound
  BOOST_CHECK_THROW(SolveNewton(SquareRelation(-1.0), 2.0, 1.0, 100.0,
                                string("RootSolve(NoRootInRange)")),
                    ConvergenceError);
  BOOST_CHECK_THROW(SolveNewton(SquareRelation(-1.0), 2.0, 1.0, 100.0,
                                string("RootSolve(NoRootInRange)")),
                    FlowError);
}

BOOST_AUTO_TEST_CASE(InvalidRange) {
  BOOST_CHECK_THROW(SolveNewton(SquareRelation(2.0), 2.0, 100.0, 1.0,
                                string("RootSolve(InvalidRange)")),
                    ConvergenceError);
}

BOOST_AUTO_TEST_CASE(IterationLimit) {
  BOOST_CHECK_THROW(SolveNewton(SquareRelation(2.0), 100.0, 1.0, 100.0,
                                string("RootSolve(IterationLimit)"), 2),
                    ConvergenceError);
}

BOOST_AUTO_TEST_CASE(ConvergedOnLastIteration) {
  // the smallest budget that succeeds uses every one of its iterations
  int budget = 1;
  bool solved = false;
  double root = 0.0;
  while ( (!solved) && (budget <= kMaxNewtonIter) ) {
    try {
      root = SolveNewton(SquareRelation(2.0), 100.0, 1.0, 100.0,
                         string("RootSolve(ConvergedOnLastIteration)"),
                         budget);
      solved = true;
    } catch (const ConvergenceError &) {
      budget++;
    }
  }
  BOOST_REQUIRE(solved);
  BOOST_CHECK_GT(budget, 2);
  BOOST_CHECK_CLOSE(root, sqrt(2.0), 1.e-6);
}

BOOST_AUTO_TEST_SUITE_END()
