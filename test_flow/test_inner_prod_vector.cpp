/**
 * \file test_inner_prod_vector.cpp
 * \brief unit tests for the InnerProdVector search and slice utilities
 * \version 1.0
 */

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE InnerProdVectorUtilities
#include <boost/test/unit_test.hpp>

#include "../flow_error.hpp"
#include "../inner_prod_vector.hpp"

BOOST_AUTO_TEST_SUITE(InnerProdVectorUtilities)

BOOST_AUTO_TEST_CASE(ArgMinFirstOnTies) {
  InnerProdVector u(5, 2.0);
  u(1) = 0.5;
  u(3) = 0.5;
  BOOST_CHECK_EQUAL(u.ArgMin(), 1);
  InnerProdVector empty;
  BOOST_CHECK_THROW(empty.ArgMin(), DomainError);
}

BOOST_AUTO_TEST_CASE(ArgNearestWithinRange) {
  InnerProdVector u(6, 0.0);
  for (int i = 0; i < 6; i++)
    u(i) = 1.0 + 0.2*i;
  BOOST_CHECK_EQUAL(u.ArgNearest(1.45, 0, 6), 2);
  // the closest element overall lies outside the searched range
  BOOST_CHECK_EQUAL(u.ArgNearest(1.0, 3, 6), 3);
  BOOST_CHECK_EQUAL(u.ArgNearest(5.0, 0, 6), 5);
  BOOST_CHECK_THROW(u.ArgNearest(1.0, 4, 4), DomainError);
  BOOST_CHECK_THROW(u.ArgNearest(1.0, 0, 7), DomainError);
  BOOST_CHECK_THROW(u.ArgNearest(1.0, -1, 3), DomainError);
}

BOOST_AUTO_TEST_CASE(SliceAndSetSlice) {
  InnerProdVector u(5, 0.0);
  for (int i = 0; i < 5; i++)
    u(i) = static_cast<double>(i);
  InnerProdVector sub = u.Slice(1, 4);
  BOOST_REQUIRE_EQUAL(sub.size(), 3u);
  BOOST_CHECK_EQUAL(sub(0), 1.0);
  BOOST_CHECK_EQUAL(sub(2), 3.0);
  BOOST_CHECK_EQUAL(u.Slice(2, 2).size(), 0u);
  BOOST_CHECK_THROW(u.Slice(3, 2), DomainError);

  InnerProdVector w(5, -1.0);
  w.SetSlice(2, sub);
  BOOST_CHECK_EQUAL(w(1), -1.0);
  BOOST_CHECK_EQUAL(w(2), 1.0);
  BOOST_CHECK_EQUAL(w(4), 3.0);
  BOOST_CHECK_THROW(w.SetSlice(3, sub), DomainError);
}

BOOST_AUTO_TEST_CASE(ScalarAssignAndExpressions) {
  InnerProdVector u(4, 1.0);
  u = 2.5;
  for (int i = 0; i < 4; i++)
    BOOST_CHECK_EQUAL(u(i), 2.5);
  InnerProdVector v = u*2.0;
  BOOST_CHECK_EQUAL(v(3), 5.0);
}

BOOST_AUTO_TEST_SUITE_END()
