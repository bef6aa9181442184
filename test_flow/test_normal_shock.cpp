/**
 * \file test_normal_shock.cpp
 * \brief unit tests for the normal and oblique shock relations
 * \version 1.0
 */

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE ShockRelations
#include <boost/test/unit_test.hpp>

#include <math.h>

#include <boost/math/constants/constants.hpp>

#include "../flow_error.hpp"
#include "../inner_prod_vector.hpp"
#include "../isentropic.hpp"
#include "../normal_shock.hpp"

const double pi = boost::math::constants::pi<double>();

BOOST_AUTO_TEST_SUITE(NormalShock)

BOOST_AUTO_TEST_CASE(KnownValues) {
  BOOST_CHECK_CLOSE(DownstreamMn(2.0), 0.5773502691896257, 1.e-10);
  BOOST_CHECK_CLOSE(PsRatio(2.0), 4.5, 1.e-12);
  BOOST_CHECK_CLOSE(PiRatio(2.0), 0.7208738614847455, 1.e-10);
  BOOST_CHECK_CLOSE(PiRatio(2.5), 0.4990148120291512, 1.e-10);
  // a sonic shock is a Mach wave
  BOOST_CHECK_CLOSE(DownstreamMn(1.0), 1.0, 1.e-12);
  BOOST_CHECK_CLOSE(PiRatio(1.0), 1.0, 1.e-12);
}

BOOST_AUTO_TEST_CASE(StaticToTotalConsistency) {
  // Pt2/Pt1 = (Ps2/Ps1)*PtPs(M2)/PtPs(M1)
  const double mach[] = {1.2, 2.0, 4.0};
  for (int i = 0; i < 3; i++) {
    double M2 = DownstreamMn(mach[i], 1.3);
    BOOST_CHECK_CLOSE(PiRatio(mach[i], 1.3),
                      PsRatio(mach[i], 1.3)*PtPs_Mach(M2, 1.3)
                      /PtPs_Mach(mach[i], 1.3), 1.e-10);
  }
}

BOOST_AUTO_TEST_CASE(UpstreamMachFromLoss) {
  const double mach[] = {1.1, 1.6, 2.5, 5.0};
  for (int i = 0; i < 4; i++) {
    BOOST_CHECK_CLOSE(Mn_PiRatio(PiRatio(mach[i])), mach[i], 1.e-8);
    BOOST_CHECK_CLOSE(Mn_PsRatio(PsRatio(mach[i])), mach[i], 1.e-10);
  }
  BOOST_CHECK_EQUAL(Mn_PiRatio(1.0), 1.0);
  BOOST_CHECK_CLOSE(Mn_PsRatio(4.5), 2.0, 1.e-12);
  InnerProdVector loss(2, 0.0);
  loss(0) = PiRatio(1.5);
  loss(1) = PiRatio(3.0);
  InnerProdVector Mn = Mn_PiRatio(loss);
  BOOST_CHECK_CLOSE(Mn(0), 1.5, 1.e-8);
  BOOST_CHECK_CLOSE(Mn(1), 3.0, 1.e-8);
}

BOOST_AUTO_TEST_CASE(DomainErrors) {
  BOOST_CHECK_THROW(DownstreamMn(0.8), DomainError);
  BOOST_CHECK_THROW(PiRatio(0.5), DomainError);
  BOOST_CHECK_THROW(Mn_PiRatio(1.2), DomainError);
  BOOST_CHECK_THROW(Mn_PiRatio(0.0), DomainError);
  BOOST_CHECK_THROW(Mn_PsRatio(0.5), DomainError);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ObliqueShock)

BOOST_AUTO_TEST_CASE(Deflection) {
  // normal shock and Mach wave do not deflect the flow
  BOOST_CHECK_SMALL(DeflectionMachSigma(2.0, 0.5*pi), 1.e-12);
  BOOST_CHECK_SMALL(DeflectionMachSigma(2.0, asin(0.5)), 1.e-12);
  // M = 2, shock angle 40 deg gives about 10.6 deg of deflection
  double dev = DeflectionMachSigma(2.0, 40.0*pi/180.0)*180.0/pi;
  BOOST_CHECK_CLOSE(dev, 10.62, 0.1);
}

BOOST_AUTO_TEST_CASE(DownstreamMachLimits) {
  const double mach[] = {1.5, 2.5, 4.0};
  for (int i = 0; i < 3; i++) {
    // unit pressure ratio is a Mach wave
    BOOST_CHECK_CLOSE(DownstreamMachShockPsRatio(mach[i], 1.0), mach[i],
                      1.e-8);
    // normal shock strength recovers the normal shock Mach number
    BOOST_CHECK_CLOSE(DownstreamMachShockPsRatio(mach[i], PsRatio(mach[i])),
                      DownstreamMn(mach[i]), 1.e-6);
  }
  BOOST_CHECK_CLOSE(DownstreamMachShockPsRatio(2.5, 2.0), 2.0348525745124637,
                    1.e-8);
}

BOOST_AUTO_TEST_CASE(DownstreamMachDecreasesWithStrength) {
  double last = DownstreamMachShockPsRatio(3.0, 1.0);
  for (int i = 1; i <= 10; i++) {
    double ratio = 1.0 + (PsRatio(3.0) - 1.0)*static_cast<double>(i)/10.0;
    double M2 = DownstreamMachShockPsRatio(3.0, ratio);
    BOOST_CHECK_LT(M2, last);
    last = M2;
  }
}

BOOST_AUTO_TEST_CASE(TooStrong) {
  BOOST_CHECK_THROW(DownstreamMachShockPsRatio(2.0, 5.0), DomainError);
  BOOST_CHECK_THROW(DownstreamMachShockPsRatio(0.5, 1.1), DomainError);
}

BOOST_AUTO_TEST_SUITE_END()
