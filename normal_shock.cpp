/**
 * \file normal_shock.cpp
 * \brief function definitions for the shock relations
 * \version 1.0
 */

#include "./normal_shock.hpp"

#include <math.h>

#include <ostream>
#include <iostream>
#include <sstream>
#include <string>
#include <algorithm>

#include <boost/math/tools/roots.hpp>

#include "./flow_error.hpp"
#include "./inner_prod_vector.hpp"
#include "./isentropic.hpp"
#include "./root_solve.hpp"

using std::cerr;
using std::endl;
using std::min;
using std::string;

namespace {

const double kShockTol = 1.E-10;
const double kMachMax = 100.0;

void CheckUpstreamMach(const double & Mn, const string & caller) {
  if (!(Mn >= 1.0 - kShockTol)) {
    cerr << caller << ": upstream Mach number is subsonic" << endl;
    cerr << "Mn = " << Mn << endl;
    std::ostringstream msg;
    msg << caller << ": Mn = " << Mn << " is below 1";
    throw DomainError(msg.str());
  }
}

/*!
 * \class PiRelation
 * \brief residual of the shock total-pressure relation and its derivative
 */
template <class T>
class PiRelation {
 public:
  PiRelation(const T & gam, const T & pi) : gamma(gam), pi_targ(pi) {}

  boost::math::tuple<T, T> operator()(const T & M) {
    T M2 = M*M;
    T pi = PiRatio(M, gamma);
    T dpi = pi*4.0*gamma/(gamma - 1.0)
        *(1.0/(M*((gamma - 1.0)*M2 + 2.0))
          - M/(2.0*gamma*M2 - (gamma - 1.0)));
    return boost::math::make_tuple(pi - pi_targ, dpi);
  }

 private:
  T gamma; ///< value of the heat capacity ratio
  T pi_targ; ///< total pressure ratio being sought
};

} // anonymous namespace

// ======================================================================

double DownstreamMn(const double & Mn, const double & gamma) {
  CheckGamma(gamma, "NormalShock(DownstreamMn)");
  CheckUpstreamMach(Mn, "NormalShock(DownstreamMn)");
  double M2 = Mn*Mn;
  return sqrt((1.0 + 0.5*(gamma - 1.0)*M2)/(gamma*M2 - 0.5*(gamma - 1.0)));
}

// ======================================================================

double PsRatio(const double & Mn, const double & gamma) {
  CheckGamma(gamma, "NormalShock(PsRatio)");
  CheckUpstreamMach(Mn, "NormalShock(PsRatio)");
  return 1.0 + 2.0*gamma/(gamma + 1.0)*(Mn*Mn - 1.0);
}

// ======================================================================

double PiRatio(const double & Mn, const double & gamma) {
  CheckGamma(gamma, "NormalShock(PiRatio)");
  CheckUpstreamMach(Mn, "NormalShock(PiRatio)");
  double M2 = Mn*Mn;
  double rho_ratio = (gamma + 1.0)*M2/((gamma - 1.0)*M2 + 2.0);
  return pow(rho_ratio, gamma/(gamma - 1.0))
      *pow((gamma + 1.0)/(2.0*gamma*M2 - (gamma - 1.0)), 1.0/(gamma - 1.0));
}

// ======================================================================

double Mn_PiRatio(const double & pi, const double & gamma) {
  CheckGamma(gamma, "NormalShock(Mn_PiRatio)");
  if ( !(pi > 0.0) || !(pi <= 1.0 + kShockTol) ) {
    cerr << "NormalShock(Mn_PiRatio): total pressure ratio "
         << "must lie in (0, 1]" << endl;
    cerr << "pi = " << pi << endl;
    std::ostringstream msg;
    msg << "NormalShock(Mn_PiRatio): pi = " << pi << " is outside (0, 1]";
    throw DomainError(msg.str());
  }
  if (pi >= 1.0 - kShockTol) return 1.0;
  if (pi < PiRatio(kMachMax, gamma)) {
    cerr << "NormalShock(Mn_PiRatio): total pressure ratio is below "
         << "that of a Mach " << kMachMax << " shock" << endl;
    cerr << "pi = " << pi << endl;
    throw DomainError("NormalShock(Mn_PiRatio): pi is too small");
  }
  return SolveNewton(PiRelation<double>(gamma, pi), 2.0, 1.0, kMachMax,
                     string("NormalShock(Mn_PiRatio)"));
}

// ======================================================================

double Mn_PsRatio(const double & ps_ratio, const double & gamma) {
  CheckGamma(gamma, "NormalShock(Mn_PsRatio)");
  if (!(ps_ratio >= 1.0 - kShockTol)) {
    cerr << "NormalShock(Mn_PsRatio): static pressure ratio below one"
         << endl;
    cerr << "ps_ratio = " << ps_ratio << endl;
    throw DomainError("NormalShock(Mn_PsRatio): ps_ratio is below 1");
  }
  if (ps_ratio <= 1.0) return 1.0;
  return sqrt(1.0 + (ps_ratio - 1.0)*(gamma + 1.0)/(2.0*gamma));
}

// ======================================================================

double DeflectionMachSigma(const double & Mach, const double & sigma,
                           const double & gamma) {
  CheckGamma(gamma, "ObliqueShock(DeflectionMachSigma)");
  double Mn2 = pow(Mach*sin(sigma), 2);
  double tan_dev = 2.0*(Mn2 - 1.0)
      /(tan(sigma)*(Mach*Mach*(gamma + cos(2.0*sigma)) + 2.0));
  return atan(tan_dev);
}

// ======================================================================

double DownstreamMachShockPsRatio(const double & Mach, const double & ps_ratio,
                                  const double & gamma) {
  CheckUpstreamMach(Mach, "ObliqueShock(DownstreamMachShockPsRatio)");
  double Mn0 = Mn_PsRatio(ps_ratio, gamma);
  if (Mn0 > Mach*(1.0 + kShockTol)) {
    cerr << "ObliqueShock(DownstreamMachShockPsRatio): pressure ratio "
         << "exceeds that of a normal shock" << endl;
    cerr << "Mach = " << Mach << ": ps_ratio = " << ps_ratio << endl;
    throw DomainError("ObliqueShock(DownstreamMachShockPsRatio): "
                      "ps_ratio is too large for Mach");
  }
  double sigma = asin(min(Mn0/Mach, 1.0));
  double dev = DeflectionMachSigma(Mach, sigma, gamma);
  return DownstreamMn(Mn0, gamma)/sin(sigma - dev);
}

// ======================================================================

InnerProdVector DownstreamMn(const InnerProdVector & Mn,
                             const double & gamma) {
  InnerProdVector Mn_down(Mn.size(), 0.0);
  for (int i = 0; i < Mn.size(); i++)
    Mn_down(i) = DownstreamMn(Mn(i), gamma);
  return Mn_down;
}

// ======================================================================

InnerProdVector PsRatio(const InnerProdVector & Mn,
                        const double & gamma) {
  InnerProdVector ratio(Mn.size(), 0.0);
  for (int i = 0; i < Mn.size(); i++)
    ratio(i) = PsRatio(Mn(i), gamma);
  return ratio;
}

// ======================================================================

InnerProdVector PiRatio(const InnerProdVector & Mn,
                        const double & gamma) {
  InnerProdVector ratio(Mn.size(), 0.0);
  for (int i = 0; i < Mn.size(); i++)
    ratio(i) = PiRatio(Mn(i), gamma);
  return ratio;
}

// ======================================================================

InnerProdVector Mn_PiRatio(const InnerProdVector & pi,
                           const double & gamma) {
  InnerProdVector Mn(pi.size(), 0.0);
  for (int i = 0; i < pi.size(); i++)
    Mn(i) = Mn_PiRatio(pi(i), gamma);
  return Mn;
}

// ======================================================================

InnerProdVector DownstreamMachShockPsRatio(const InnerProdVector & Mach,
                                           const InnerProdVector & ps_ratio,
                                           const double & gamma) {
  if (Mach.size() != ps_ratio.size()) {
    cerr << "ObliqueShock(DownstreamMachShockPsRatio): "
         << "Mach.size() is incompatible with ps_ratio.size()" << endl;
    throw DomainError("ObliqueShock(DownstreamMachShockPsRatio): "
                      "size mismatch");
  }
  InnerProdVector Mach_down(Mach.size(), 0.0);
  for (int i = 0; i < Mach.size(); i++)
    Mach_down(i) = DownstreamMachShockPsRatio(Mach(i), ps_ratio(i), gamma);
  return Mach_down;
}
