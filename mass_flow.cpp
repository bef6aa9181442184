/**
 * \file mass_flow.cpp
 * \brief function definitions for the area-Mach relations
 * \version 1.0
 */

#include "./mass_flow.hpp"

#include <math.h>

#include <ostream>
#include <iostream>
#include <sstream>
#include <algorithm>

#include "./flow_error.hpp"
#include "./inner_prod_vector.hpp"
#include "./isentropic.hpp"
#include "./root_solve.hpp"

using std::cerr;
using std::endl;
using std::min;

namespace {

// area ratios this close to one are treated as sonic
const double kSonicTol = 1.E-12;

// upper bound on the supersonic branch; Sigma(100) is ~1e11 for air
const double kMachMax = 100.0;

void CheckSigma(const double & sigma, const std::string & caller) {
  if (!(sigma >= 1.0 - kSonicTol)) {
    cerr << caller << ": area ratio is below one" << endl;
    cerr << "sigma = " << sigma << endl;
    std::ostringstream msg;
    msg << caller << ": sigma = " << sigma << " is below 1";
    throw DomainError(msg.str());
  }
}

} // anonymous namespace

// ======================================================================

double Sigma_Mach(const double & Mach, const double & gamma) {
  CheckGamma(gamma, "MassFlow(Sigma_Mach)");
  if (!(Mach > 0.0)) {
    cerr << "MassFlow(Sigma_Mach): Mach number must be positive" << endl;
    cerr << "Mach = " << Mach << endl;
    throw DomainError("MassFlow(Sigma_Mach): Mach must be positive");
  }
  return (1.0/Mach)*pow((2.0/(gamma + 1.0))*TtTs_Mach(Mach, gamma),
                        (gamma + 1.0)/(2.0*(gamma - 1.0)));
}

// ======================================================================

double MachSub_Sigma(const double & sigma, const double & gamma) {
  CheckGamma(gamma, "MassFlow(MachSub_Sigma)");
  CheckSigma(sigma, "MassFlow(MachSub_Sigma)");
  if (sigma <= 1.0 + kSonicTol) return 1.0;
  // small Mach asymptote of Sigma gives a good starting point
  double guess = pow(2.0/(gamma + 1.0), (gamma + 1.0)/(2.0*(gamma - 1.0)))
      /sigma;
  guess = min(guess, 0.5);
  return SolveNewton(MachRelation<double>(gamma, sigma), guess,
                     1.E-10, 1.0, std::string("MassFlow(MachSub_Sigma)"));
}

// ======================================================================

double MachSup_Sigma(const double & sigma, const double & gamma) {
  CheckGamma(gamma, "MassFlow(MachSup_Sigma)");
  CheckSigma(sigma, "MassFlow(MachSup_Sigma)");
  if (sigma <= 1.0 + kSonicTol) return 1.0;
  return SolveNewton(MachRelation<double>(gamma, sigma), 2.0,
                     1.0, kMachMax, std::string("MassFlow(MachSup_Sigma)"));
}

// ======================================================================

double WeightMassFlow(const double & Mach, const double & r,
                      const double & gamma) {
  CheckGamma(gamma, "MassFlow(WeightMassFlow)");
  if (!(r > 0.0)) {
    cerr << "MassFlow(WeightMassFlow): gas constant must be positive"
         << endl;
    cerr << "r = " << r << endl;
    throw DomainError("MassFlow(WeightMassFlow): r must be positive");
  }
  return sqrt(gamma/r)*Mach
      *pow(TtTs_Mach(Mach, gamma), -(gamma + 1.0)/(2.0*(gamma - 1.0)));
}

// ======================================================================

InnerProdVector Sigma_Mach(const InnerProdVector & Mach,
                           const double & gamma) {
  InnerProdVector sigma(Mach.size(), 0.0);
  for (int i = 0; i < Mach.size(); i++)
    sigma(i) = Sigma_Mach(Mach(i), gamma);
  return sigma;
}

// ======================================================================

InnerProdVector MachSub_Sigma(const InnerProdVector & sigma,
                              const double & gamma) {
  InnerProdVector Mach(sigma.size(), 0.0);
  for (int i = 0; i < sigma.size(); i++)
    Mach(i) = MachSub_Sigma(sigma(i), gamma);
  return Mach;
}

// ======================================================================

InnerProdVector MachSup_Sigma(const InnerProdVector & sigma,
                              const double & gamma) {
  InnerProdVector Mach(sigma.size(), 0.0);
  for (int i = 0; i < sigma.size(); i++)
    Mach(i) = MachSup_Sigma(sigma(i), gamma);
  return Mach;
}

// ======================================================================

InnerProdVector WeightMassFlow(const InnerProdVector & Mach,
                               const double & r, const double & gamma) {
  InnerProdVector wmf(Mach.size(), 0.0);
  for (int i = 0; i < Mach.size(); i++)
    wmf(i) = WeightMassFlow(Mach(i), r, gamma);
  return wmf;
}
