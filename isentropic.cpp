/**
 * \file isentropic.cpp
 * \brief function definitions for the isentropic relations
 * \version 1.0
 */

#include "./isentropic.hpp"

#include <math.h>

#include <ostream>
#include <iostream>
#include <sstream>
#include <string>

#include "./flow_error.hpp"
#include "./inner_prod_vector.hpp"

using std::cerr;
using std::endl;
using std::string;

// ======================================================================

void CheckGamma(const double & gamma, const string & caller) {
  if (!(gamma > 1.0)) {
    cerr << caller << ": invalid specific heat ratio" << endl;
    cerr << "gamma = " << gamma << endl;
    std::ostringstream msg;
    msg << caller << ": gamma = " << gamma << " must exceed 1";
    throw DomainError(msg.str());
  }
}

// ======================================================================

namespace {

void CheckMach(const double & Mach, const string & caller) {
  if (!(Mach >= 0.0)) {
    cerr << caller << ": negative Mach number" << endl;
    cerr << "Mach = " << Mach << endl;
    std::ostringstream msg;
    msg << caller << ": Mach = " << Mach << " is negative";
    throw DomainError(msg.str());
  }
}

void CheckRatio(const double & ratio, const string & caller) {
  if (!(ratio >= 1.0)) {
    cerr << caller << ": total to static ratio below one" << endl;
    cerr << "ratio = " << ratio << endl;
    std::ostringstream msg;
    msg << caller << ": ratio = " << ratio << " is below 1";
    throw DomainError(msg.str());
  }
}

} // anonymous namespace

// ======================================================================

double TtTs_Mach(const double & Mach, const double & gamma) {
  CheckGamma(gamma, "Isentropic(TtTs_Mach)");
  CheckMach(Mach, "Isentropic(TtTs_Mach)");
  return 1.0 + 0.5*(gamma - 1.0)*Mach*Mach;
}

// ======================================================================

double PtPs_Mach(const double & Mach, const double & gamma) {
  return pow(TtTs_Mach(Mach, gamma), gamma/(gamma - 1.0));
}

// ======================================================================

double RhotRhos_Mach(const double & Mach, const double & gamma) {
  return pow(TtTs_Mach(Mach, gamma), 1.0/(gamma - 1.0));
}

// ======================================================================

double Mach_TtTs(const double & TtTs, const double & gamma) {
  CheckGamma(gamma, "Isentropic(Mach_TtTs)");
  CheckRatio(TtTs, "Isentropic(Mach_TtTs)");
  return sqrt(2.0*(TtTs - 1.0)/(gamma - 1.0));
}

// ======================================================================

double Mach_PtPs(const double & PtPs, const double & gamma) {
  CheckGamma(gamma, "Isentropic(Mach_PtPs)");
  CheckRatio(PtPs, "Isentropic(Mach_PtPs)");
  return Mach_TtTs(pow(PtPs, (gamma - 1.0)/gamma), gamma);
}

// ======================================================================

InnerProdVector TtTs_Mach(const InnerProdVector & Mach,
                          const double & gamma) {
  InnerProdVector ratio(Mach.size(), 0.0);
  for (int i = 0; i < Mach.size(); i++)
    ratio(i) = TtTs_Mach(Mach(i), gamma);
  return ratio;
}

// ======================================================================

InnerProdVector PtPs_Mach(const InnerProdVector & Mach,
                          const double & gamma) {
  InnerProdVector ratio(Mach.size(), 0.0);
  for (int i = 0; i < Mach.size(); i++)
    ratio(i) = PtPs_Mach(Mach(i), gamma);
  return ratio;
}

// ======================================================================

InnerProdVector RhotRhos_Mach(const InnerProdVector & Mach,
                              const double & gamma) {
  InnerProdVector ratio(Mach.size(), 0.0);
  for (int i = 0; i < Mach.size(); i++)
    ratio(i) = RhotRhos_Mach(Mach(i), gamma);
  return ratio;
}

// ======================================================================

InnerProdVector Mach_TtTs(const InnerProdVector & TtTs,
                          const double & gamma) {
  InnerProdVector Mach(TtTs.size(), 0.0);
  for (int i = 0; i < TtTs.size(); i++)
    Mach(i) = Mach_TtTs(TtTs(i), gamma);
  return Mach;
}

// ======================================================================

InnerProdVector Mach_PtPs(const InnerProdVector & PtPs,
                          const double & gamma) {
  InnerProdVector Mach(PtPs.size(), 0.0);
  for (int i = 0; i < PtPs.size(); i++)
    Mach(i) = Mach_PtPs(PtPs(i), gamma);
  return Mach;
}
