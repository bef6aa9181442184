/**
 * \file nozzle_regime.cpp
 * \brief function definitions for the nozzle regime classifier
 * \version 1.0
 */

#include "./nozzle_regime.hpp"

#include <math.h>

#include <ostream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "./flow_error.hpp"
#include "./inner_prod_vector.hpp"
#include "./isentropic.hpp"
#include "./mass_flow.hpp"
#include "./normal_shock.hpp"

using std::cerr;
using std::endl;
using std::string;
using std::vector;

namespace {

void CheckAsAc(const double & AsAc, const string & caller) {
  if (!(AsAc > 1.0)) {
    cerr << caller << ": exit to throat area ratio must exceed one" << endl;
    cerr << "AsAc = " << AsAc << endl;
    std::ostringstream msg;
    msg << caller << ": AsAc = " << AsAc << " must exceed 1";
    throw DomainError(msg.str());
  }
}

void CheckNPR(const double & NPR, const string & caller) {
  if (!(NPR > 1.0)) {
    cerr << caller << ": nozzle pressure ratio must exceed one" << endl;
    cerr << "NPR = " << NPR << endl;
    std::ostringstream msg;
    msg << caller << ": NPR = " << NPR << " must exceed 1";
    throw DomainError(msg.str());
  }
}

void CheckSizes(const InnerProdVector & AsAc, const InnerProdVector & NPR,
                const string & caller) {
  if (AsAc.size() != NPR.size()) {
    cerr << caller << ": AsAc.size() is incompatible with NPR.size()"
         << endl;
    cerr << "AsAc.size() = " << AsAc.size() << ": NPR.size() = "
         << NPR.size() << endl;
    throw DomainError(caller + ": size mismatch");
  }
}

} // anonymous namespace

// ======================================================================

std::ostream & operator<<(std::ostream & out, const nozzle_regime & regime) {
  switch (regime) {
    case unchoked:
      out << "unchoked";
      break;
    case internal_shock:
      out << "internal shock";
      break;
    case overexpanded:
      out << "overexpanded";
      break;
    case underexpanded:
      out << "underexpanded";
      break;
  }
  return out;
}

// ======================================================================

RegimeThresholds CalcRegimeThresholds(const double & AsAc,
                                      const double & gamma) {
  CheckGamma(gamma, "NozzleRegime(CalcRegimeThresholds)");
  CheckAsAc(AsAc, "NozzleRegime(CalcRegimeThresholds)");
  RegimeThresholds lim;
  lim.Msub = MachSub_Sigma(AsAc, gamma);
  lim.NPR0 = PtPs_Mach(lim.Msub, gamma);
  lim.Msup = MachSup_Sigma(AsAc, gamma);
  lim.Msh = DownstreamMn(lim.Msup, gamma);
  lim.NPRsw = PtPs_Mach(lim.Msh, gamma)/PiRatio(lim.Msup, gamma);
  lim.NPR1 = PtPs_Mach(lim.Msup, gamma);
  return lim;
}

// ======================================================================

vector<RegimeThresholds> CalcRegimeThresholds(const InnerProdVector & AsAc,
                                              const double & gamma) {
  vector<RegimeThresholds> lims;
  lims.reserve(AsAc.size());
  for (int i = 0; i < AsAc.size(); i++)
    lims.push_back(CalcRegimeThresholds(AsAc(i), gamma));
  return lims;
}

// ======================================================================

double NPR_ChokedSubsonic(const double & AsAc, const double & gamma) {
  CheckAsAc(AsAc, "NozzleRegime(NPR_ChokedSubsonic)");
  return PtPs_Mach(MachSub_Sigma(AsAc, gamma), gamma);
}

// ======================================================================

double NPR_ChokedSupersonic(const double & AsAc, const double & gamma) {
  CheckAsAc(AsAc, "NozzleRegime(NPR_ChokedSupersonic)");
  return PtPs_Mach(MachSup_Sigma(AsAc, gamma), gamma);
}

// ======================================================================

double NPR_ShockAtExit(const double & AsAc, const double & gamma) {
  CheckAsAc(AsAc, "NozzleRegime(NPR_ShockAtExit)");
  double Msup = MachSup_Sigma(AsAc, gamma);
  double Msh = DownstreamMn(Msup, gamma);
  return PtPs_Mach(Msh, gamma)/PiRatio(Msup, gamma);
}

// ======================================================================

nozzle_regime ClassifyRegime(const RegimeThresholds & thresholds,
                             const double & NPR) {
  CheckNPR(NPR, "NozzleRegime(ClassifyRegime)");
  if (NPR < thresholds.NPR0) return unchoked;
  if (NPR <= thresholds.NPRsw) return internal_shock;
  if (NPR <= thresholds.NPR1) return overexpanded;
  return underexpanded;
}

// ======================================================================

double MsInternalShock(const double & AsAc, const double & NPR,
                       const double & gamma) {
  CheckGamma(gamma, "NozzleRegime(MsInternalShock)");
  CheckAsAc(AsAc, "NozzleRegime(MsInternalShock)");
  CheckNPR(NPR, "NozzleRegime(MsInternalShock)");
  double gmu = gamma - 1.0;
  double K = NPR/AsAc/pow(0.5*(gamma + 1.0), 0.5*(gamma + 1.0)/gmu);
  return sqrt((sqrt(1.0 + 2.0*gmu*K*K) - 1.0)/gmu);
}

// ======================================================================

double Ms_From_AsAc_NPR(const double & AsAc, const double & NPR,
                        const double & gamma) {
  CheckNPR(NPR, "NozzleRegime(Ms_From_AsAc_NPR)");
  RegimeThresholds lim = CalcRegimeThresholds(AsAc, gamma);
  switch (ClassifyRegime(lim, NPR)) {
    case unchoked:
      return Mach_PtPs(NPR, gamma);
    case internal_shock:
      return MsInternalShock(AsAc, NPR, gamma);
    default:
      // the nozzle walls fix the exit Mach number once the shock is out
      return lim.Msup;
  }
}

// ======================================================================

double Madapt_From_AsAc_NPR(const double & AsAc, const double & NPR,
                            const double & gamma) {
  CheckNPR(NPR, "NozzleRegime(Madapt_From_AsAc_NPR)");
  RegimeThresholds lim = CalcRegimeThresholds(AsAc, gamma);
  switch (ClassifyRegime(lim, NPR)) {
    case unchoked:
      return Mach_PtPs(NPR, gamma);
    case internal_shock:
      return MsInternalShock(AsAc, NPR, gamma);
    case overexpanded:
      // shock in the jet raises exit pressure Pt/NPR1 to ambient Pt/NPR
      return DownstreamMachShockPsRatio(lim.Msup, lim.NPR1/NPR, gamma);
    case underexpanded:
      return Mach_PtPs(NPR, gamma);
  }
  // not reached: ClassifyRegime returns one of the above
  throw FlowError("NozzleRegime(Madapt_From_AsAc_NPR): unknown regime");
}

// ======================================================================

InnerProdVector Ms_From_AsAc_NPR(const InnerProdVector & AsAc,
                                 const InnerProdVector & NPR,
                                 const double & gamma) {
  CheckSizes(AsAc, NPR, "NozzleRegime(Ms_From_AsAc_NPR)");
  InnerProdVector Ms(AsAc.size(), 0.0);
  for (int i = 0; i < AsAc.size(); i++)
    Ms(i) = Ms_From_AsAc_NPR(AsAc(i), NPR(i), gamma);
  return Ms;
}

// ======================================================================

InnerProdVector Madapt_From_AsAc_NPR(const InnerProdVector & AsAc,
                                     const InnerProdVector & NPR,
                                     const double & gamma) {
  CheckSizes(AsAc, NPR, "NozzleRegime(Madapt_From_AsAc_NPR)");
  InnerProdVector Ms(AsAc.size(), 0.0);
  for (int i = 0; i < AsAc.size(); i++)
    Ms(i) = Madapt_From_AsAc_NPR(AsAc(i), NPR(i), gamma);
  return Ms;
}
