/**
 * \file compressible_flow_legacy.hpp
 * \brief older names of the compressible flow relations
 * \version 1.0
 *
 * Inline forwards only; new code should call the functions declared in
 * isentropic.hpp and mass_flow.hpp directly.
 */

#pragma once

#include "./isentropic.hpp"
#include "./mass_flow.hpp"

namespace legacy {

inline double TiTs_Mach(const double & Mach, const double & gamma = kGamma) {
  return ::TtTs_Mach(Mach, gamma);
}

inline double PiPs_Mach(const double & Mach, const double & gamma = kGamma) {
  return ::PtPs_Mach(Mach, gamma);
}

inline double Mach_TiTs(const double & TiTs, const double & gamma = kGamma) {
  return ::Mach_TtTs(TiTs, gamma);
}

inline double Mach_PiPs(const double & PiPs, const double & gamma = kGamma) {
  return ::Mach_PtPs(PiPs, gamma);
}

inline double Sigma_Mach(const double & Mach, const double & gamma = kGamma) {
  return ::Sigma_Mach(Mach, gamma);
}

/*!
 * \brief Mach number for an area ratio, branch selected by a Mach estimate
 * \param[in] sigma - area ratio A/A*
 * \param[in] Mach - estimate; > 1 selects the supersonic branch
 * \param[in] gamma - the heat capacity ratio
 */
inline double Mach_Sigma(const double & sigma, const double & Mach = 2.0,
                         const double & gamma = kGamma) {
  if (Mach > 1.0) return ::MachSup_Sigma(sigma, gamma);
  return ::MachSub_Sigma(sigma, gamma);
}

inline double WeightMassFlow(const double & Mach,
                             const double & r = kGasConstant,
                             const double & gamma = kGamma) {
  return ::WeightMassFlow(Mach, r, gamma);
}

} // namespace legacy
