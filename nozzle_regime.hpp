/**
 * \file nozzle_regime.hpp
 * \brief critical pressure ratios and exit Mach numbers of a nozzle
 * \version 1.0
 */

#pragma once

#include <math.h>

#include <ostream>
#include <vector>

#include "./inner_prod_vector.hpp"
#include "./isentropic.hpp"

/*!
 * \brief flow regimes of a converging-diverging nozzle, by increasing NPR
 */
enum nozzle_regime {
  unchoked = 0,       ///< subsonic everywhere, throat not sonic
  internal_shock = 1, ///< choked, normal shock in the diverging section
  overexpanded = 2,   ///< supersonic exit, shock in the jet
  underexpanded = 3   ///< supersonic exit, jet keeps expanding
};

/*!
 * \brief writes the name of a regime
 */
std::ostream & operator<<(std::ostream & out, const nozzle_regime & regime);

/*!
 * \struct RegimeThresholds
 * \brief critical NPR values of a nozzle and the associated exit Mach numbers
 *
 * The thresholds depend on the exit to throat area ratio and gamma only.
 * For any AsAc > 1, NPR0 < NPRsw < NPR1.
 */
struct RegimeThresholds {
  double NPR0;  ///< largest NPR with a fully subsonic, choked nozzle
  double NPRsw; ///< NPR with a normal shock standing at the exit
  double NPR1;  ///< NPR of the shock-free, pressure-adapted nozzle
  double Msub;  ///< subsonic exit Mach number at NPR0
  double Msh;   ///< Mach number downstream of the exit shock at NPRsw
  double Msup;  ///< supersonic exit Mach number for NPR >= NPRsw
};

/*!
 * \brief computes all NPR limits and associated exit Mach numbers
 * \param[in] AsAc - ratio of section at exit over throat (> 1)
 * \param[in] gamma - the heat capacity ratio
 * \returns the thresholds
 */
RegimeThresholds CalcRegimeThresholds(const double & AsAc,
                                      const double & gamma = kGamma);

/*!
 * \brief element-wise version of CalcRegimeThresholds
 * \param[in] AsAc - ratios of section at exit over throat
 * \param[in] gamma - the heat capacity ratio
 * \returns one set of thresholds per entry of AsAc
 */
std::vector<RegimeThresholds> CalcRegimeThresholds(
    const InnerProdVector & AsAc, const double & gamma = kGamma);

/*!
 * \brief NPR giving a choked but subsonic nozzle
 * \param[in] AsAc - ratio of section at exit over throat (> 1)
 * \param[in] gamma - the heat capacity ratio
 */
double NPR_ChokedSubsonic(const double & AsAc, const double & gamma = kGamma);

/*!
 * \brief NPR giving a choked, shock-free supersonic nozzle
 * \param[in] AsAc - ratio of section at exit over throat (> 1)
 * \param[in] gamma - the heat capacity ratio
 */
double NPR_ChokedSupersonic(const double & AsAc,
                            const double & gamma = kGamma);

/*!
 * \brief NPR giving a normal shock exactly at the nozzle exit
 * \param[in] AsAc - ratio of section at exit over throat (> 1)
 * \param[in] gamma - the heat capacity ratio
 */
double NPR_ShockAtExit(const double & AsAc, const double & gamma = kGamma);

/*!
 * \brief finds the regime of a nozzle for a given NPR
 * \param[in] thresholds - critical NPR values of the nozzle
 * \param[in] NPR - nozzle pressure ratio
 *
 * Boundaries are closed on the low-NPR side of each regime except the
 * first: NPR == NPR0 and NPR == NPRsw are internal_shock, NPR == NPR1
 * is overexpanded.
 */
nozzle_regime ClassifyRegime(const RegimeThresholds & thresholds,
                             const double & NPR);

/*!
 * \brief exit Mach number for a shock standing inside the diverging section
 * \param[in] AsAc - ratio of section at exit over throat (> 1)
 * \param[in] NPR - nozzle pressure ratio
 * \param[in] gamma - the heat capacity ratio
 *
 * Closed-form solution of the subsonic mass flow relation at the exit,
 * written in terms of NPR; it does not check the regime.
 */
double MsInternalShock(const double & AsAc, const double & NPR,
                       const double & gamma = kGamma);

/*!
 * \brief Mach number at the exit of a nozzle for given AsAc and NPR
 * \param[in] AsAc - ratio of section at exit over throat (> 1)
 * \param[in] NPR - ratio of inlet total pressure over exit static pressure
 * \param[in] gamma - the heat capacity ratio
 * \returns the Mach number at the exit plane
 */
double Ms_From_AsAc_NPR(const double & AsAc, const double & NPR,
                        const double & gamma = kGamma);

/*!
 * \brief Mach number of the pressure-adapted jet of a nozzle
 * \param[in] AsAc - ratio of section at exit over throat (> 1)
 * \param[in] NPR - ratio of inlet total pressure over ambient pressure
 * \param[in] gamma - the heat capacity ratio
 * \returns the Mach number once the jet has adapted to ambient pressure
 *
 * The difference with Ms_From_AsAc_NPR is for NPR > NPRsw, where the
 * jet either crosses a shock outside the nozzle (NPR <= NPR1) or keeps
 * expanding (NPR > NPR1).
 */
double Madapt_From_AsAc_NPR(const double & AsAc, const double & NPR,
                            const double & gamma = kGamma);

// element-wise versions, AsAc and NPR must have the same size

InnerProdVector Ms_From_AsAc_NPR(const InnerProdVector & AsAc,
                                 const InnerProdVector & NPR,
                                 const double & gamma = kGamma);
InnerProdVector Madapt_From_AsAc_NPR(const InnerProdVector & AsAc,
                                     const InnerProdVector & NPR,
                                     const double & gamma = kGamma);
