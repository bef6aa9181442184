/**
 * \file normal_shock.hpp
 * \brief normal and oblique shock relations for a perfect gas
 * \version 1.0
 */

#pragma once

#include <math.h>

#include "./inner_prod_vector.hpp"
#include "./isentropic.hpp"

/*!
 * \brief Mach number normal to and downstream of a shock
 * \param[in] Mn - upstream normal Mach number (>= 1)
 * \param[in] gamma - the heat capacity ratio
 * \returns the downstream normal Mach number (<= 1)
 */
double DownstreamMn(const double & Mn, const double & gamma = kGamma);

/*!
 * \brief static pressure jump Ps2/Ps1 across a shock
 * \param[in] Mn - upstream normal Mach number (>= 1)
 * \param[in] gamma - the heat capacity ratio
 */
double PsRatio(const double & Mn, const double & gamma = kGamma);

/*!
 * \brief total pressure ratio Pt2/Pt1 across a shock
 * \param[in] Mn - upstream normal Mach number (>= 1)
 * \param[in] gamma - the heat capacity ratio
 * \returns the total pressure ratio, in (0, 1]
 */
double PiRatio(const double & Mn, const double & gamma = kGamma);

/*!
 * \brief upstream normal Mach number from the total pressure ratio
 * \param[in] pi - total pressure ratio Pt2/Pt1, in (0, 1]
 * \param[in] gamma - the heat capacity ratio
 * \returns upstream normal Mach number (>= 1)
 */
double Mn_PiRatio(const double & pi, const double & gamma = kGamma);

/*!
 * \brief upstream normal Mach number from the static pressure jump
 * \param[in] ps_ratio - static pressure ratio Ps2/Ps1 (>= 1)
 * \param[in] gamma - the heat capacity ratio
 * \returns upstream normal Mach number (>= 1)
 */
double Mn_PsRatio(const double & ps_ratio, const double & gamma = kGamma);

/*!
 * \brief flow deflection through an oblique shock
 * \param[in] Mach - upstream Mach number
 * \param[in] sigma - shock angle relative to the upstream flow (radians)
 * \param[in] gamma - the heat capacity ratio
 * \returns deflection angle (radians)
 */
double DeflectionMachSigma(const double & Mach, const double & sigma,
                           const double & gamma = kGamma);

/*!
 * \brief Mach number downstream of an oblique shock of given strength
 * \param[in] Mach - upstream Mach number (>= 1)
 * \param[in] ps_ratio - static pressure ratio Ps2/Ps1 imposed by the shock
 * \param[in] gamma - the heat capacity ratio
 * \returns the Mach number downstream of the shock
 *
 * A ratio of one returns Mach (a Mach wave); the largest admissible
 * ratio is that of a normal shock at Mach, which returns DownstreamMn.
 */
double DownstreamMachShockPsRatio(const double & Mach, const double & ps_ratio,
                                  const double & gamma = kGamma);

// element-wise versions

InnerProdVector DownstreamMn(const InnerProdVector & Mn,
                             const double & gamma = kGamma);
InnerProdVector PsRatio(const InnerProdVector & Mn,
                        const double & gamma = kGamma);
InnerProdVector PiRatio(const InnerProdVector & Mn,
                        const double & gamma = kGamma);
InnerProdVector Mn_PiRatio(const InnerProdVector & pi,
                           const double & gamma = kGamma);
InnerProdVector DownstreamMachShockPsRatio(const InnerProdVector & Mach,
                                           const InnerProdVector & ps_ratio,
                                           const double & gamma = kGamma);
