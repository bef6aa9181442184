/**
 * \file isentropic.hpp
 * \brief isentropic total-to-static relations for a perfect gas
 * \version 1.0
 */

#pragma once

#include <math.h>

#include <string>

#include "./inner_prod_vector.hpp"

const double kGamma = 1.4; ///< default specific heat ratio

/*!
 * \brief checks that gamma is a valid specific heat ratio (> 1)
 * \param[in] gamma - the heat capacity ratio
 * \param[in] caller - name of the calling routine, used in messages
 */
void CheckGamma(const double & gamma, const std::string & caller);

/*!
 * \brief total to static temperature ratio
 * \param[in] Mach - local Mach number (>= 0)
 * \param[in] gamma - the heat capacity ratio
 * \returns Tt/Ts
 */
double TtTs_Mach(const double & Mach, const double & gamma = kGamma);

/*!
 * \brief total to static pressure ratio
 * \param[in] Mach - local Mach number (>= 0)
 * \param[in] gamma - the heat capacity ratio
 * \returns Pt/Ps
 */
double PtPs_Mach(const double & Mach, const double & gamma = kGamma);

/*!
 * \brief total to static density ratio
 * \param[in] Mach - local Mach number (>= 0)
 * \param[in] gamma - the heat capacity ratio
 * \returns rho_t/rho_s
 */
double RhotRhos_Mach(const double & Mach, const double & gamma = kGamma);

/*!
 * \brief Mach number from the total to static temperature ratio
 * \param[in] TtTs - temperature ratio (>= 1)
 * \param[in] gamma - the heat capacity ratio
 * \returns the Mach number
 */
double Mach_TtTs(const double & TtTs, const double & gamma = kGamma);

/*!
 * \brief Mach number from the total to static pressure ratio
 * \param[in] PtPs - pressure ratio (>= 1)
 * \param[in] gamma - the heat capacity ratio
 * \returns the Mach number
 */
double Mach_PtPs(const double & PtPs, const double & gamma = kGamma);

// element-wise versions of the above

InnerProdVector TtTs_Mach(const InnerProdVector & Mach,
                          const double & gamma = kGamma);
InnerProdVector PtPs_Mach(const InnerProdVector & Mach,
                          const double & gamma = kGamma);
InnerProdVector RhotRhos_Mach(const InnerProdVector & Mach,
                              const double & gamma = kGamma);
InnerProdVector Mach_TtTs(const InnerProdVector & TtTs,
                          const double & gamma = kGamma);
InnerProdVector Mach_PtPs(const InnerProdVector & PtPs,
                          const double & gamma = kGamma);
