/**
 * \file mass_flow.hpp
 * \brief area-Mach (mass flow) relations and their two inverse branches
 * \version 1.0
 */

#pragma once

#include <math.h>

#include <boost/math/tools/roots.hpp>

#include "./inner_prod_vector.hpp"
#include "./isentropic.hpp"

const double kGasConstant = 287.1; ///< gas constant of air, J/(kg K)

/*!
 * \class MachRelation
 * \brief residual of the area-Mach relation, for use with Newton's method
 */
template <class T>
class MachRelation {
 public:

  /*!
   * \brief constructor for class
   * \param[in] gam - the heat capacity ratio
   * \param[in] sigma - target area ratio A/A*
   */
  MachRelation(const T & gam, const T & sigma) :
      gamma(gam), AxAc(sigma) {}

  /*!
   * \brief returns a tuple containing the function and its derivative
   * \param[in] M - the current estimate for the Mach number
   * \result the value of the Mach relation and its derivative at M
   */
  boost::math::tuple<T, T> operator()(const T & M) {
    T fun = (1.0/M)*pow((2.0/(gamma + 1.0))
                        *(1.0 + ((gamma - 1.0)/2.0)*M*M),
                        (gamma + 1.0)/(2.0*(gamma - 1.0))) - AxAc;
    T dfun = -(fun + AxAc)/M
        + pow((2.0/(gamma + 1.0))*(1.0 + ((gamma - 1.0)/2.0)*M*M),
              (3.0 - gamma)/(2.0*(gamma - 1.0)));
    return boost::math::make_tuple(fun, dfun);
  }

 private:
  T gamma; ///< value of the heat capcity ratio
  T AxAc; ///< area ratio at the location of interest
};

/*!
 * \brief area ratio A/A* as a function of Mach number
 * \param[in] Mach - local Mach number (> 0)
 * \param[in] gamma - the heat capacity ratio
 * \returns the section ratio sigma = A/A*
 */
double Sigma_Mach(const double & Mach, const double & gamma = kGamma);

/*!
 * \brief subsonic Mach number for a given area ratio
 * \param[in] sigma - area ratio A/A* (>= 1)
 * \param[in] gamma - the heat capacity ratio
 * \returns Mach number in (0, 1]
 */
double MachSub_Sigma(const double & sigma, const double & gamma = kGamma);

/*!
 * \brief supersonic Mach number for a given area ratio
 * \param[in] sigma - area ratio A/A* (>= 1)
 * \param[in] gamma - the heat capacity ratio
 * \returns Mach number >= 1
 */
double MachSup_Sigma(const double & sigma, const double & gamma = kGamma);

/*!
 * \brief reduced mass flow, mdot*sqrt(Tt)/(Pt*A)
 * \param[in] Mach - local Mach number
 * \param[in] r - gas constant
 * \param[in] gamma - the heat capacity ratio
 */
double WeightMassFlow(const double & Mach, const double & r = kGasConstant,
                      const double & gamma = kGamma);

// element-wise versions of the above

InnerProdVector Sigma_Mach(const InnerProdVector & Mach,
                           const double & gamma = kGamma);
InnerProdVector MachSub_Sigma(const InnerProdVector & sigma,
                              const double & gamma = kGamma);
InnerProdVector MachSup_Sigma(const InnerProdVector & sigma,
                              const double & gamma = kGamma);
InnerProdVector WeightMassFlow(const InnerProdVector & Mach,
                               const double & r = kGasConstant,
                               const double & gamma = kGamma);
