/**
 * \file nozzle.hpp
 * \brief header file for Nozzle class
 * \version 1.0
 */

#pragma once

#include <math.h>

#include <ostream>
#include <iostream>
#include <string>

#include "./inner_prod_vector.hpp"
#include "./isentropic.hpp"
#include "./nozzle_regime.hpp"

// ======================================================================

/*!
 * \class Nozzle
 * \brief quasi-1d converging-diverging nozzle defined by its section law
 *
 * The nozzle holds the section law, the critical NPR values and, once
 * set_NPR has been called, the Mach number and pressure distributions
 * for that NPR.  Pressures are made nondimensional by the inlet total
 * pressure (times scale_ps) and temperatures by r*Tt (ref_rttot).
 */
class Nozzle {
 public:

  /*!
   * \brief constructor based on a section law
   * \param[in] x_coord - x coordinates of the stations
   * \param[in] section - cross-sectional area at each station
   * \param[in] AsAc - if > 0, forces the exit to throat ratio
   * \param[in] gamma - the heat capacity ratio
   * \param[in] ref_rttot - r*Tt, completes the state for Ts and velocity
   * \param[in] scale_ps - arbitrary scaling of static and total pressure
   */
  Nozzle(const InnerProdVector & x_coord, const InnerProdVector & section,
         const double & AsAc = 0.0, const double & gamma = kGamma,
         const double & ref_rttot = 1.0, const double & scale_ps = 1.0);

  /*!
   * \brief default destructor
   */
  ~Nozzle() {}

  /*!
   * \brief defines the nozzle pressure ratio and computes the flow
   * \param[in] NPR - inlet total pressure over outlet static pressure (> 1)
   *
   * Any previous solution is replaced.  If the solve fails, the
   * previous solution (if any) is left untouched.
   */
  void set_NPR(const double & NPR);

  /*!
   * \brief Mach number at each station
   */
  const InnerProdVector & Mach() const;

  /*!
   * \brief static pressure at each station
   */
  InnerProdVector Ps() const;

  /*!
   * \brief total pressure at each station
   */
  InnerProdVector Ptot() const;

  /*!
   * \brief static temperature times the gas constant at each station
   */
  InnerProdVector Ts() const;

  /*!
   * \brief velocity at each station
   */
  InnerProdVector Velocity() const;

  /*!
   * \brief writes the solution in Tecplot format
   * \param[in] filename - name of the file to write to
   */
  void WriteTecplot(const std::string & filename = "nozzle.dat") const;

  const InnerProdVector & get_x_coord() const { return x_coord_; }
  const InnerProdVector & get_AxAc() const { return AxAc_; }
  double get_AsAc() const { return AsAc_; }
  double get_gamma() const { return gamma_; }
  int get_throat_index() const { return throat_index_; }
  int get_num_nodes() const { return num_nodes_; }
  const RegimeThresholds & get_thresholds() const { return thresholds_; }

  /*!
   * \brief the NPR of the current solution
   */
  double get_NPR() const;

  /*!
   * \brief the regime of the current solution
   */
  nozzle_regime get_regime() const;

  /*!
   * \brief index of the first station downstream of the shock
   * \returns -1 when there is no shock in the nozzle
   */
  int get_shock_index() const;

  /*!
   * \brief true once set_NPR has succeeded
   */
  bool has_solution() const { return solved_; }

 private:

  /*!
   * \brief throws InconsistentStateError if set_NPR has not been called
   * \param[in] caller - name of the calling routine, used in messages
   */
  void CheckSolved(const std::string & caller) const;

  int num_nodes_; ///< number of stations
  int throat_index_; ///< index of the minimum section
  double gamma_; ///< heat capacity ratio
  double AsAc_; ///< exit over throat area ratio
  double ref_rttot_; ///< r*Tt reference
  double scale_ps_; ///< pressure scaling
  InnerProdVector x_coord_; ///< station coordinates
  InnerProdVector AxAc_; ///< local over throat area ratio
  RegimeThresholds thresholds_; ///< critical NPR values

  bool solved_; ///< true once a solution is available
  double NPR_; ///< NPR of the current solution
  nozzle_regime regime_; ///< regime of the current solution
  int shock_index_; ///< first station downstream of the shock, or -1
  InnerProdVector mach_; ///< Mach number
  InnerProdVector ptot_; ///< total pressure (nondimensional)
  InnerProdVector ps_; ///< static pressure (nondimensional)
};
