/**
 * \file nozzle.cpp
 * \brief function defintions for Nozzle member functions
 * \version 1.0
 */

#include "./nozzle.hpp"

#include <math.h>

#include <ostream>
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <algorithm>

#include "./flow_error.hpp"
#include "./inner_prod_vector.hpp"
#include "./isentropic.hpp"
#include "./mass_flow.hpp"
#include "./normal_shock.hpp"
#include "./nozzle_regime.hpp"

using std::cerr;
using std::endl;
using std::max;
using std::string;
using std::ofstream;

// ======================================================================

Nozzle::Nozzle(const InnerProdVector & x_coord,
               const InnerProdVector & section, const double & AsAc,
               const double & gamma, const double & ref_rttot,
               const double & scale_ps) {
  CheckGamma(gamma, "Nozzle(constructor)");
  num_nodes_ = section.size();
  if (num_nodes_ < 2) {
    cerr << "Nozzle(constructor): section law needs at least two stations"
         << endl;
    cerr << "section.size() = " << num_nodes_ << endl;
    throw DomainError("Nozzle(constructor): too few stations");
  }
  if (x_coord.size() != section.size()) {
    cerr << "Nozzle(constructor): "
         << "x_coord.size() is incompatible with section.size()" << endl;
    cerr << "x_coord.size() = " << x_coord.size()
         << ": section.size() = " << section.size() << endl;
    throw DomainError("Nozzle(constructor): size mismatch");
  }
  for (int i = 0; i < num_nodes_; i++) {
    if (!(section(i) > 0.0)) {
      cerr << "Nozzle(constructor): invalid section" << endl;
      cerr << "section(" << i << ") = " << section(i) << endl;
      throw DomainError("Nozzle(constructor): sections must be positive");
    }
  }
  if ( (ref_rttot <= 0.0) || (scale_ps <= 0.0) ) {
    cerr << "Nozzle(constructor): invalid reference state" << endl;
    cerr << "ref_rttot = " << ref_rttot
         << ": scale_ps = " << scale_ps << endl;
    throw DomainError("Nozzle(constructor): reference values must be "
                      "positive");
  }

  gamma_ = gamma;
  ref_rttot_ = ref_rttot;
  scale_ps_ = scale_ps;
  x_coord_ = x_coord;
  throat_index_ = section.ArgMin();
  int last = num_nodes_ - 1;
  if (throat_index_ == last) {
    cerr << "Nozzle(constructor): minimum section is at the exit" << endl;
    throw DomainError("Nozzle(constructor): no diverging section");
  }
  if (AsAc > 0.0) {
    AsAc_ = AsAc;
  } else {
    AsAc_ = section(last)/section(throat_index_);
  }
  AxAc_ = section*(AsAc_/section(last));
  if (AxAc_(throat_index_) < 1.0 - 1.E-12) {
    cerr << "Nozzle(constructor): forced AsAc gives a throat ratio below one"
         << endl;
    cerr << "AsAc = " << AsAc_ << ": AxAc(throat) = "
         << AxAc_(throat_index_) << endl;
    throw DomainError("Nozzle(constructor): AsAc is inconsistent with "
                      "the section law");
  }
  thresholds_ = CalcRegimeThresholds(AsAc_, gamma_);

  solved_ = false;
  NPR_ = 0.0;
  regime_ = unchoked;
  shock_index_ = -1;
}

// ======================================================================

void Nozzle::set_NPR(const double & NPR) {
  if (!(NPR > 1.0)) {
    cerr << "Nozzle(set_NPR): nozzle pressure ratio must exceed one" << endl;
    cerr << "NPR = " << NPR << endl;
    std::ostringstream msg;
    msg << "Nozzle(set_NPR): NPR = " << NPR << " must exceed 1";
    throw DomainError(msg.str());
  }
  // work on local copies so a failure leaves the previous solution intact
  InnerProdVector mach(num_nodes_, 1.0);
  InnerProdVector ptot(num_nodes_, 1.0);
  nozzle_regime regime = ClassifyRegime(thresholds_, NPR);
  int ish = -1;

  if (regime == unchoked) {
    // not choked: scale the section law so the exit matches Mach_PtPs(NPR)
    double Ms = Mach_PtPs(NPR, gamma_);
    mach = MachSub_Sigma(AxAc_*(Sigma_Mach(Ms, gamma_)/AsAc_), gamma_);
  } else {
    int ndiv = throat_index_ + 1;
    mach.SetSlice(0, MachSub_Sigma(AxAc_.Slice(0, ndiv), gamma_));
    mach.SetSlice(ndiv, MachSup_Sigma(AxAc_.Slice(ndiv, num_nodes_),
                                      gamma_));
    if (regime == internal_shock) {
      // exit Mach number, total pressure loss and upstream shock Mach;
      // at NPRsw the shock stands on the exit station
      double Ms = MsInternalShock(AsAc_, NPR, gamma_);
      double Ptloss = PtPs_Mach(Ms, gamma_)/NPR;
      double Msh = Mn_PiRatio(Ptloss, gamma_);
      // shock sits at the diverging station whose Mach is closest to Msh
      ish = mach.ArgNearest(Msh, ndiv, num_nodes_);
      InnerProdVector sigma = AxAc_.Slice(ish, num_nodes_)
          *(Sigma_Mach(Ms, gamma_)/AsAc_);
      // placing the shock on a station can leave the first downstream
      // ratio marginally below one
      for (int i = 0; i < sigma.size(); i++)
        sigma(i) = max(sigma(i), 1.0);
      mach.SetSlice(ish, MachSub_Sigma(sigma, gamma_));
      for (int i = ish; i < num_nodes_; i++)
        ptot(i) = Ptloss;
    }
  }
  InnerProdVector ps(num_nodes_, 0.0);
  InnerProdVector ptps = PtPs_Mach(mach, gamma_);
  for (int i = 0; i < num_nodes_; i++)
    ps(i) = ptot(i)/ptps(i);

  mach_ = mach;
  ptot_ = ptot;
  ps_ = ps;
  NPR_ = NPR;
  regime_ = regime;
  shock_index_ = ish;
  solved_ = true;
}

// ======================================================================

void Nozzle::CheckSolved(const string & caller) const {
  if (!solved_) {
    cerr << "Nozzle(" << caller << "): no solution available, "
         << "set_NPR must be called first" << endl;
    throw InconsistentStateError("Nozzle(" + caller + "): set_NPR has "
                                 "not been called");
  }
}

// ======================================================================

const InnerProdVector & Nozzle::Mach() const {
  CheckSolved("Mach");
  return mach_;
}

// ======================================================================

InnerProdVector Nozzle::Ps() const {
  CheckSolved("Ps");
  return ps_*scale_ps_;
}

// ======================================================================

InnerProdVector Nozzle::Ptot() const {
  CheckSolved("Ptot");
  return ptot_*scale_ps_;
}

// ======================================================================

InnerProdVector Nozzle::Ts() const {
  CheckSolved("Ts");
  InnerProdVector ttts = TtTs_Mach(mach_, gamma_);
  InnerProdVector rts(num_nodes_, 0.0);
  for (int i = 0; i < num_nodes_; i++)
    rts(i) = ref_rttot_/ttts(i);
  return rts;
}

// ======================================================================

InnerProdVector Nozzle::Velocity() const {
  CheckSolved("Velocity");
  InnerProdVector rts = Ts();
  InnerProdVector vel(num_nodes_, 0.0);
  for (int i = 0; i < num_nodes_; i++)
    vel(i) = mach_(i)*sqrt(gamma_*rts(i));
  return vel;
}

// ======================================================================

double Nozzle::get_NPR() const {
  CheckSolved("get_NPR");
  return NPR_;
}

// ======================================================================

nozzle_regime Nozzle::get_regime() const {
  CheckSolved("get_regime");
  return regime_;
}

// ======================================================================

int Nozzle::get_shock_index() const {
  CheckSolved("get_shock_index");
  return shock_index_;
}

// ======================================================================

void Nozzle::WriteTecplot(const string & filename) const {
  CheckSolved("WriteTecplot");
  ofstream fout(filename.c_str());
  if (!fout.is_open()) {
    cerr << "Nozzle(WriteTecplot): could not open " << filename << endl;
    throw FlowError("Nozzle(WriteTecplot): could not open " + filename);
  }
  InnerProdVector ps = Ps();
  InnerProdVector ptot = Ptot();
  InnerProdVector rts = Ts();
  InnerProdVector vel = Velocity();
  fout.precision(12);
  fout << "TITLE = \"Quasi-1D Nozzle Solution, NPR = " << NPR_ << " ("
       << regime_ << ")\"" << endl;
  fout << "VARIABLES=\"x\",\"AxAc\",\"Mach\",\"Ps\",\"Ptot\""
       << ",\"rTs\",\"u\"" << endl;
  fout << "ZONE I=" << num_nodes_ << ", DATAPACKING=POINT" << endl;
  for (int i = 0; i < num_nodes_; i++) {
    fout << x_coord_(i) << " ";
    fout << AxAc_(i) << " ";
    fout << mach_(i) << " ";
    fout << ps(i) << " ";
    fout << ptot(i) << " ";
    fout << rts(i) << " ";
    fout << vel(i) << " ";
    fout << endl;
  }
  fout.close();
}
