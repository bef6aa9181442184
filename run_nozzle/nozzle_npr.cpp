/**
 * \file nozzle_npr.cpp
 * \brief computes the flow in a converging-diverging nozzle for one NPR
 * \version 1.0
 */

#include <stdlib.h>

#include <ostream>
#include <iostream>
#include <string>

#include "../flow_error.hpp"
#include "../inner_prod_vector.hpp"
#include "../nozzle.hpp"
#include "../nozzle_regime.hpp"

using std::cout;
using std::cerr;
using std::endl;
using std::string;

// geometry parameters
static const int nodes = 81;
static const double length = 10.0;
static const double kGammaAir = 1.4;

double NozzleArea(const double & x);

// ======================================================================

int main(int argc, char *argv[]) {

  if ( (argc < 2) || (argc > 3) ) {
    cerr << "Usage: " << argv[0] << " <NPR> [tecplot file]" << endl;
    return 1;
  }
  char *end;
  double NPR = strtod(argv[1], &end);
  if (*end != '\0') {
    cerr << "Error in nozzle_npr: NPR must be a number, got "
         << argv[1] << endl;
    return 1;
  }
  string filename("nozzle.dat");
  if (argc == 3) filename = argv[2];

  // define the x-coordinates and nozzle area
  InnerProdVector x_coord(nodes, 0.0);
  InnerProdVector area(nodes, 0.0);
  for (int i = 0; i < nodes; i++) {
    x_coord(i) = static_cast<double>(i*length)
        / static_cast<double>(nodes-1);
    area(i) = NozzleArea(x_coord(i));
  }

  try {
    Nozzle nozzle(x_coord, area, 0.0, kGammaAir);
    const RegimeThresholds & lim = nozzle.get_thresholds();
    cout << "As/Ac = " << nozzle.get_AsAc()
         << ": throat at x = " << x_coord(nozzle.get_throat_index()) << endl;
    cout << "NPR0  = " << lim.NPR0 << " (Msub = " << lim.Msub << ")" << endl;
    cout << "NPRsw = " << lim.NPRsw << " (Msh = " << lim.Msh << ")" << endl;
    cout << "NPR1  = " << lim.NPR1 << " (Msup = " << lim.Msup << ")" << endl;

    nozzle.set_NPR(NPR);
    cout << "NPR = " << NPR << ": regime is " << nozzle.get_regime() << endl;
    if (nozzle.get_shock_index() >= 0) {
      cout << "shock located at x = "
           << x_coord(nozzle.get_shock_index()) << endl;
    }
    int last = nodes - 1;
    cout << "exit Mach = " << nozzle.Mach()(last)
         << ": exit Ps/Pt0 = " << nozzle.Ps()(last) << endl;
    nozzle.WriteTecplot(filename);
    cout << "solution written to " << filename << endl;
  } catch (const FlowError & err) {
    cerr << "Error in nozzle_npr: " << err.what() << endl;
    return 2;
  }
  return 0;
}

// ======================================================================

double NozzleArea(const double & x) {
  if (x < 0.5*length) {
    return 1.0 + 1.5*(1.0 - x/5.0)*(1.0 - x/5.0);
  } else {
    return 1.0 + 0.5*(1.0 - x/5.0)*(1.0 - x/5.0);
  }
}
