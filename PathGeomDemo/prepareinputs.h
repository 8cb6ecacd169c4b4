#ifndef PATHGEOMDEMO_PREPAREINPUTS_H
#define PATHGEOMDEMO_PREPAREINPUTS_H

#include <demoinputs.h>

namespace pathGeomDemo {

/// A single quadratic arch with an interior Y-extremum.
DemoInputs prepareScenario_arch();
/// A single S-shaped cubic with two interior extrema.
DemoInputs prepareScenario_wave();
/// A closed outline mixing all three segment kinds.
DemoInputs prepareScenario_outline();
/// Curves whose extremum formulas divide by zero.
DemoInputs prepareScenario_degenerate();

} // pathGeomDemo

#endif // #include
