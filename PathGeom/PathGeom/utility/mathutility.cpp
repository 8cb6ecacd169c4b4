#include <utility/mathutility.h>

#include <cmath>

namespace pathGeom {
namespace mathUtility {

bool closeEnough( double a, double b, double epsilon )
{
    return std::fabs( a - b ) <= epsilon;
}

bool closeEnoughToZero( double a, double epsilon )
{
    return closeEnough( a, 0., epsilon );
}

bool inUnitInterval( double t )
{
    return t >= 0. && t <= 1.;
}

} // mathUtility
} // pathGeom
