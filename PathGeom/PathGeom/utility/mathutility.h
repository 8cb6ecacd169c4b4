#ifndef PATHGEOM_MATHUTILITY_H
#define PATHGEOM_MATHUTILITY_H

namespace pathGeom {
namespace mathUtility {

const double defaultEpsilon = 1e-8;

template< typename T >
T lerp( const T& a, const T& b, double t )
{
    return a + ( b - a ) * t;
}

bool closeEnough( double a, double b, double epsilon = defaultEpsilon );
bool closeEnoughToZero( double a, double epsilon = defaultEpsilon );

/// Return whether 't' is in [0,1]. NaN and the infinities are never in it.
bool inUnitInterval( double t );

} // mathUtility
} // pathGeom

#endif // #include guard
