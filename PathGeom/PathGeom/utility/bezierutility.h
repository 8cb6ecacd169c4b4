#ifndef PATHGEOM_BEZIERUTILITY_H
#define PATHGEOM_BEZIERUTILITY_H

#include <PathGeom/curves/lengthoptions.h>
#include <PathGeom/utility/boundinginterval.h>
#include <PathGeom/utility/linesegment.h>
#include <PathGeom/utility/vector2.h>

#include <algorithm>
#include <cstddef>
#include <vector>

namespace pathGeom {
namespace bezierUtility {

// The single-coordinate functions below take the curve's control values along one axis,
// in order from start to end.

double quadraticPolynomial( double a, double b, double c, double t );
double cubicPolynomial( double a, double b, double c, double d, double t );

/// Range of the quadratic over T in [0,1]: the endpoint values, plus the value at the
/// derivative's root T = (b-a)/(2b-a-c) if that root is in [0,1]. A zero denominator gives a
/// non-finite root, which is never in [0,1].
BoundingIntervald quadraticExtrema( double a, double b, double c );

/// Return the cubic's values at the real roots of its derivative that fall in [0,1] (zero, one, or two
/// values). The derivative is solved with the plain quadratic formula, so when its leading coefficient
/// is 0 both roots come out non-finite and nothing is returned.
std::vector< double > cubicCriticalValues( double a, double b, double c, double d );

/// The endpoint values folded together with cubicCriticalValues.
BoundingIntervald cubicExtrema( double a, double b, double c, double d );

/// Return the step to use for 'options' given a curve's 'defaultStep'.
/// Throws 'InvalidLengthOptionsException' if the step is not finite or not in [LengthOptions::minStep,1].
double resolveLengthStep( const LengthOptions& options, double defaultStep );

/// Number of intervals used when 'closeFinalInterval' is set. 'step' must be valid.
size_t numClosedLengthIntervals( double step );

/// Approximate the length of the curve traced by 'pos' (T -> Vector2) with a polyline.
/// Throws 'InvalidLengthOptionsException'.
template< typename PosFunctor >
double polylineLength( const PosFunctor& pos, const LengthOptions& options, double defaultStep )
{
    const double step = resolveLengthStep( options, defaultStep );

    double length = 0.;
    if( options.closeFinalInterval ) {
        const size_t numIntervals = numClosedLengthIntervals( step );
        Vector2 prev = pos( 0. );
        for( size_t i = 1; i <= numIntervals; i++ ) {
            const Vector2 next = pos( std::min( 1., step * static_cast< double >( i ) ) );
            length += LineSegment( prev, next ).length();
            prev = next;
        }
    } else {
        for( double t = 0.; t < 1.; t += step ) {
            length += LineSegment( pos( t ), pos( t + step ) ).length();
        }
    }
    return length;
}

} // bezierUtility
} // pathGeom

#endif // #include guard
