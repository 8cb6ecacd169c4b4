#include <utility/bezierutility.h>

#include <curves/invalidlengthoptionsexception.h>
#include <utility/mathutility.h>

#include <boost/numeric/conversion/cast.hpp>

#include <cmath>

namespace pathGeom {
namespace bezierUtility {

double quadraticPolynomial( double a, double b, double c, double t )
{
    const double u = 1. - t;
    return u * u * a + 2. * u * t * b + t * t * c;
}

double cubicPolynomial( double a, double b, double c, double d, double t )
{
    const double u = 1. - t;
    return a * u * u * u + 3. * b * t * u * u + 3. * c * u * t * t + d * t * t * t;
}

BoundingIntervald quadraticExtrema( double a, double b, double c )
{
    BoundingIntervald toReturn( a, c );
    const double t = ( b - a ) / ( 2. * b - a - c );
    if( mathUtility::inUnitInterval( t ) ) {
        toReturn.addValue( quadraticPolynomial( a, b, c, t ) );
    }
    return toReturn;
}

std::vector< double > cubicCriticalValues( double a, double b, double c, double d )
{
    // Coefficients of the derivative, a quadratic in T.
    const double qa = 3. * d - 9. * c + 9. * b - 3. * a;
    const double qb = 6. * a - 12. * b + 6. * c;
    const double qc = 3. * ( b - a );

    const double discriminant = qb * qb - 4. * qa * qc;
    if( discriminant < 0. ) {
        return {};
    }

    const double sqrtDiscriminant = std::sqrt( discriminant );
    const double roots[ 2 ] =
    {
        ( -qb + sqrtDiscriminant ) / ( 2. * qa ),
        ( -qb - sqrtDiscriminant ) / ( 2. * qa )
    };

    std::vector< double > toReturn;
    for( const double t : roots ) {
        if( mathUtility::inUnitInterval( t ) ) {
            toReturn.push_back( cubicPolynomial( a, b, c, d, t ) );
        }
    }
    return toReturn;
}

BoundingIntervald cubicExtrema( double a, double b, double c, double d )
{
    BoundingIntervald toReturn( a, d );
    for( const double value : cubicCriticalValues( a, b, c, d ) ) {
        toReturn.addValue( value );
    }
    return toReturn;
}

double resolveLengthStep( const LengthOptions& options, double defaultStep )
{
    const double step = options.step.value_or( defaultStep );
    if( !std::isfinite( step ) || step < LengthOptions::minStep || step > 1. ) {
        throw InvalidLengthOptionsException( "Length step must be finite and in [minStep,1]" );
    }
    return step;
}

size_t numClosedLengthIntervals( double step )
{
    const double exact = 1. / step;
    const double nearest = std::round( exact );
    return boost::numeric_cast< size_t >(
        mathUtility::closeEnough( exact, nearest ) ? nearest : std::ceil( exact ) );
}

} // bezierUtility
} // pathGeom
