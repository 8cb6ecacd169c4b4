#include <curves/quadraticbezier.h>

#include <curves/cubicbezier.h>
#include <utility/bezierutility.h>

namespace pathGeom {

QuadraticBezier::QuadraticBezier()
{
}

QuadraticBezier::QuadraticBezier( const Vector2& start, const Vector2& control, const Vector2& end )
    : _start( start )
    , _control( control )
    , _end( end )
{
}

Vector2 QuadraticBezier::position( double t ) const
{
    return Vector2(
        bezierUtility::quadraticPolynomial( _start.x(), _control.x(), _end.x(), t ),
        bezierUtility::quadraticPolynomial( _start.y(), _control.y(), _end.y(), t ) );
}

BoundingBoxd QuadraticBezier::boundingBox() const
{
    return BoundingBoxd(
        bezierUtility::quadraticExtrema( _start.x(), _control.x(), _end.x() ),
        bezierUtility::quadraticExtrema( _start.y(), _control.y(), _end.y() ) );
}

double QuadraticBezier::length() const
{
    return length( LengthOptions() );
}

double QuadraticBezier::length( const LengthOptions& options ) const
{
    return bezierUtility::polylineLength(
        [ this ]( double t )
        {
            return position( t );
        },
        options,
        defaultLengthStep );
}

const Vector2& QuadraticBezier::startPosition() const
{
    return _start;
}

const Vector2& QuadraticBezier::control() const
{
    return _control;
}

const Vector2& QuadraticBezier::endPosition() const
{
    return _end;
}

QuadraticBezier QuadraticBezier::reverseCopy() const
{
    return QuadraticBezier( _end, _control, _start );
}

CubicBezier QuadraticBezier::toCubic() const
{
    const double twoThirds = 2. / 3.;
    return CubicBezier(
        _start,
        _start + ( _control - _start ) * twoThirds,
        _end + ( _control - _end ) * twoThirds,
        _end );
}

bool QuadraticBezier::operator == ( const QuadraticBezier& other ) const
{
    return _start == other._start && _control == other._control && _end == other._end;
}

bool QuadraticBezier::operator != ( const QuadraticBezier& other ) const
{
    return !( *this == other );
}

} // pathGeom
