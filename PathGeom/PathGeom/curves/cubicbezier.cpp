#include <curves/cubicbezier.h>

#include <utility/bezierutility.h>

namespace pathGeom {

CubicBezier::CubicBezier()
{
}

CubicBezier::CubicBezier( const Vector2& start, const Vector2& control1, const Vector2& control2, const Vector2& end )
    : _start( start )
    , _control1( control1 )
    , _control2( control2 )
    , _end( end )
{
}

Vector2 CubicBezier::position( double t ) const
{
    return Vector2(
        bezierUtility::cubicPolynomial( _start.x(), _control1.x(), _control2.x(), _end.x(), t ),
        bezierUtility::cubicPolynomial( _start.y(), _control1.y(), _control2.y(), _end.y(), t ) );
}

BoundingBoxd CubicBezier::boundingBox() const
{
    return BoundingBoxd(
        bezierUtility::cubicExtrema( _start.x(), _control1.x(), _control2.x(), _end.x() ),
        bezierUtility::cubicExtrema( _start.y(), _control1.y(), _control2.y(), _end.y() ) );
}

double CubicBezier::length() const
{
    return length( LengthOptions() );
}

double CubicBezier::length( const LengthOptions& options ) const
{
    return bezierUtility::polylineLength(
        [ this ]( double t )
        {
            return position( t );
        },
        options,
        defaultLengthStep );
}

const Vector2& CubicBezier::startPosition() const
{
    return _start;
}

const Vector2& CubicBezier::control1() const
{
    return _control1;
}

const Vector2& CubicBezier::control2() const
{
    return _control2;
}

const Vector2& CubicBezier::endPosition() const
{
    return _end;
}

CubicBezier::Control CubicBezier::controlPoints() const
{
    return { _start, _control1, _control2, _end };
}

CubicBezier CubicBezier::reverseCopy() const
{
    return CubicBezier( _end, _control2, _control1, _start );
}

bool CubicBezier::operator == ( const CubicBezier& other ) const
{
    return _start == other._start
        && _control1 == other._control1
        && _control2 == other._control2
        && _end == other._end;
}

bool CubicBezier::operator != ( const CubicBezier& other ) const
{
    return !( *this == other );
}

} // pathGeom
