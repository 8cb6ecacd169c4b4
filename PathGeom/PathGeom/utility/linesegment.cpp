#include <utility/linesegment.h>
#include <utility/mathutility.h>

namespace pathGeom {

LineSegment::LineSegment()
{
}

LineSegment::LineSegment( const Vector2& aArg, const Vector2& bArg ) : a( aArg ), b( bArg )
{
}

LineSegment LineSegment::reverse() const
{
    return { b, a };
}

Vector2 LineSegment::position( double t ) const
{
    return mathUtility::lerp< Vector2 >( a, b, t );
}

Vector2 LineSegment::asVec() const
{
    return b - a;
}

double LineSegment::length() const
{
    return ( b - a ).length();
}

Vector2 LineSegment::midpoint() const
{
    return ( a + b ) * 0.5;
}

BoundingBoxd LineSegment::boundingBox() const
{
    return { a, b };
}

const Vector2& LineSegment::startPosition() const
{
    return a;
}

const Vector2& LineSegment::endPosition() const
{
    return b;
}

} // pathGeom
