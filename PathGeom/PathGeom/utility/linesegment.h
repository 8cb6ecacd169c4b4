#ifndef PATHGEOM_LINESEGMENT_H
#define PATHGEOM_LINESEGMENT_H

#include <PathGeom/utility/boundingbox.h>
#include <PathGeom/utility/vector2.h>

namespace pathGeom {

struct LineSegment
{
    Vector2 a;
    Vector2 b;

    LineSegment();
    LineSegment( const Vector2&, const Vector2& );

    BoundingBoxd boundingBox() const;
    LineSegment reverse() const;
    Vector2 asVec() const;
    /// Euclidean distance from 'a' to 'b'.
    double length() const;
    Vector2 midpoint() const;

    /// 't' should be in [0,1].
    Vector2 position( double t ) const;

    const Vector2& startPosition() const;
    const Vector2& endPosition() const;
};

} // pathGeom

#endif // #include guard
