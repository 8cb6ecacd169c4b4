#ifndef PATHGEOM_MODEL_SEGMENT_H
#define PATHGEOM_MODEL_SEGMENT_H

#include <PathGeom/curves/cubicbezier.h>
#include <PathGeom/curves/lengthoptions.h>
#include <PathGeom/curves/quadraticbezier.h>
#include <PathGeom/utility/boundingbox.h>
#include <PathGeom/utility/linesegment.h>
#include <PathGeom/utility/vector2.h>

#include <boost/variant.hpp>

namespace pathGeom {
namespace model {

/// One piece of a path. The three kinds share a capability set (position, bounds, length, endpoints)
/// but no base class; the free functions below dispatch on the active kind.
using Segment = boost::variant< LineSegment, QuadraticBezier, CubicBezier >;

enum class SegmentType
{
    Line,
    Quadratic,
    Cubic
};

SegmentType segmentType( const Segment& );
const char* segmentTypeName( SegmentType );

Vector2 position( const Segment&, double t );
BoundingBoxd boundingBox( const Segment& );
/// Lines are measured exactly; curves use their polyline approximation.
double length( const Segment& );
/// 'LengthOptions' only affects curves. Throws 'InvalidLengthOptionsException'.
double length( const Segment&, const LengthOptions& );
Vector2 startPosition( const Segment& );
Vector2 endPosition( const Segment& );
Segment reverseCopy( const Segment& );

} // model
} // pathGeom

#endif // #include
