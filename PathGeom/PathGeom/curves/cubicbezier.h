#ifndef PATHGEOM_CURVES_CUBICBEZIER_H
#define PATHGEOM_CURVES_CUBICBEZIER_H

#include <PathGeom/curves/lengthoptions.h>
#include <PathGeom/utility/boundingbox.h>
#include <PathGeom/utility/vector2.h>

#include <array>

namespace pathGeom {

/// A degree-3 Bezier curve. The object is an immutable value; T ranges from 0 (start) to 1 (end).
class CubicBezier
{
public:
    using Control = std::array< Vector2, 4 >;

    CubicBezier();
    CubicBezier( const Vector2& start, const Vector2& control1, const Vector2& control2, const Vector2& end );

    /// Any 't' is accepted; values outside [0,1] extrapolate the polynomial.
    Vector2 position( double t ) const;

    /// Seeded by the endpoints, then extended by the curve's values at the roots of each
    /// coordinate's derivative that lie in [0,1]. The roots come from the unguarded quadratic formula:
    /// if the derivative's leading coefficient is 0 for an axis, that axis gets no interior extremum.
    BoundingBoxd boundingBox() const;

    /// Polyline approximation of the arc length using 'defaultLengthStep'.
    double length() const;
    /// Throws 'InvalidLengthOptionsException'.
    double length( const LengthOptions& ) const;

    const Vector2& startPosition() const;
    const Vector2& control1() const;
    const Vector2& control2() const;
    const Vector2& endPosition() const;
    /// Start, control1, control2, end.
    Control controlPoints() const;

    /// The same curve traversed from end to start.
    CubicBezier reverseCopy() const;

    bool operator == ( const CubicBezier& ) const;
    bool operator != ( const CubicBezier& ) const;

    static constexpr double defaultLengthStep = 0.005;
private:
    Vector2 _start;
    Vector2 _control1;
    Vector2 _control2;
    Vector2 _end;
};

} // pathGeom

#endif // #include guard
