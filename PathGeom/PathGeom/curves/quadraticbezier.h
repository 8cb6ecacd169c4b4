#ifndef PATHGEOM_CURVES_QUADRATICBEZIER_H
#define PATHGEOM_CURVES_QUADRATICBEZIER_H

#include <PathGeom/curves/lengthoptions.h>
#include <PathGeom/utility/boundingbox.h>
#include <PathGeom/utility/vector2.h>

namespace pathGeom {

class CubicBezier;

/// A degree-2 Bezier curve. The object is an immutable value; T ranges from 0 (start) to 1 (end).
class QuadraticBezier
{
public:
    QuadraticBezier();
    QuadraticBezier( const Vector2& start, const Vector2& control, const Vector2& end );

    /// Any 't' is accepted; values outside [0,1] extrapolate the polynomial.
    Vector2 position( double t ) const;

    /// The tight axis-aligned box around the curve over T in [0,1].
    BoundingBoxd boundingBox() const;

    /// Polyline approximation of the arc length using 'defaultLengthStep'.
    double length() const;
    /// Throws 'InvalidLengthOptionsException'.
    double length( const LengthOptions& ) const;

    const Vector2& startPosition() const;
    const Vector2& control() const;
    const Vector2& endPosition() const;

    /// The same curve traversed from end to start.
    QuadraticBezier reverseCopy() const;
    /// The exactly equivalent degree-3 curve.
    CubicBezier toCubic() const;

    bool operator == ( const QuadraticBezier& ) const;
    bool operator != ( const QuadraticBezier& ) const;

    static constexpr double defaultLengthStep = 0.01;
private:
    Vector2 _start;
    Vector2 _control;
    Vector2 _end;
};

} // pathGeom

#endif // #include guard
