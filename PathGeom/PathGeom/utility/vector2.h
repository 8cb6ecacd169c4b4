#ifndef PATHGEOM_VECTOR2_H
#define PATHGEOM_VECTOR2_H

#include <ostream>

namespace pathGeom {

/// A 2D point or direction with double coordinates.
class Vector2
{
public:
    Vector2();
    Vector2( double x, double y );

    double x() const;
    double y() const;
    void setX( double );
    void setY( double );

    double length() const;
    double lengthSquared() const;
    /// Leave a zero-length vector unchanged.
    void normalize();

    Vector2 operator + ( const Vector2& ) const;
    Vector2 operator - ( const Vector2& ) const;
    Vector2 operator * ( double ) const;
    Vector2& operator += ( const Vector2& );
    Vector2& operator -= ( const Vector2& );
    Vector2& operator *= ( double );
    bool operator == ( const Vector2& ) const;
    bool operator != ( const Vector2& ) const;

    static double dot( const Vector2&, const Vector2& );
    static Vector2 lerp( const Vector2& a, const Vector2& b, double t );
private:
    double _x;
    double _y;
};

std::ostream& operator << ( std::ostream&, const Vector2& );

} // pathGeom

#endif // #include guard
