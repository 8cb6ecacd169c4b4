#include <utility/vector2.h>

#include <cmath>

namespace pathGeom {

Vector2::Vector2() : _x( 0. ), _y( 0. )
{
}

Vector2::Vector2( double x, double y ) : _x( x ), _y( y )
{
}

double Vector2::x() const
{
    return _x;
}

double Vector2::y() const
{
    return _y;
}

void Vector2::setX( double x )
{
    _x = x;
}

void Vector2::setY( double y )
{
    _y = y;
}

double Vector2::length() const
{
    return std::sqrt( lengthSquared() );
}

double Vector2::lengthSquared() const
{
    return _x * _x + _y * _y;
}

void Vector2::normalize()
{
    const double len = length();
    if( len > 0. ) {
        _x /= len;
        _y /= len;
    }
}

Vector2 Vector2::operator + ( const Vector2& other ) const
{
    return { _x + other._x, _y + other._y };
}

Vector2 Vector2::operator - ( const Vector2& other ) const
{
    return { _x - other._x, _y - other._y };
}

Vector2 Vector2::operator * ( double f ) const
{
    return { _x * f, _y * f };
}

Vector2& Vector2::operator += ( const Vector2& other )
{
    _x += other._x;
    _y += other._y;
    return *this;
}

Vector2& Vector2::operator -= ( const Vector2& other )
{
    _x -= other._x;
    _y -= other._y;
    return *this;
}

Vector2& Vector2::operator *= ( double f )
{
    _x *= f;
    _y *= f;
    return *this;
}

bool Vector2::operator == ( const Vector2& other ) const
{
    return _x == other._x && _y == other._y;
}

bool Vector2::operator != ( const Vector2& other ) const
{
    return !( *this == other );
}

double Vector2::dot( const Vector2& a, const Vector2& b )
{
    return a._x * b._x + a._y * b._y;
}

Vector2 Vector2::lerp( const Vector2& a, const Vector2& b, double t )
{
    return a + ( b - a ) * t;
}

std::ostream& operator << ( std::ostream& stream, const Vector2& v )
{
    return stream << "(" << v.x() << ", " << v.y() << ")";
}

} // pathGeom
