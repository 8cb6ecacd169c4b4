#ifndef PATHGEOM_BOUNDINGBOX_H
#define PATHGEOM_BOUNDINGBOX_H

#include <PathGeom/utility/boundinginterval.h>
#include <PathGeom/utility/vector2.h>

#include <algorithm>
#include <ostream>

namespace pathGeom {

/// An axis-aligned box. 'TCoords' must be constructible from two 'T's and expose x() and y().
/// Every constructor sorts per axis, so the min corner never exceeds the max corner.
template< typename T, typename TCoords >
class BoundingBox
{
public:
    using Type = BoundingBox< T, TCoords >;
    using Interval = BoundingInterval< T >;

    BoundingBox()
    {
    }

    BoundingBox( const TCoords& a, const TCoords& b )
        : _x( a.x(), b.x() )
        , _y( a.y(), b.y() )
    {
    }

    BoundingBox( const Interval& x, const Interval& y ) : _x( x ), _y( y )
    {
    }

    T xMin() const { return _x.min(); }
    T xMax() const { return _x.max(); }
    T yMin() const { return _y.min(); }
    T yMax() const { return _y.max(); }

    TCoords min() const
    {
        return TCoords( _x.min(), _y.min() );
    }

    TCoords max() const
    {
        return TCoords( _x.max(), _y.max() );
    }

    const Interval& xInterval() const
    {
        return _x;
    }

    const Interval& yInterval() const
    {
        return _y;
    }

    /// "Exclusive" because a box with xMin == xMax has width 0 (as opposed to pixel-style counting).
    T widthExclusive() const
    {
        return _x.length();
    }

    T heightExclusive() const
    {
        return _y.length();
    }

    T minDim() const
    {
        return std::min( widthExclusive(), heightExclusive() );
    }

    T maxDim() const
    {
        return std::max( widthExclusive(), heightExclusive() );
    }

    T area() const
    {
        return widthExclusive() * heightExclusive();
    }

    bool contains( const TCoords& p ) const
    {
        return _x.contains( p.x() ) && _y.contains( p.y() );
    }

    bool intersects( const Type& other ) const
    {
        return Interval::intersection( _x, other._x ).is_initialized()
            && Interval::intersection( _y, other._y ).is_initialized();
    }

    void addPoint( const TCoords& p )
    {
        _x.addValue( p.x() );
        _y.addValue( p.y() );
    }

    void growToContain( const Type& other )
    {
        _x.addValue( other._x.min() );
        _x.addValue( other._x.max() );
        _y.addValue( other._y.min() );
        _y.addValue( other._y.max() );
    }

    /// Push every side outward by 'by' (>= 0).
    void expand( T by )
    {
        _x = Interval( _x.min() - by, _x.max() + by );
        _y = Interval( _y.min() - by, _y.max() + by );
    }

    bool operator == ( const Type& other ) const
    {
        return _x == other._x && _y == other._y;
    }

    bool operator != ( const Type& other ) const
    {
        return !( *this == other );
    }
private:
    Interval _x;
    Interval _y;
};

template< typename T, typename TCoords >
std::ostream& operator << ( std::ostream& stream, const BoundingBox< T, TCoords >& box )
{
    return stream << box.min() << " - " << box.max();
}

using BoundingBoxd = BoundingBox< double, Vector2 >;

} // pathGeom

#endif // #include guard
