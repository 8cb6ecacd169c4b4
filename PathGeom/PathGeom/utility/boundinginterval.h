#ifndef PATHGEOM_BOUNDINGINTERVAL_H
#define PATHGEOM_BOUNDINGINTERVAL_H

#include <boost/optional.hpp>

#include <algorithm>

namespace pathGeom {

/// A closed interval [min,max]. The constructor sorts its arguments, so min() <= max() always holds.
template< typename T >
class BoundingInterval
{
public:
    using Type = BoundingInterval< T >;

    BoundingInterval() : _min( 0 ), _max( 0 )
    {
    }

    BoundingInterval( T a, T b ) : _min( std::min( a, b ) ), _max( std::max( a, b ) )
    {
    }

    T min() const
    {
        return _min;
    }

    T max() const
    {
        return _max;
    }

    T length() const
    {
        return _max - _min;
    }

    bool contains( T value ) const
    {
        return value >= _min && value <= _max;
    }

    /// Grow the interval, if necessary, to include 'value'.
    void addValue( T value )
    {
        _min = std::min( _min, value );
        _max = std::max( _max, value );
    }

    /// 'f' in [0,1] maps onto [min,max].
    T lerp( double f ) const
    {
        return static_cast< T >( _min + ( _max - _min ) * f );
    }

    bool operator == ( const Type& other ) const
    {
        return _min == other._min && _max == other._max;
    }

    bool operator != ( const Type& other ) const
    {
        return !( *this == other );
    }

    /// Return boost::none if 'a' and 'b' do not overlap (touching counts as overlap).
    static boost::optional< Type > intersection( const Type& a, const Type& b )
    {
        const T lo = std::max( a._min, b._min );
        const T hi = std::min( a._max, b._max );
        if( lo > hi ) {
            return boost::none;
        }
        return Type( lo, hi );
    }
private:
    T _min;
    T _max;
};

using BoundingIntervald = BoundingInterval< double >;

} // pathGeom

#endif // #include guard
