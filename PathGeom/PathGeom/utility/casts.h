#ifndef PATHGEOM_CASTS_H
#define PATHGEOM_CASTS_H

#include <boost/numeric/conversion/cast.hpp>

/// Map sample index 'i' of 'n' (n >= 2) evenly onto [0,1].
#define PATHGEOM_F_FROM_I( i, n ) \
    ( boost::numeric_cast< double >( i ) / boost::numeric_cast< double >( ( n ) - 1 ) )

#endif // #include guard
