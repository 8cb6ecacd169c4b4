#include <model/path.h>

#include <exceptions/runtimeerror.h>

#include <string>

namespace pathGeom {
namespace model {

Path::Path()
{
}

Path::Path( const Segments& segments ) : _segments( segments )
{
}

void Path::add( const Segment& seg )
{
    _segments.push_back( seg );
}

size_t Path::size() const
{
    return _segments.size();
}

bool Path::empty() const
{
    return _segments.empty();
}

const Segment& Path::segment( size_t i ) const
{
    if( i >= _segments.size() ) {
        PATHGEOM_THROW_RUNTIME( "Segment index " + std::to_string( i ) + " out of range for path of size "
                                + std::to_string( _segments.size() ) );
    }
    return _segments[ i ];
}

const Path::Segments& Path::segments() const
{
    return _segments;
}

boost::optional< BoundingBoxd > Path::boundingBox() const
{
    boost::optional< BoundingBoxd > toReturn;
    for( const auto& seg : _segments ) {
        const auto segBounds = model::boundingBox( seg );
        if( toReturn ) {
            toReturn->growToContain( segBounds );
        } else {
            toReturn = segBounds;
        }
    }
    return toReturn;
}

double Path::length() const
{
    return length( LengthOptions() );
}

double Path::length( const LengthOptions& options ) const
{
    double toReturn = 0.;
    for( const auto& seg : _segments ) {
        toReturn += model::length( seg, options );
    }
    return toReturn;
}

boost::optional< Vector2 > Path::startPosition() const
{
    if( _segments.empty() ) {
        return boost::none;
    }
    return model::startPosition( _segments.front() );
}

boost::optional< Vector2 > Path::endPosition() const
{
    if( _segments.empty() ) {
        return boost::none;
    }
    return model::endPosition( _segments.back() );
}

Vector2 Path::position( size_t segmentIndex, double t ) const
{
    return model::position( segment( segmentIndex ), t );
}

bool Path::approxContinuous( double maxGap ) const
{
    for( size_t i = 1; i < _segments.size(); i++ ) {
        const auto gap = model::startPosition( _segments[ i ] ) - model::endPosition( _segments[ i - 1 ] );
        if( gap.length() > maxGap ) {
            return false;
        }
    }
    return true;
}

bool Path::endpointsEqual() const
{
    const auto start = startPosition();
    const auto end = endPosition();
    return start && end && *start == *end;
}

} // model
} // pathGeom
