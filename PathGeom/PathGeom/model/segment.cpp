#include <model/segment.h>

namespace pathGeom {
namespace model {

namespace {

struct TypeVisitor : public boost::static_visitor< SegmentType >
{
    SegmentType operator()( const LineSegment& ) const { return SegmentType::Line; }
    SegmentType operator()( const QuadraticBezier& ) const { return SegmentType::Quadratic; }
    SegmentType operator()( const CubicBezier& ) const { return SegmentType::Cubic; }
};

struct PositionVisitor : public boost::static_visitor< Vector2 >
{
    explicit PositionVisitor( double tVal ) : t( tVal ) {}

    template< typename S >
    Vector2 operator()( const S& s ) const
    {
        return s.position( t );
    }

    double t;
};

struct BoundingBoxVisitor : public boost::static_visitor< BoundingBoxd >
{
    template< typename S >
    BoundingBoxd operator()( const S& s ) const
    {
        return s.boundingBox();
    }
};

struct LengthVisitor : public boost::static_visitor< double >
{
    explicit LengthVisitor( const LengthOptions& optionsRef ) : options( optionsRef ) {}

    double operator()( const LineSegment& s ) const
    {
        return s.length();
    }

    template< typename Curve >
    double operator()( const Curve& c ) const
    {
        return c.length( options );
    }

    const LengthOptions& options;
};

struct EndpointVisitor : public boost::static_visitor< Vector2 >
{
    explicit EndpointVisitor( bool startOrEndVal ) : startOrEnd( startOrEndVal ) {}

    template< typename S >
    Vector2 operator()( const S& s ) const
    {
        return startOrEnd ? s.startPosition() : s.endPosition();
    }

    bool startOrEnd;
};

struct ReverseVisitor : public boost::static_visitor< Segment >
{
    Segment operator()( const LineSegment& s ) const { return s.reverse(); }
    Segment operator()( const QuadraticBezier& q ) const { return q.reverseCopy(); }
    Segment operator()( const CubicBezier& c ) const { return c.reverseCopy(); }
};

} // unnamed

SegmentType segmentType( const Segment& seg )
{
    return boost::apply_visitor( TypeVisitor(), seg );
}

const char* segmentTypeName( SegmentType type )
{
    switch( type ) {
    case SegmentType::Line:
        return "line";
    case SegmentType::Quadratic:
        return "quadratic";
    case SegmentType::Cubic:
        return "cubic";
    }
    return "unknown";
}

Vector2 position( const Segment& seg, double t )
{
    return boost::apply_visitor( PositionVisitor( t ), seg );
}

BoundingBoxd boundingBox( const Segment& seg )
{
    return boost::apply_visitor( BoundingBoxVisitor(), seg );
}

double length( const Segment& seg )
{
    return length( seg, LengthOptions() );
}

double length( const Segment& seg, const LengthOptions& options )
{
    return boost::apply_visitor( LengthVisitor( options ), seg );
}

Vector2 startPosition( const Segment& seg )
{
    return boost::apply_visitor( EndpointVisitor( true ), seg );
}

Vector2 endPosition( const Segment& seg )
{
    return boost::apply_visitor( EndpointVisitor( false ), seg );
}

Segment reverseCopy( const Segment& seg )
{
    return boost::apply_visitor( ReverseVisitor(), seg );
}

} // model
} // pathGeom
