#include <PrintPaths/pathspostscript.h>

#include <PathGeom/exceptions/runtimeerror.h>
#include <PathGeom/utility/mathutility.h>

#include <algorithm>
#include <cmath>
#include <functional>
#include <iomanip>

namespace printPaths {

namespace {

using Vec2 = PathsPostScript::Vec2;
using Segment = PathsPostScript::Segment;
using PointMap = std::function< Vec2( const Vec2& ) >;

void setDefaultPrecision( std::stringstream& str )
{
    // Canvas dimensions are expected on the order of 1000 PostScript units; one decimal place is plenty.
    const int placesAfterDecimal = 1;
    str << std::fixed << std::setprecision( placesAfterDecimal );
}

void setColorPrecision( std::stringstream& str )
{
    // We only need to capture 0-255 in the form of 0.xxxx.
    str << std::defaultfloat << std::setprecision( 4 );
}

void printPoint( const Vec2& point, std::stringstream& str )
{
    str << point.x() << " " << point.y();
}

struct MapPointsVisitor : public boost::static_visitor< Segment >
{
    explicit MapPointsVisitor( const PointMap& fRef ) : f( fRef ) {}

    Segment operator()( const pathGeom::LineSegment& s ) const
    {
        return pathGeom::LineSegment( f( s.a ), f( s.b ) );
    }

    Segment operator()( const pathGeom::QuadraticBezier& q ) const
    {
        return pathGeom::QuadraticBezier( f( q.startPosition() ), f( q.control() ), f( q.endPosition() ) );
    }

    Segment operator()( const pathGeom::CubicBezier& c ) const
    {
        return pathGeom::CubicBezier(
            f( c.startPosition() ), f( c.control1() ), f( c.control2() ), f( c.endPosition() ) );
    }

    const PointMap& f;
};

/// Writes the drawing operators for one segment; the current point must already be the segment start
/// unless a moveto is requested.
struct EpsVisitor : public boost::static_visitor<>
{
    EpsVisitor( std::stringstream& strRef, bool initialMoveToVal ) : str( strRef ), initialMoveTo( initialMoveToVal ) {}

    void moveTo( const Vec2& p ) const
    {
        if( initialMoveTo ) {
            printPoint( p, str );
            str << " moveto ";
        }
    }

    void operator()( const pathGeom::LineSegment& s ) const
    {
        moveTo( s.a );
        printPoint( s.b, str );
        str << " lineto ";
    }

    void operator()( const pathGeom::QuadraticBezier& q ) const
    {
        // PostScript only knows cubic curves.
        ( *this )( q.toCubic() );
    }

    void operator()( const pathGeom::CubicBezier& c ) const
    {
        moveTo( c.startPosition() );
        printPoint( c.control1(), str );
        str << " ";
        printPoint( c.control2(), str );
        str << " ";
        printPoint( c.endPosition(), str );
        str << " curveto ";
    }

    std::stringstream& str;
    bool initialMoveTo;
};

} // unnamed

PathsPostScript::PathsPostScript( const Box& canvas, boost::optional< double > psMinDimOpt ) :
    _canvasBounds( canvas ),
    _currentRGB{ 0, 0, 0 },
    _currentLineWidthPS( -1.0 )
{
    if( pathGeom::mathUtility::closeEnoughToZero( canvas.minDim() ) ) {
        PATHGEOM_THROW_RUNTIME( "Canvas region must have nonzero width and height" );
    }

    const double psMinDim = psMinDimOpt.is_initialized() ? psMinDimOpt.value() : canvas.minDim();

    const double psWidth = canvas.widthExclusive() < canvas.heightExclusive()
        ? psMinDim
        : psMinDim * canvas.widthExclusive() / canvas.heightExclusive();
    const double psHeight = canvas.heightExclusive() < canvas.widthExclusive()
        ? psMinDim
        : psMinDim * canvas.heightExclusive() / canvas.widthExclusive();

    _psBounds = Box( Vec2( 0, 0 ), Vec2( psWidth, psHeight ) );

    _stream << "%!PS-Adobe-2.0 EPSF-1.2\n";
    _stream << "%%BoundingBox: 0 0 "
        << static_cast< int >( std::ceil( psWidth ) )
        << " "
        << static_cast< int >( std::ceil( psHeight ) )
        << "\n";
    setDefaultPrecision( _stream );

    _stream << "<< /PageSize ["
        << _psBounds.widthExclusive()
        << " "
        << _psBounds.heightExclusive()
        << "] >> setpagedevice\n";

    setLineWidth( 1.0 );
    setColor( 0, 0, 0 );
}

const PathsPostScript::Box& PathsPostScript::canvasBounds() const
{
    return _canvasBounds;
}

const PathsPostScript::Box& PathsPostScript::psBounds() const
{
    return _psBounds;
}

bool PathsPostScript::onPage( Box psSpace ) const
{
    psSpace.expand( _currentLineWidthPS );
    return _psBounds.intersects( psSpace );
}

void PathsPostScript::addCircle( const Vec2& canvasSpace, double radiusCanvas, bool strokeOrFill )
{
    const Vec2 ps = canvasToPS( canvasSpace );
    const double radiusPS = canvasToPS( radiusCanvas );

    const Box itemBounds( ps - Vec2( radiusPS, radiusPS ), ps + Vec2( radiusPS, radiusPS ) );
    if( onPage( itemBounds ) ) {
        _stream << ps.x()
            << " "
            << ps.y()
            << " "
            << radiusPS
            << " newpath 0 360 arc closepath "
            << ( strokeOrFill ? "stroke" : "fill" )
            << "\n";
    }
}

void PathsPostScript::addSegment( const Segment& canvasSpace )
{
    const Segment inPS = canvasToPS( canvasSpace );
    if( onPage( pathGeom::model::boundingBox( inPS ) ) ) {
        _stream << "newpath\n" << eps( inPS, true ) << " stroke\n";
    }
}

void PathsPostScript::addPath( const Path& canvasSpace )
{
    const auto canvasBox = canvasSpace.boundingBox();
    if( !canvasBox ) {
        return;
    }
    const Box psBox( canvasToPS( canvasBox->min() ), canvasToPS( canvasBox->max() ) );
    if( !onPage( psBox ) ) {
        return;
    }

    _stream << "newpath\n";
    boost::optional< Vec2 > prevEnd;
    for( const auto& seg : canvasSpace.segments() ) {
        const Segment inPS = canvasToPS( seg );
        const auto start = pathGeom::model::startPosition( inPS );
        const bool moveTo = !prevEnd || !pathGeom::mathUtility::closeEnoughToZero( ( start - *prevEnd ).length() );
        _stream << eps( inPS, moveTo ) << "\n";
        prevEnd = pathGeom::model::endPosition( inPS );
    }
    if( canvasSpace.endpointsEqual() ) {
        _stream << "closepath ";
    }
    _stream << "stroke\n";
}

void PathsPostScript::addBoundingBox( const Box& canvasSpace )
{
    const Vec2 a = canvasToPS( canvasSpace.min() );
    const Vec2 b = canvasToPS( canvasSpace.max() );
    const Box inPS( a, b );
    if( onPage( inPS ) ) {
        _stream << "newpath ";
        printPoint( inPS.min(), _stream );
        _stream << " moveto ";
        printPoint( Vec2( inPS.xMax(), inPS.yMin() ), _stream );
        _stream << " lineto ";
        printPoint( inPS.max(), _stream );
        _stream << " lineto ";
        printPoint( Vec2( inPS.xMin(), inPS.yMax() ), _stream );
        _stream << " lineto closepath stroke\n";
    }
}

void PathsPostScript::setColor( const RGB& rgb )
{
    setColor( rgb[ 0 ], rgb[ 1 ], rgb[ 2 ] );
}

void PathsPostScript::setColor( int r, int g, int b )
{
    if( r != _currentRGB[ 0 ] || g != _currentRGB[ 1 ] || b != _currentRGB[ 2 ] ) {

        auto toF = [ & ]( int channel )
        {
            return static_cast< double > ( std::clamp( channel, 0, 255 ) ) / 255.0;
        };

        setColorPrecision( _stream );
        _stream << toF( r ) << " " << toF( g ) << " " << toF( b ) << " setrgbcolor\n";
        setDefaultPrecision( _stream );

        _currentRGB = { r, g, b };
    }
}

void PathsPostScript::setLineWidth( double canvasUnits )
{
    const double newWidthPS = canvasToPS( canvasUnits );
    if( !pathGeom::mathUtility::closeEnough( _currentLineWidthPS, newWidthPS ) ) {
        _stream << newWidthPS << " setlinewidth\n";
        _currentLineWidthPS = newWidthPS;
    }
}

double PathsPostScript::lineWidth() const
{
    return psToCanvas( _currentLineWidthPS );
}

std::string PathsPostScript::epsCode() const
{
    return _stream.str();
}

double PathsPostScript::canvasToPS( double canvas ) const
{
    return canvas * _psBounds.widthExclusive() / _canvasBounds.widthExclusive();
}

double PathsPostScript::psToCanvas( double ps ) const
{
    return ps * _canvasBounds.widthExclusive() / _psBounds.widthExclusive();
}

PathsPostScript::Vec2 PathsPostScript::canvasToPS( const Vec2& canvasPos ) const
{
    Vec2 ps(
        _psBounds.xMin() + _psBounds.widthExclusive() * ( canvasPos.x() - _canvasBounds.xMin() ) / _canvasBounds.widthExclusive(),
        _psBounds.yMin() + _psBounds.heightExclusive() * ( canvasPos.y() - _canvasBounds.yMin() ) / _canvasBounds.heightExclusive() );

    // Postscript has (0,0) as bottomleft, not topleft.
    ps.setY( _psBounds.heightExclusive() - ps.y() );
    return ps;
}

PathsPostScript::Segment PathsPostScript::canvasToPS( const Segment& canvas ) const
{
    // The map is affine, so mapping the control points maps the whole segment.
    const PointMap toPS = [ this ]( const Vec2& p )
    {
        return canvasToPS( p );
    };
    return boost::apply_visitor( MapPointsVisitor( toPS ), canvas );
}

std::string PathsPostScript::eps( const Segment& seg, bool initialMoveTo )
{
    std::stringstream str;
    setDefaultPrecision( str );
    str << " ";
    boost::apply_visitor( EpsVisitor( str, initialMoveTo ), seg );
    return str.str();
}

} // printPaths
