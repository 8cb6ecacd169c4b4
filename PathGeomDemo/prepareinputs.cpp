#include <prepareinputs.h>

#include <PathGeom/curves/cubicbezier.h>
#include <PathGeom/curves/quadraticbezier.h>
#include <PathGeom/utility/linesegment.h>

namespace pathGeomDemo {

namespace {

using pathGeom::CubicBezier;
using pathGeom::LineSegment;
using pathGeom::QuadraticBezier;
using Pos = pathGeom::Vector2;

const double canvasDim = 1000.;

pathGeom::BoundingBoxd defaultCanvas()
{
    return pathGeom::BoundingBoxd{ Pos( 0, 0 ), Pos( canvasDim, canvasDim ) };
}

} // unnamed

DemoInputs prepareScenario_arch()
{
    DemoInputs ret;
    ret.name = "arch";
    ret.canvasBounds = defaultCanvas();
    ret.path.add( QuadraticBezier( Pos( 100, 900 ), Pos( 500, 100 ), Pos( 900, 900 ) ) );
    ret.altLengthOptions.closeFinalInterval = true;
    return ret;
}

DemoInputs prepareScenario_wave()
{
    DemoInputs ret;
    ret.name = "wave";
    ret.canvasBounds = defaultCanvas();
    ret.path.add( CubicBezier( Pos( 100, 500 ), Pos( 400, -100 ), Pos( 600, 1100 ), Pos( 900, 500 ) ) );
    ret.altLengthOptions.step = 0.001;
    return ret;
}

DemoInputs prepareScenario_outline()
{
    DemoInputs ret;
    ret.name = "outline";
    ret.canvasBounds = defaultCanvas();

    const Pos a( 150, 800 );
    const Pos b( 450, 800 );
    const Pos c( 850, 500 );
    const Pos d( 400, 150 );

    ret.path.add( LineSegment( a, b ) );
    ret.path.add( QuadraticBezier( b, Pos( 850, 900 ), c ) );
    ret.path.add( CubicBezier( c, Pos( 900, 150 ), Pos( 600, 50 ), d ) );
    ret.path.add( QuadraticBezier( d, Pos( 50, 300 ), a ) );
    ret.altLengthOptions.step = 0.05;
    return ret;
}

DemoInputs prepareScenario_degenerate()
{
    DemoInputs ret;
    ret.name = "degenerate";
    ret.canvasBounds = defaultCanvas();

    // Evenly spaced collinear control points: 2B - A - C == 0 on both axes.
    ret.path.add( QuadraticBezier( Pos( 100, 100 ), Pos( 300, 300 ), Pos( 500, 500 ) ) );
    // A point-curve.
    ret.path.add( CubicBezier( Pos( 700, 700 ), Pos( 700, 700 ), Pos( 700, 700 ), Pos( 700, 700 ) ) );
    // A degree-elevated quadratic: the cubic term cancels on both axes.
    ret.path.add( QuadraticBezier( Pos( 100, 900 ), Pos( 300, 500 ), Pos( 500, 900 ) ).toCubic() );
    ret.altLengthOptions.closeFinalInterval = true;
    return ret;
}

} // pathGeomDemo
