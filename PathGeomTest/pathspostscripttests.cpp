#include <PathGeom/curves/cubicbezier.h>
#include <PathGeom/curves/quadraticbezier.h>
#include <PathGeom/exceptions/runtimeerror.h>
#include <PathGeom/model/path.h>
#include <PathGeom/utility/linesegment.h>

#include <PrintPaths/createfiles.h>
#include <PrintPaths/pathspostscript.h>

#include <gtest/gtest.h>

#include <string>

namespace pathGeomTest {

using pathGeom::LineSegment;
using pathGeom::QuadraticBezier;
using pathGeom::Vector2;
using printPaths::PathsPostScript;

namespace {

PathsPostScript::Box canvas()
{
    return PathsPostScript::Box( Vector2( 0., 0. ), Vector2( 100., 100. ) );
}

bool contains( const std::string& str, const std::string& sub )
{
    return str.find( sub ) != std::string::npos;
}

} // unnamed

TEST( PathsPostScriptTests, Header )
{
    const PathsPostScript pps( canvas() );
    const auto code = pps.epsCode();
    EXPECT_EQ( 0u, code.find( "%!PS-Adobe" ) );
    EXPECT_TRUE( contains( code, "%%BoundingBox: 0 0 100 100" ) );
    EXPECT_TRUE( contains( code, "setlinewidth" ) );
    EXPECT_DOUBLE_EQ( 1., pps.lineWidth() );
}

TEST( PathsPostScriptTests, AspectRatio )
{
    const PathsPostScript pps( PathsPostScript::Box( Vector2( 0., 0. ), Vector2( 200., 100. ) ), 50. );
    EXPECT_DOUBLE_EQ( 100., pps.psBounds().widthExclusive() );
    EXPECT_DOUBLE_EQ( 50., pps.psBounds().heightExclusive() );
}

TEST( PathsPostScriptTests, DegenerateCanvasThrows )
{
    const PathsPostScript::Box flat( Vector2( 0., 0. ), Vector2( 100., 0. ) );
    EXPECT_THROW( PathsPostScript pps( flat ), pathGeom::RuntimeError );
}

TEST( PathsPostScriptTests, SegmentsFlipY )
{
    PathsPostScript pps( canvas() );
    pps.addSegment( LineSegment( Vector2( 10., 20. ), Vector2( 30., 40. ) ) );
    const auto code = pps.epsCode();
    EXPECT_TRUE( contains( code, "10.0 80.0 moveto" ) );
    EXPECT_TRUE( contains( code, "30.0 60.0 lineto" ) );
}

TEST( PathsPostScriptTests, QuadraticWrittenAsCubic )
{
    PathsPostScript pps( canvas() );
    pps.addSegment( QuadraticBezier( Vector2( 0., 100. ), Vector2( 30., 100. ), Vector2( 60., 100. ) ) );
    // Control points at 1/3 and 2/3 of the way along; Y flips to 0.
    EXPECT_TRUE( contains( pps.epsCode(), "0.0 0.0 moveto 20.0 0.0 40.0 0.0 60.0 0.0 curveto" ) );
}

TEST( PathsPostScriptTests, OffPageSkipped )
{
    PathsPostScript pps( canvas() );
    const auto before = pps.epsCode();
    pps.addSegment( LineSegment( Vector2( 500., 500. ), Vector2( 600., 600. ) ) );
    pps.addCircle( Vector2( -50., -50. ), 5., true );
    pps.addPath( pathGeom::model::Path() );
    EXPECT_EQ( before, pps.epsCode() );
}

TEST( PathsPostScriptTests, ColorAndWidthChangesOnlyWhenNeeded )
{
    PathsPostScript pps( canvas() );
    const auto before = pps.epsCode();
    pps.setColor( 0, 0, 0 );
    pps.setLineWidth( 1. );
    EXPECT_EQ( before, pps.epsCode() );

    pps.setColor( PathsPostScript::RGB{ 255, 0, 0 } );
    EXPECT_TRUE( contains( pps.epsCode(), "1 0 0 setrgbcolor" ) );
}

TEST( PathsPostScriptTests, ClosedPath )
{
    pathGeom::model::Path path;
    path.add( LineSegment( Vector2( 10., 10. ), Vector2( 90., 10. ) ) );
    path.add( pathGeom::CubicBezier( Vector2( 90., 10. ), Vector2( 90., 90. ), Vector2( 10., 90. ), Vector2( 10., 10. ) ) );

    PathsPostScript pps( canvas() );
    pps.addPath( path );
    const auto code = pps.epsCode();
    EXPECT_TRUE( contains( code, "lineto" ) );
    EXPECT_TRUE( contains( code, "curveto" ) );
    EXPECT_TRUE( contains( code, "closepath stroke" ) );

    // Only the first segment starts with a moveto.
    const auto first = code.find( "moveto" );
    ASSERT_NE( std::string::npos, first );
    EXPECT_EQ( std::string::npos, code.find( "moveto", first + 1 ) );
}

TEST( PathsPostScriptTests, SaveToBadPathThrows )
{
    EXPECT_THROW( printPaths::savePSToFile( "%!PS", "/nonexistent-directory/out.eps" ), pathGeom::RuntimeError );
    EXPECT_EQ( "eps", printPaths::epsExt() );
}

} // pathGeomTest
