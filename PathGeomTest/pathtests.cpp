#include <testutility.h>

#include <PathGeom/exceptions/runtimeerror.h>
#include <PathGeom/model/path.h>

#include <gtest/gtest.h>

#include <cmath>

namespace pathGeomTest {

using pathGeom::CubicBezier;
using pathGeom::LengthOptions;
using pathGeom::LineSegment;
using pathGeom::QuadraticBezier;
using pathGeom::Vector2;
using pathGeom::model::Path;

namespace {

/// Line, arch and line back to the start.
Path closedArch()
{
    Path path;
    path.add( LineSegment( Vector2( 0., 0. ), Vector2( 2., 0. ) ) );
    path.add( QuadraticBezier( Vector2( 2., 0. ), Vector2( 1., 2. ), Vector2( 0., 0. ) ) );
    return path;
}

} // unnamed

TEST( PathTests, Empty )
{
    const Path path;
    EXPECT_TRUE( path.empty() );
    EXPECT_EQ( 0u, path.size() );
    EXPECT_FALSE( path.boundingBox().is_initialized() );
    EXPECT_FALSE( path.startPosition().is_initialized() );
    EXPECT_FALSE( path.endPosition().is_initialized() );
    EXPECT_DOUBLE_EQ( 0., path.length() );
    EXPECT_TRUE( path.approxContinuous() );
    EXPECT_FALSE( path.endpointsEqual() );
}

TEST( PathTests, BoundingBoxIsUnion )
{
    Path path;
    path.add( LineSegment( Vector2( -1., 0. ), Vector2( 0., 0. ) ) );
    path.add( QuadraticBezier( Vector2( 0., 0. ), Vector2( 1., 2. ), Vector2( 2., 0. ) ) );
    path.add( CubicBezier( Vector2( 2., 0. ), Vector2( 3., 1. ), Vector2( 4., -1. ), Vector2( 5., 0. ) ) );

    const auto box = path.boundingBox();
    ASSERT_TRUE( box.is_initialized() );
    EXPECT_DOUBLE_EQ( -1., box->xMin() );
    EXPECT_DOUBLE_EQ( 5., box->xMax() );
    EXPECT_DOUBLE_EQ( 1., box->yMax() );
    EXPECT_NEAR( -std::sqrt( 3. ) / 6., box->yMin(), 1e-12 );
}

TEST( PathTests, LengthIsSumOfSegments )
{
    const Path path = closedArch();
    const double archLength = QuadraticBezier( Vector2( 2., 0. ), Vector2( 1., 2. ), Vector2( 0., 0. ) ).length();
    EXPECT_DOUBLE_EQ( 2. + archLength, path.length() );

    LengthOptions options;
    options.step = 0.25;
    options.closeFinalInterval = true;
    const double coarseArch = QuadraticBezier( Vector2( 2., 0. ), Vector2( 1., 2. ), Vector2( 0., 0. ) ).length( options );
    EXPECT_DOUBLE_EQ( 2. + coarseArch, path.length( options ) );
}

TEST( PathTests, Endpoints )
{
    const Path path = closedArch();
    ASSERT_TRUE( path.startPosition().is_initialized() );
    EXPECT_EQ( Vector2( 0., 0. ), *path.startPosition() );
    EXPECT_EQ( Vector2( 0., 0. ), *path.endPosition() );
    EXPECT_TRUE( path.endpointsEqual() );
    EXPECT_TRUE( path.approxContinuous() );
}

TEST( PathTests, PositionBySegment )
{
    const Path path = closedArch();
    expectNearPos( Vector2( 1., 0. ), path.position( 0, 0.5 ) );
    expectNearPos( Vector2( 1., 1. ), path.position( 1, 0.5 ) );
}

TEST( PathTests, IndexOutOfRangeThrows )
{
    const Path path = closedArch();
    EXPECT_NO_THROW( path.segment( 1 ) );
    EXPECT_THROW( path.segment( 2 ), pathGeom::RuntimeError );
    EXPECT_THROW( path.position( 5, 0. ), pathGeom::RuntimeError );
    EXPECT_THROW( Path().segment( 0 ), pathGeom::RuntimeError );
}

TEST( PathTests, Gaps )
{
    Path path;
    path.add( LineSegment( Vector2( 0., 0. ), Vector2( 1., 0. ) ) );
    path.add( LineSegment( Vector2( 1., 1e-8 ), Vector2( 2., 0. ) ) );
    EXPECT_TRUE( path.approxContinuous() );
    EXPECT_FALSE( path.approxContinuous( 1e-9 ) );

    path.add( LineSegment( Vector2( 3., 0. ), Vector2( 4., 0. ) ) );
    EXPECT_FALSE( path.approxContinuous() );
    EXPECT_FALSE( path.endpointsEqual() );
}

} // pathGeomTest
