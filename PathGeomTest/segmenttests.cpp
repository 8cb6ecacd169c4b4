#include <testutility.h>

#include <PathGeom/model/segment.h>

#include <gtest/gtest.h>

#include <string>

namespace pathGeomTest {

using pathGeom::CubicBezier;
using pathGeom::LengthOptions;
using pathGeom::LineSegment;
using pathGeom::QuadraticBezier;
using pathGeom::Vector2;
using namespace pathGeom::model;

TEST( SegmentTests, TypeDispatch )
{
    const Segment line = LineSegment( Vector2( 0., 0. ), Vector2( 3., 4. ) );
    const Segment quad = QuadraticBezier( Vector2( 0., 0. ), Vector2( 1., 2. ), Vector2( 2., 0. ) );
    const Segment cubic = CubicBezier( Vector2( 0., 0. ), Vector2( 1., 1. ), Vector2( 2., -1. ), Vector2( 3., 0. ) );

    EXPECT_EQ( SegmentType::Line, segmentType( line ) );
    EXPECT_EQ( SegmentType::Quadratic, segmentType( quad ) );
    EXPECT_EQ( SegmentType::Cubic, segmentType( cubic ) );

    EXPECT_EQ( std::string( "line" ), segmentTypeName( segmentType( line ) ) );
    EXPECT_EQ( std::string( "quadratic" ), segmentTypeName( segmentType( quad ) ) );
    EXPECT_EQ( std::string( "cubic" ), segmentTypeName( segmentType( cubic ) ) );
}

TEST( SegmentTests, ForwardsToCurve )
{
    const QuadraticBezier q( Vector2( 0., 0. ), Vector2( 1., 2. ), Vector2( 2., 0. ) );
    const Segment seg = q;

    expectNearPos( q.position( 0.3 ), position( seg, 0.3 ) );
    EXPECT_EQ( q.boundingBox(), boundingBox( seg ) );
    EXPECT_DOUBLE_EQ( q.length(), length( seg ) );
    EXPECT_EQ( q.startPosition(), startPosition( seg ) );
    EXPECT_EQ( q.endPosition(), endPosition( seg ) );

    LengthOptions options;
    options.step = 0.1;
    EXPECT_DOUBLE_EQ( q.length( options ), length( seg, options ) );
}

TEST( SegmentTests, LineLengthIsExact )
{
    const Segment line = LineSegment( Vector2( 1., 1. ), Vector2( 4., 5. ) );
    EXPECT_DOUBLE_EQ( 5., length( line ) );

    LengthOptions options;
    options.step = 0.3;
    EXPECT_DOUBLE_EQ( 5., length( line, options ) );

    expectNearPos( Vector2( 2.5, 3. ), position( line, 0.5 ) );
    EXPECT_EQ( pathGeom::BoundingBoxd( Vector2( 1., 1. ), Vector2( 4., 5. ) ), boundingBox( line ) );
}

TEST( SegmentTests, ReverseCopyKeepsKind )
{
    const Segment cubic = CubicBezier( Vector2( 0., 0. ), Vector2( 1., 1. ), Vector2( 2., -1. ), Vector2( 3., 0. ) );
    const Segment rev = reverseCopy( cubic );
    EXPECT_EQ( SegmentType::Cubic, segmentType( rev ) );
    EXPECT_EQ( startPosition( cubic ), endPosition( rev ) );
    EXPECT_EQ( endPosition( cubic ), startPosition( rev ) );
    expectNearPos( position( cubic, 0.2 ), position( rev, 0.8 ) );

    const Segment line = LineSegment( Vector2( 1., 1. ), Vector2( 4., 5. ) );
    EXPECT_EQ( Vector2( 4., 5. ), startPosition( reverseCopy( line ) ) );
}

} // pathGeomTest
