#include <PathGeom/utility/linesegment.h>

#include <gtest/gtest.h>

namespace pathGeomTest {

using pathGeom::LineSegment;
using pathGeom::Vector2;

TEST( LineSegmentTests, Length )
{
    EXPECT_DOUBLE_EQ( 5., LineSegment( Vector2( 1., 1. ), Vector2( 4., 5. ) ).length() );
    EXPECT_DOUBLE_EQ( 0., LineSegment( Vector2( 2., 2. ), Vector2( 2., 2. ) ).length() );
}

TEST( LineSegmentTests, PositionAndEndpoints )
{
    const LineSegment seg( Vector2( 0., 0. ), Vector2( 4., -2. ) );
    EXPECT_EQ( seg.a, seg.position( 0. ) );
    EXPECT_EQ( seg.b, seg.position( 1. ) );
    EXPECT_EQ( Vector2( 2., -1. ), seg.position( 0.5 ) );
    EXPECT_EQ( seg.midpoint(), seg.position( 0.5 ) );
    EXPECT_EQ( seg.a, seg.startPosition() );
    EXPECT_EQ( seg.b, seg.endPosition() );
    EXPECT_EQ( Vector2( 4., -2. ), seg.asVec() );
}

TEST( LineSegmentTests, ReverseAndBounds )
{
    const LineSegment seg( Vector2( 3., 0. ), Vector2( 1., 2. ) );
    const auto rev = seg.reverse();
    EXPECT_EQ( seg.a, rev.b );
    EXPECT_EQ( seg.b, rev.a );

    const auto box = seg.boundingBox();
    EXPECT_EQ( Vector2( 1., 0. ), box.min() );
    EXPECT_EQ( Vector2( 3., 2. ), box.max() );
    EXPECT_EQ( box, rev.boundingBox() );
}

} // pathGeomTest
