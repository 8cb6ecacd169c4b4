#include <PathGeom/utility/boundingbox.h>
#include <PathGeom/utility/boundinginterval.h>

#include <gtest/gtest.h>

namespace pathGeomTest {

using pathGeom::BoundingBoxd;
using pathGeom::BoundingIntervald;
using pathGeom::Vector2;

TEST( BoundingIntervalTests, SortsOnConstruction )
{
    const BoundingIntervald i( 5., -1. );
    EXPECT_DOUBLE_EQ( -1., i.min() );
    EXPECT_DOUBLE_EQ( 5., i.max() );
    EXPECT_DOUBLE_EQ( 6., i.length() );
    EXPECT_DOUBLE_EQ( 2., i.lerp( 0.5 ) );
}

TEST( BoundingIntervalTests, AddValue )
{
    BoundingIntervald i( 0., 1. );
    i.addValue( 0.5 );
    EXPECT_EQ( BoundingIntervald( 0., 1. ), i );
    i.addValue( -2. );
    i.addValue( 3. );
    EXPECT_EQ( BoundingIntervald( -2., 3. ), i );
    EXPECT_TRUE( i.contains( -2. ) );
    EXPECT_TRUE( i.contains( 3. ) );
    EXPECT_FALSE( i.contains( 3.5 ) );
}

TEST( BoundingIntervalTests, Intersection )
{
    const auto overlap = BoundingIntervald::intersection( { 0., 2. }, { 1., 3. } );
    ASSERT_TRUE( overlap.is_initialized() );
    EXPECT_EQ( BoundingIntervald( 1., 2. ), *overlap );

    const auto touching = BoundingIntervald::intersection( { 0., 1. }, { 1., 3. } );
    ASSERT_TRUE( touching.is_initialized() );
    EXPECT_DOUBLE_EQ( 0., touching->length() );

    EXPECT_FALSE( BoundingIntervald::intersection( { 0., 1. }, { 2., 3. } ).is_initialized() );
}

TEST( BoundingBoxTests, CornersAreOrdered )
{
    const BoundingBoxd box( Vector2( 4., -1. ), Vector2( 1., 3. ) );
    EXPECT_EQ( Vector2( 1., -1. ), box.min() );
    EXPECT_EQ( Vector2( 4., 3. ), box.max() );
    EXPECT_DOUBLE_EQ( 3., box.widthExclusive() );
    EXPECT_DOUBLE_EQ( 4., box.heightExclusive() );
    EXPECT_DOUBLE_EQ( 3., box.minDim() );
    EXPECT_DOUBLE_EQ( 4., box.maxDim() );
    EXPECT_DOUBLE_EQ( 12., box.area() );
}

TEST( BoundingBoxTests, GrowAndContain )
{
    BoundingBoxd box( Vector2( 0., 0. ), Vector2( 1., 1. ) );
    EXPECT_TRUE( box.contains( Vector2( 1., 0.5 ) ) );
    EXPECT_FALSE( box.contains( Vector2( 1.5, 0.5 ) ) );

    box.addPoint( Vector2( 2., -1. ) );
    EXPECT_EQ( BoundingBoxd( Vector2( 0., -1. ), Vector2( 2., 1. ) ), box );

    box.growToContain( BoundingBoxd( Vector2( -3., 0. ), Vector2( -2., 5. ) ) );
    EXPECT_EQ( BoundingBoxd( Vector2( -3., -1. ), Vector2( 2., 5. ) ), box );

    box.expand( 1. );
    EXPECT_EQ( BoundingBoxd( Vector2( -4., -2. ), Vector2( 3., 6. ) ), box );
}

TEST( BoundingBoxTests, Intersects )
{
    const BoundingBoxd a( Vector2( 0., 0. ), Vector2( 2., 2. ) );
    EXPECT_TRUE( a.intersects( BoundingBoxd( Vector2( 1., 1. ), Vector2( 3., 3. ) ) ) );
    EXPECT_TRUE( a.intersects( BoundingBoxd( Vector2( 2., 0. ), Vector2( 3., 1. ) ) ) );
    EXPECT_FALSE( a.intersects( BoundingBoxd( Vector2( 2.5, 0. ), Vector2( 3., 1. ) ) ) );
    EXPECT_FALSE( a.intersects( BoundingBoxd( Vector2( 0., 3. ), Vector2( 1., 4. ) ) ) );
}

TEST( BoundingBoxTests, ZeroAreaBox )
{
    const Vector2 p( 7., -3. );
    const BoundingBoxd box( p, p );
    EXPECT_DOUBLE_EQ( 0., box.area() );
    EXPECT_TRUE( box.contains( p ) );
    EXPECT_EQ( p, box.min() );
    EXPECT_EQ( p, box.max() );
}

} // pathGeomTest
