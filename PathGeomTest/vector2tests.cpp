#include <PathGeom/utility/mathutility.h>
#include <PathGeom/utility/vector2.h>

#include <gtest/gtest.h>

#include <limits>
#include <sstream>

namespace pathGeomTest {

using pathGeom::Vector2;

TEST( Vector2Tests, Arithmetic )
{
    const Vector2 a( 1., 2. );
    const Vector2 b( 4., -2. );

    EXPECT_EQ( Vector2( 5., 0. ), a + b );
    EXPECT_EQ( Vector2( -3., 4. ), a - b );
    EXPECT_EQ( Vector2( 2., 4. ), a * 2. );
    EXPECT_DOUBLE_EQ( 0., Vector2::dot( a, b ) );

    Vector2 c = a;
    c += b;
    c -= a;
    c *= 0.5;
    EXPECT_EQ( Vector2( 2., -1. ), c );
}

TEST( Vector2Tests, LengthAndNormalize )
{
    Vector2 v( 3., 4. );
    EXPECT_DOUBLE_EQ( 5., v.length() );
    EXPECT_DOUBLE_EQ( 25., v.lengthSquared() );

    v.normalize();
    EXPECT_DOUBLE_EQ( 1., v.length() );
    EXPECT_DOUBLE_EQ( 0.6, v.x() );

    Vector2 zero;
    zero.normalize();
    EXPECT_EQ( Vector2( 0., 0. ), zero );
}

TEST( Vector2Tests, Lerp )
{
    const Vector2 a( 0., 10. );
    const Vector2 b( 10., 0. );
    EXPECT_EQ( a, Vector2::lerp( a, b, 0. ) );
    EXPECT_EQ( b, Vector2::lerp( a, b, 1. ) );
    EXPECT_EQ( Vector2( 5., 5. ), Vector2::lerp( a, b, 0.5 ) );
    EXPECT_EQ( Vector2( 5., 5. ), pathGeom::mathUtility::lerp( a, b, 0.5 ) );
}

TEST( Vector2Tests, Streams )
{
    std::stringstream str;
    str << Vector2( 1.5, -2. );
    EXPECT_EQ( "(1.5, -2)", str.str() );
}

TEST( MathUtilityTests, UnitInterval )
{
    using pathGeom::mathUtility::inUnitInterval;
    EXPECT_TRUE( inUnitInterval( 0. ) );
    EXPECT_TRUE( inUnitInterval( 1. ) );
    EXPECT_TRUE( inUnitInterval( 0.5 ) );
    EXPECT_FALSE( inUnitInterval( -1e-12 ) );
    EXPECT_FALSE( inUnitInterval( 1. + 1e-12 ) );
    EXPECT_FALSE( inUnitInterval( std::numeric_limits< double >::quiet_NaN() ) );
    EXPECT_FALSE( inUnitInterval( std::numeric_limits< double >::infinity() ) );
    EXPECT_FALSE( inUnitInterval( -std::numeric_limits< double >::infinity() ) );
}

TEST( MathUtilityTests, CloseEnough )
{
    using namespace pathGeom::mathUtility;
    EXPECT_TRUE( closeEnough( 1., 1. + 1e-10 ) );
    EXPECT_FALSE( closeEnough( 1., 1.001 ) );
    EXPECT_TRUE( closeEnough( 1., 1.001, 0.01 ) );
    EXPECT_TRUE( closeEnoughToZero( -1e-9 ) );
    EXPECT_FALSE( closeEnoughToZero( 1e-3 ) );
}

} // pathGeomTest
