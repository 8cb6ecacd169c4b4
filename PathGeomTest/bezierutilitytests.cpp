#include <PathGeom/curves/invalidlengthoptionsexception.h>
#include <PathGeom/curves/lengthoptions.h>
#include <PathGeom/utility/bezierutility.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace pathGeomTest {

namespace bu = pathGeom::bezierUtility;
using pathGeom::LengthOptions;
using pathGeom::Vector2;

TEST( BezierUtilityTests, PolynomialEndpoints )
{
    EXPECT_DOUBLE_EQ( 3., bu::quadraticPolynomial( 3., 7., -1., 0. ) );
    EXPECT_DOUBLE_EQ( -1., bu::quadraticPolynomial( 3., 7., -1., 1. ) );
    EXPECT_DOUBLE_EQ( 3., bu::cubicPolynomial( 3., 7., 2., -1., 0. ) );
    EXPECT_DOUBLE_EQ( -1., bu::cubicPolynomial( 3., 7., 2., -1., 1. ) );
}

TEST( BezierUtilityTests, PolynomialMidpoint )
{
    // (a + 2b + c) / 4 and (a + 3b + 3c + d) / 8
    EXPECT_DOUBLE_EQ( 2., bu::quadraticPolynomial( 0., 4., 0., 0.5 ) );
    EXPECT_DOUBLE_EQ( 1.5, bu::cubicPolynomial( 0., 1., 2., 3., 0.5 ) );
}

TEST( BezierUtilityTests, QuadraticExtremaInterior )
{
    const auto range = bu::quadraticExtrema( 0., 2., 0. );
    EXPECT_DOUBLE_EQ( 0., range.min() );
    EXPECT_DOUBLE_EQ( 1., range.max() );
}

TEST( BezierUtilityTests, QuadraticExtremaRootOutsideUnitInterval )
{
    // Root is at T = (4-0)/(8-0-5) = 4/3.
    const auto range = bu::quadraticExtrema( 0., 4., 5. );
    EXPECT_DOUBLE_EQ( 0., range.min() );
    EXPECT_DOUBLE_EQ( 5., range.max() );
}

TEST( BezierUtilityTests, QuadraticExtremaZeroDenominator )
{
    // 2b - a - c == 0: the root is +-infinity, or NaN when b == a as well.
    const auto linear = bu::quadraticExtrema( 1., 2., 3. );
    EXPECT_DOUBLE_EQ( 1., linear.min() );
    EXPECT_DOUBLE_EQ( 3., linear.max() );

    const auto constant = bu::quadraticExtrema( 4., 4., 4. );
    EXPECT_DOUBLE_EQ( 4., constant.min() );
    EXPECT_DOUBLE_EQ( 4., constant.max() );
}

TEST( BezierUtilityTests, CubicCriticalValuesTwoRoots )
{
    // 3t(1-t)(1-2t) has extrema of +-sqrt(3)/6.
    const auto values = bu::cubicCriticalValues( 0., 1., -1., 0. );
    ASSERT_EQ( 2u, values.size() );
    const double expected = std::sqrt( 3. ) / 6.;
    EXPECT_NEAR( expected, std::max( values[ 0 ], values[ 1 ] ), 1e-12 );
    EXPECT_NEAR( -expected, std::min( values[ 0 ], values[ 1 ] ), 1e-12 );
}

TEST( BezierUtilityTests, CubicCriticalValuesNegativeDiscriminant )
{
    // Derivative 18t^2 - 12t + 3 has no real roots.
    EXPECT_TRUE( bu::cubicCriticalValues( 0., 1., 0., 3. ).empty() );
}

TEST( BezierUtilityTests, CubicCriticalValuesZeroLeadingCoefficient )
{
    // Evenly spaced: every derivative coefficient except the constant vanishes.
    EXPECT_TRUE( bu::cubicCriticalValues( 0., 1., 2., 3. ).empty() );
    // Flat: all coefficients vanish.
    EXPECT_TRUE( bu::cubicCriticalValues( 5., 5., 5., 5. ).empty() );
}

TEST( BezierUtilityTests, CubicExtremaIncludesEndpoints )
{
    const auto range = bu::cubicExtrema( 2., 0., 3., -1. );
    EXPECT_LE( range.min(), -1. );
    EXPECT_GE( range.max(), 2. );
}

TEST( BezierUtilityTests, ResolveLengthStep )
{
    LengthOptions options;
    EXPECT_DOUBLE_EQ( 0.25, bu::resolveLengthStep( options, 0.25 ) );
    options.step = 0.5;
    EXPECT_DOUBLE_EQ( 0.5, bu::resolveLengthStep( options, 0.25 ) );
    options.step = 1.;
    EXPECT_DOUBLE_EQ( 1., bu::resolveLengthStep( options, 0.25 ) );
}

TEST( BezierUtilityTests, ResolveLengthStepRejectsBadSteps )
{
    LengthOptions options;
    for( const double bad : { 0., -0.1, 1.5, LengthOptions::minStep * 0.5,
                              std::numeric_limits< double >::quiet_NaN(),
                              std::numeric_limits< double >::infinity() } ) {
        options.step = bad;
        EXPECT_THROW( bu::resolveLengthStep( options, 0.01 ), pathGeom::InvalidLengthOptionsException );
    }
}

TEST( BezierUtilityTests, NumClosedLengthIntervals )
{
    EXPECT_EQ( 100u, bu::numClosedLengthIntervals( 0.01 ) );
    EXPECT_EQ( 200u, bu::numClosedLengthIntervals( 0.005 ) );
    EXPECT_EQ( 4u, bu::numClosedLengthIntervals( 0.3 ) );
    EXPECT_EQ( 1u, bu::numClosedLengthIntervals( 1. ) );
}

TEST( BezierUtilityTests, PolylineLengthOfLine )
{
    const auto pos = []( double t )
    {
        return Vector2( 2. * t, 0. );
    };

    LengthOptions options;
    EXPECT_NEAR( 2., bu::polylineLength( pos, options, 0.01 ), 1e-9 );

    // The accumulating loop starts intervals at T = 0, 0.3, 0.6, 0.9, so the last one ends at T = 1.2.
    options.step = 0.3;
    EXPECT_NEAR( 2.4, bu::polylineLength( pos, options, 0.01 ), 1e-9 );

    options.closeFinalInterval = true;
    EXPECT_NEAR( 2., bu::polylineLength( pos, options, 0.01 ), 1e-9 );
}

} // pathGeomTest
