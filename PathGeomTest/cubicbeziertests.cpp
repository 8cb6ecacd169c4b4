#include <testutility.h>

#include <PathGeom/curves/cubicbezier.h>
#include <PathGeom/curves/invalidlengthoptionsexception.h>
#include <PathGeom/curves/quadraticbezier.h>

#include <boost/math/constants/constants.hpp>

#include <gtest/gtest.h>

#include <cmath>

namespace pathGeomTest {

using pathGeom::BoundingBoxd;
using pathGeom::CubicBezier;
using pathGeom::LengthOptions;
using pathGeom::QuadraticBezier;
using pathGeom::Vector2;

namespace {

/// x(t) = 3t, y(t) = 3t(1-t)(1-2t)
CubicBezier wave()
{
    return CubicBezier( Vector2( 0., 0. ), Vector2( 1., 1. ), Vector2( 2., -1. ), Vector2( 3., 0. ) );
}

/// The usual 4-Bezier circle's first quarter.
CubicBezier quarterCircle()
{
    const double kappa = 0.5522847498;
    return CubicBezier( Vector2( 1., 0. ), Vector2( 1., kappa ), Vector2( kappa, 1. ), Vector2( 0., 1. ) );
}

} // unnamed

TEST( CubicBezierTests, EndpointsMatchEvaluation )
{
    const CubicBezier c( Vector2( -2., 1. ), Vector2( 4., 9. ), Vector2( 0., -3. ), Vector2( 5., 5. ) );
    expectNearPos( c.startPosition(), c.position( 0. ) );
    expectNearPos( c.endPosition(), c.position( 1. ) );

    const auto control = c.controlPoints();
    EXPECT_EQ( c.startPosition(), control[ 0 ] );
    EXPECT_EQ( c.control1(), control[ 1 ] );
    EXPECT_EQ( c.control2(), control[ 2 ] );
    EXPECT_EQ( c.endPosition(), control[ 3 ] );
}

TEST( CubicBezierTests, Evaluate )
{
    expectNearPos( Vector2( 1.5, 0. ), wave().position( 0.5 ) );
    expectNearPos( Vector2( 0.75, 0.28125 ), wave().position( 0.25 ) );
    // Extrapolation is allowed.
    expectNearPos( Vector2( -3., -18. ), wave().position( -1. ) );
}

TEST( CubicBezierTests, BoundsWithTwoInteriorExtrema )
{
    const auto box = wave().boundingBox();
    const double extreme = std::sqrt( 3. ) / 6.;
    EXPECT_DOUBLE_EQ( 0., box.xMin() );
    EXPECT_DOUBLE_EQ( 3., box.xMax() );
    EXPECT_NEAR( -extreme, box.yMin(), 1e-12 );
    EXPECT_NEAR( extreme, box.yMax(), 1e-12 );
}

TEST( CubicBezierTests, BoundsSeededByEndpointsOnly )
{
    // Control points far outside the curve must not leak into the box.
    const CubicBezier c( Vector2( 0., 0. ), Vector2( 0., 4. ), Vector2( 1., 2. ), Vector2( 1., 0. ) );
    const auto box = c.boundingBox();
    EXPECT_NEAR( 4. / std::sqrt( 3. ), box.yMax(), 1e-12 );
    EXPECT_DOUBLE_EQ( 0., box.yMin() );
    EXPECT_DOUBLE_EQ( 0., box.xMin() );
    EXPECT_DOUBLE_EQ( 1., box.xMax() );
}

TEST( CubicBezierTests, NoRealDerivativeRoots )
{
    // y' = 18t^2 - 12t + 3 > 0: the box is just the endpoints on that axis.
    const CubicBezier c( Vector2( 0., 0. ), Vector2( 1., 1. ), Vector2( 2., 0. ), Vector2( 3., 3. ) );
    const auto box = c.boundingBox();
    EXPECT_DOUBLE_EQ( 0., box.yMin() );
    EXPECT_DOUBLE_EQ( 3., box.yMax() );
}

TEST( CubicBezierTests, DegenerateCubicTermCancels )
{
    // Evenly spaced collinear points: the derivative's leading coefficient is 0 on both axes.
    const CubicBezier c( Vector2( 0., 0. ), Vector2( 1., 1. ), Vector2( 2., 2. ), Vector2( 3., 3. ) );
    EXPECT_EQ( BoundingBoxd( Vector2( 0., 0. ), Vector2( 3., 3. ) ), c.boundingBox() );
    expectBoundsEnclose( c );
}

TEST( CubicBezierTests, ZeroLeadingCoefficientSkipsLowerDegreeRoot )
{
    // A degree-elevated arch: on Y the derivative's leading coefficient is exactly 0, so the plain
    // quadratic formula divides by zero and the T=0.5 peak is not folded in. Only the endpoints count.
    const QuadraticBezier q( Vector2( 0., 0. ), Vector2( 1., 2. ), Vector2( 2., 0. ) );
    const CubicBezier c = q.toCubic();
    ASSERT_EQ( c.control1().y(), c.control2().y() );

    const auto box = c.boundingBox();
    EXPECT_DOUBLE_EQ( 0., box.yMin() );
    EXPECT_DOUBLE_EQ( 0., box.yMax() );
    EXPECT_DOUBLE_EQ( 0., box.xMin() );
    EXPECT_DOUBLE_EQ( 2., box.xMax() );

    EXPECT_DOUBLE_EQ( 1., q.boundingBox().yMax() );
}

TEST( CubicBezierTests, DegeneratePointCurve )
{
    const Vector2 p( 4., -7. );
    const CubicBezier c( p, p, p, p );
    for( size_t i = 0; i < 11; i++ ) {
        expectNearPos( p, c.position( PATHGEOM_F_FROM_I( i, 11 ) ) );
    }
    EXPECT_NEAR( 0., c.length(), 1e-9 );

    const auto box = c.boundingBox();
    EXPECT_EQ( BoundingBoxd( p, p ), box );
    EXPECT_DOUBLE_EQ( 0., box.area() );
}

TEST( CubicBezierTests, BoundsEnclosure )
{
    expectBoundsEnclose( wave() );
    expectBoundsEnclose( quarterCircle() );
    expectBoundsEnclose( CubicBezier( Vector2( -2., 1. ), Vector2( 4., 9. ), Vector2( 0., -3. ), Vector2( 5., 5. ) ) );
    expectBoundsEnclose( CubicBezier( Vector2( 0., 0. ), Vector2( 10., 10. ), Vector2( -10., 8. ), Vector2( 0., 0. ) ) );
}

TEST( CubicBezierTests, BoundsContainEndpoints )
{
    const CubicBezier c( Vector2( 5., -1. ), Vector2( 2., 2. ), Vector2( 8., 0. ), Vector2( -4., 6. ) );
    const auto box = c.boundingBox();
    EXPECT_TRUE( box.contains( c.startPosition() ) );
    EXPECT_TRUE( box.contains( c.endPosition() ) );
}

TEST( CubicBezierTests, BoundsInvariantUnderReversal )
{
    const auto c = CubicBezier( Vector2( -2., 1. ), Vector2( 4., 9. ), Vector2( 0., -3. ), Vector2( 5., 5. ) );
    const auto rev = c.reverseCopy();
    EXPECT_EQ( c.startPosition(), rev.endPosition() );
    EXPECT_EQ( c.control1(), rev.control2() );
    expectNearBox( c.boundingBox(), rev.boundingBox() );
    expectNearBox( wave().boundingBox(), wave().reverseCopy().boundingBox() );
}

TEST( CubicBezierTests, LengthOfStraightCurve )
{
    const CubicBezier c( Vector2( 0., 0. ), Vector2( 1., 0. ), Vector2( 2., 0. ), Vector2( 3., 0. ) );
    EXPECT_NEAR( 3., c.length(), 0.03 );

    LengthOptions closed;
    closed.closeFinalInterval = true;
    EXPECT_NEAR( 3., c.length( closed ), 1e-9 );
}

TEST( CubicBezierTests, LengthOfQuarterCircle )
{
    const double halfPi = boost::math::constants::half_pi< double >();
    EXPECT_NEAR( halfPi, quarterCircle().length(), 1e-3 );

    LengthOptions fine;
    fine.step = 0.0005;
    fine.closeFinalInterval = true;
    EXPECT_NEAR( halfPi, quarterCircle().length( fine ), 1e-3 );
}

TEST( CubicBezierTests, LengthStepOptions )
{
    LengthOptions explicitStep;
    explicitStep.step = CubicBezier::defaultLengthStep;
    EXPECT_DOUBLE_EQ( wave().length(), wave().length( explicitStep ) );

    LengthOptions bad;
    bad.step = 2.;
    EXPECT_THROW( wave().length( bad ), pathGeom::InvalidLengthOptionsException );
}

} // pathGeomTest
