#include <testutility.h>

#include <PathGeom/curves/cubicbezier.h>
#include <PathGeom/curves/invalidlengthoptionsexception.h>
#include <PathGeom/curves/quadraticbezier.h>

#include <gtest/gtest.h>

#include <cmath>

namespace pathGeomTest {

using pathGeom::BoundingBoxd;
using pathGeom::LengthOptions;
using pathGeom::QuadraticBezier;
using pathGeom::Vector2;

namespace {

QuadraticBezier arch()
{
    return QuadraticBezier( Vector2( 0., 0. ), Vector2( 1., 2. ), Vector2( 2., 0. ) );
}

} // unnamed

TEST( QuadraticBezierTests, EndpointsMatchEvaluation )
{
    const QuadraticBezier q( Vector2( -1., 3. ), Vector2( 5., 7. ), Vector2( 2., -4. ) );
    expectNearPos( q.startPosition(), q.position( 0. ) );
    expectNearPos( q.endPosition(), q.position( 1. ) );
    EXPECT_EQ( Vector2( 5., 7. ), q.control() );
}

TEST( QuadraticBezierTests, Evaluate )
{
    expectNearPos( Vector2( 1., 1. ), arch().position( 0.5 ) );
    expectNearPos( Vector2( 0.5, 0.75 ), arch().position( 0.25 ) );
}

TEST( QuadraticBezierTests, EvaluateExtrapolates )
{
    // x(t) = 2t, y(t) = 4t(1-t)
    expectNearPos( Vector2( -1., -3. ), arch().position( -0.5 ) );
    expectNearPos( Vector2( 4., -8. ), arch().position( 2. ) );
}

TEST( QuadraticBezierTests, BoundsWithInteriorExtremum )
{
    const auto box = arch().boundingBox();
    EXPECT_DOUBLE_EQ( 0., box.xMin() );
    EXPECT_DOUBLE_EQ( 0., box.yMin() );
    EXPECT_DOUBLE_EQ( 2., box.xMax() );
    EXPECT_DOUBLE_EQ( 1., box.yMax() );
}

TEST( QuadraticBezierTests, BoundsIgnoreControlPointOutsideCurve )
{
    const QuadraticBezier q( Vector2( 0., 0. ), Vector2( 1., 10. ), Vector2( 2., 0. ) );
    EXPECT_DOUBLE_EQ( 5., q.boundingBox().yMax() );
}

TEST( QuadraticBezierTests, DegenerateCollinearEvenlySpaced )
{
    // 2B - A - C == 0 on both axes.
    const QuadraticBezier q( Vector2( 0., 0. ), Vector2( 1., 1. ), Vector2( 2., 2. ) );
    EXPECT_EQ( BoundingBoxd( Vector2( 0., 0. ), Vector2( 2., 2. ) ), q.boundingBox() );
}

TEST( QuadraticBezierTests, DegenerateSinglePoint )
{
    const Vector2 p( 3., -2. );
    const QuadraticBezier q( p, p, p );
    EXPECT_EQ( BoundingBoxd( p, p ), q.boundingBox() );
    EXPECT_NEAR( 0., q.length(), 1e-12 );
}

TEST( QuadraticBezierTests, BoundsEnclosure )
{
    expectBoundsEnclose( arch() );
    expectBoundsEnclose( QuadraticBezier( Vector2( -1., 3. ), Vector2( 5., 7. ), Vector2( 2., -4. ) ) );
    expectBoundsEnclose( QuadraticBezier( Vector2( 10., 10. ), Vector2( -20., 4. ), Vector2( 10., -2. ) ) );
}

TEST( QuadraticBezierTests, BoundsContainEndpoints )
{
    const QuadraticBezier q( Vector2( 4., 1. ), Vector2( 0., 0. ), Vector2( -3., 8. ) );
    const auto box = q.boundingBox();
    EXPECT_TRUE( box.contains( q.startPosition() ) );
    EXPECT_TRUE( box.contains( q.endPosition() ) );
}

TEST( QuadraticBezierTests, BoundsInvariantUnderReversal )
{
    const QuadraticBezier q( Vector2( -1., 3. ), Vector2( 5., 7. ), Vector2( 2., -4. ) );
    const auto rev = q.reverseCopy();
    EXPECT_EQ( q.startPosition(), rev.endPosition() );
    EXPECT_EQ( q.endPosition(), rev.startPosition() );
    expectNearBox( q.boundingBox(), rev.boundingBox() );
    expectNearBox( arch().boundingBox(), arch().reverseCopy().boundingBox() );
}

TEST( QuadraticBezierTests, LengthOfStraightCurve )
{
    const QuadraticBezier q( Vector2( 0., 0. ), Vector2( 1., 0. ), Vector2( 2., 0. ) );
    EXPECT_NEAR( 2., q.length(), 0.02 );

    LengthOptions closed;
    closed.closeFinalInterval = true;
    EXPECT_NEAR( 2., q.length( closed ), 1e-9 );
}

TEST( QuadraticBezierTests, LengthOfArch )
{
    // Closed form for x = 2t, y = 4t(1-t): integral of 2*sqrt(1 + (2-4t)^2).
    const double expected = std::sqrt( 5. ) + 0.5 * std::asinh( 2. );
    EXPECT_NEAR( expected, arch().length(), 1e-3 );
}

TEST( QuadraticBezierTests, LengthStepOptions )
{
    const QuadraticBezier q( Vector2( 0., 0. ), Vector2( 1., 0. ), Vector2( 2., 0. ) );

    LengthOptions coarse;
    coarse.step = 0.3;
    EXPECT_NEAR( 2.4, q.length( coarse ), 1e-9 );
    coarse.closeFinalInterval = true;
    EXPECT_NEAR( 2., q.length( coarse ), 1e-9 );

    LengthOptions bad;
    bad.step = 0.;
    EXPECT_THROW( q.length( bad ), pathGeom::InvalidLengthOptionsException );
}

TEST( QuadraticBezierTests, DefaultLengthMatchesDefaultStep )
{
    LengthOptions explicitStep;
    explicitStep.step = QuadraticBezier::defaultLengthStep;
    EXPECT_DOUBLE_EQ( arch().length(), arch().length( explicitStep ) );
}

TEST( QuadraticBezierTests, ToCubicTracesSameCurve )
{
    const QuadraticBezier q( Vector2( -1., 3. ), Vector2( 5., 7. ), Vector2( 2., -4. ) );
    const auto c = q.toCubic();
    EXPECT_EQ( q.startPosition(), c.startPosition() );
    EXPECT_EQ( q.endPosition(), c.endPosition() );
    for( size_t i = 0; i < 11; i++ ) {
        const double t = PATHGEOM_F_FROM_I( i, 11 );
        expectNearPos( q.position( t ), c.position( t ) );
    }
}

} // pathGeomTest
