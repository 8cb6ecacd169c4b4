#ifndef PATHGEOMTEST_TESTUTILITY_H
#define PATHGEOMTEST_TESTUTILITY_H

#include <PathGeom/utility/boundingbox.h>
#include <PathGeom/utility/casts.h>
#include <PathGeom/utility/vector2.h>

#include <gtest/gtest.h>

#include <cstddef>

namespace pathGeomTest {

const double posTolerance = 1e-9;

inline void expectNearPos( const pathGeom::Vector2& expected, const pathGeom::Vector2& actual, double tol = posTolerance )
{
    EXPECT_NEAR( expected.x(), actual.x(), tol );
    EXPECT_NEAR( expected.y(), actual.y(), tol );
}

inline void expectNearBox( const pathGeom::BoundingBoxd& expected, const pathGeom::BoundingBoxd& actual, double tol = posTolerance )
{
    expectNearPos( expected.min(), actual.min(), tol );
    expectNearPos( expected.max(), actual.max(), tol );
}

/// Check that 'curve.position(t)' stays inside 'curve.boundingBox()' (plus rounding slack) for 'numSamples' T in [0,1].
template< typename Curve >
void expectBoundsEnclose( const Curve& curve, size_t numSamples = 201 )
{
    auto box = curve.boundingBox();
    box.expand( posTolerance );
    for( size_t i = 0; i < numSamples; i++ ) {
        const double t = PATHGEOM_F_FROM_I( i, numSamples );
        const auto p = curve.position( t );
        EXPECT_TRUE( box.contains( p ) ) << "t = " << t << ", p = " << p << ", box = " << box;
    }
}

} // pathGeomTest

#endif // #include
