#include <savetofile.h>

#include <PrintPaths/createfiles.h>
#include <PrintPaths/pathspostscript.h>

namespace pathGeomDemo {

namespace {

using PPS = printPaths::PathsPostScript;

const PPS::RGB pathRGB{ 0, 0, 0 };
const PPS::RGB segmentBoxRGB{ 150, 150, 150 };
const PPS::RGB pathBoxRGB{ 200, 30, 30 };
const PPS::RGB endpointRGB{ 30, 30, 200 };

const double lineWidthCanvas = 3.;
const double endpointRadiusCanvas = 6.;

} // unnamed

void savePathEPS(
    const pathGeom::model::Path& path,
    const std::filesystem::path& filepath,
    const pathGeom::BoundingBoxd& canvasBounds )
{
    PPS pps( canvasBounds, canvasBounds.minDim() );
    pps.setLineWidth( lineWidthCanvas * 0.5 );

    pps.setColor( segmentBoxRGB );
    for( const auto& seg : path.segments() ) {
        pps.addBoundingBox( pathGeom::model::boundingBox( seg ) );
    }

    if( const auto pathBox = path.boundingBox() ) {
        pps.setColor( pathBoxRGB );
        pps.addBoundingBox( *pathBox );
    }

    pps.setLineWidth( lineWidthCanvas );
    pps.setColor( pathRGB );
    pps.addPath( path );

    pps.setColor( endpointRGB );
    for( const auto& seg : path.segments() ) {
        pps.addCircle( pathGeom::model::startPosition( seg ), endpointRadiusCanvas, false );
        pps.addCircle( pathGeom::model::endPosition( seg ), endpointRadiusCanvas, false );
    }

    printPaths::pathsPostScriptToEps( pps, filepath.u8string() );
}

} // pathGeomDemo
