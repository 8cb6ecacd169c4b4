#include <demoinputs.h>
#include <prepareinputs.h>
#include <savetofile.h>

#include <PathGeom/model/segment.h>

#include <PrintPaths/createfiles.h>

#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace {

std::filesystem::path outputImagePath( const std::string& scenarioName )
{
    return { scenarioName + std::string{ "_path." } + printPaths::epsExt() };
}

void runDemo( pathGeomDemo::DemoInputs&& inputs )
{
    static size_t numDemosRun = 0;

    std::cout << "\tScenario " << ( ++numDemosRun ) << ": " << inputs.name << std::endl;

    const auto& path = inputs.path;
    for( size_t i = 0; i < path.size(); i++ ) {
        const auto& seg = path.segment( i );
        std::cout << "\t\tSegment " << i << " ("
                  << pathGeom::model::segmentTypeName( pathGeom::model::segmentType( seg ) ) << "): "
                  << pathGeom::model::startPosition( seg ) << " -> " << pathGeom::model::endPosition( seg )
                  << std::endl;
        std::cout << "\t\t\tbounds " << pathGeom::model::boundingBox( seg )
                  << ", length " << pathGeom::model::length( seg )
                  << " (alternate " << pathGeom::model::length( seg, inputs.altLengthOptions ) << ")"
                  << std::endl;
    }

    if( const auto pathBox = path.boundingBox() ) {
        std::cout << "\t\tPath bounds " << *pathBox << std::endl;
    }
    std::cout << "\t\tPath length " << path.length()
              << ( path.approxContinuous() ? ", continuous" : ", discontinuous" )
              << ( path.endpointsEqual() ? ", closed" : "" ) << std::endl;

    const auto saveOutputPath = outputImagePath( inputs.name );
    pathGeomDemo::savePathEPS( path, saveOutputPath, inputs.canvasBounds );
    std::cout << "\t\tPath viewable in " << saveOutputPath << std::endl;
}

} // unnamed

int main( int, char *[] )
{
    std::cout << std::endl << "Path Geometry Demo:" << std::endl;

    try {
        runDemo( pathGeomDemo::prepareScenario_arch() );
        runDemo( pathGeomDemo::prepareScenario_wave() );
        runDemo( pathGeomDemo::prepareScenario_outline() );
        runDemo( pathGeomDemo::prepareScenario_degenerate() );
    } catch( const std::exception& e ) {
        std::cout << "Demo failed: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Demo complete." << std::endl;
    return 0;
}
