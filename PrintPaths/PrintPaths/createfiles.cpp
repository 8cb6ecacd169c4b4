#include <PrintPaths/createfiles.h>

#include <PrintPaths/pathspostscript.h>

#include <PathGeom/exceptions/runtimeerror.h>

#include <fstream>

namespace printPaths {

void pathsPostScriptToEps( const PathsPostScript& pps, const std::string& filepath )
{
    const std::string psCode = pps.epsCode();
    savePSToFile( psCode, filepath );
}

void savePSToFile( const std::string& postScript, const std::string& filepath )
{
    std::ofstream file;
    file.open( filepath );
    if( !file ) {
        PATHGEOM_THROW_RUNTIME( "Could not open " + filepath + " for writing" );
    }
    file << postScript;
    file.close();
    if( !file ) {
        PATHGEOM_THROW_RUNTIME( "Failed writing " + filepath );
    }
}

std::string epsExt() { return "eps"; }

} // printPaths
