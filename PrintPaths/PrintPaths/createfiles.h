#ifndef PRINTPATHS_CREATEFILES_H
#define PRINTPATHS_CREATEFILES_H

#include <string>

namespace printPaths {

class PathsPostScript;

std::string epsExt();
/// Throws 'RuntimeError' if the file cannot be written.
void pathsPostScriptToEps( const PathsPostScript&, const std::string& filepath );
/// Throws 'RuntimeError' if the file cannot be written.
void savePSToFile( const std::string& postScript, const std::string& filepath );

} // printPaths

#endif // #include
