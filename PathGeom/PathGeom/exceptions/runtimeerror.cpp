#include <exceptions/runtimeerror.h>

namespace pathGeom {

RuntimeError::RuntimeError( const std::string& msg, const char* file, int line )
    : std::runtime_error( msg )
    , _file( file )
    , _line( line )
{
}

const char* RuntimeError::file() const
{
    return _file;
}

int RuntimeError::line() const
{
    return _line;
}

} // pathGeom
