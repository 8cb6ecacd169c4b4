#ifndef PATHGEOM_CURVES_INVALIDLENGTHOPTIONSEXCEPTION_H
#define PATHGEOM_CURVES_INVALIDLENGTHOPTIONSEXCEPTION_H

#include <stdexcept>

namespace pathGeom {

class InvalidLengthOptionsException : public std::runtime_error
{
public:
    InvalidLengthOptionsException( const char* msg ) : std::runtime_error( msg )
    {}
};

} // pathGeom

#endif // #include
