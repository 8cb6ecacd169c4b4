#ifndef PATHGEOM_EXCEPTIONS_RUNTIMEERROR_H
#define PATHGEOM_EXCEPTIONS_RUNTIMEERROR_H

#include <stdexcept>
#include <string>

namespace pathGeom {

/// A std::runtime_error that remembers where it was thrown.
class RuntimeError : public std::runtime_error
{
public:
    RuntimeError( const std::string& msg, const char* file, int line );

    const char* file() const;
    int line() const;
private:
    const char* _file;
    int _line;
};

} // pathGeom

#define PATHGEOM_THROW_RUNTIME( msg ) throw pathGeom::RuntimeError( ( msg ), __FILE__, __LINE__ )

#endif // #include
