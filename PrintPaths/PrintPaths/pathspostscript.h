#ifndef PRINTPATHS_PATHSPOSTSCRIPT_H
#define PRINTPATHS_PATHSPOSTSCRIPT_H

#include <PathGeom/model/path.h>
#include <PathGeom/model/segment.h>
#include <PathGeom/utility/boundingbox.h>
#include <PathGeom/utility/vector2.h>

#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>

#include <array>
#include <sstream>
#include <string>

namespace printPaths {

/// An object for generating a PostScript file containing path segments specified in "canvas" space, which is some arbitrary drawing space
/// not strictly connected with the space in the generated PostScript. In canvas space, the origin is meant to appear at the topleft, contrary
/// to PostScript convention.
///
/// The PostScript region and the canvas region it depicts have the same aspect ratio.
class PathsPostScript : private boost::noncopyable
{
public:
    using Vec2 = pathGeom::Vector2;
    using Box = pathGeom::BoundingBoxd;
    using Segment = pathGeom::model::Segment;
    using Path = pathGeom::model::Path;

    /// In [0,255]
    using RGB = std::array< int, 3 >;

    /// Create an instance meant to draw the parts of segments that fall inside the indicated piece of canvas space.
    /// 'psMinDim' indirectly specifies the dimensions of the PostScript (this is so that the aspect ratio of
    /// the canvas region and the PostScript region will be the same).
    /// Throws 'RuntimeError' if 'canvas' has zero width or height.
    PathsPostScript( const Box& canvas, boost::optional< double > psMinDim = boost::none );

    void addSegment( const Segment& canvasSpace );
    /// Emit the whole path as a single stroked PostScript path; gaps between segments become moveto's.
    void addPath( const Path& canvasSpace );
    void addBoundingBox( const Box& canvasSpace );

    /// 'canvasSpace' is circle center
    void addCircle( const Vec2& canvasSpace, double radiusCanvas, bool strokeOrFill );

    /// Add the PostScript for changing the color unless this would be redundant. The provided are in [0,255].
    void setColor( const RGB& );
    void setColor( int r, int g, int b );
    /// Unless it would be redundant, add the PostScript for changing the line width, provided
    /// in canvas units (not in PostScript units).
    void setLineWidth( double canvasUnits );
    /// Return the current line width in canvas units.
    double lineWidth() const;

    /// Return a string which can be written as an EPS (Encapsulated PostScript) file.
    std::string epsCode() const;

    const Box& canvasBounds() const;
    const Box& psBounds() const;
private:
    /// Return whether 'psSpace', grown by the current line width, touches the page.
    bool onPage( Box psSpace ) const;

    /// Convert a one-dimensional quantity in canvas space to PostScript dimensions. This
    /// relies on the precondition that the canvas region and the PostScript region have the same
    /// aspect ratio.
    double canvasToPS( double ) const;
    double psToCanvas( double ) const;

    Vec2 canvasToPS( const Vec2& canvas ) const;
    Segment canvasToPS( const Segment& canvas ) const;

    /// Generate the EPS for a single segment, assuming it has been converted to the proper space.
    static std::string eps( const Segment&, bool initialMoveTo );

    std::stringstream _stream;

    Box _canvasBounds;
    Box _psBounds;

    RGB _currentRGB;
    double _currentLineWidthPS;
};

} // printPaths

#endif // #include
