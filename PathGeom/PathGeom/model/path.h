#ifndef PATHGEOM_MODEL_PATH_H
#define PATHGEOM_MODEL_PATH_H

#include <PathGeom/curves/lengthoptions.h>
#include <PathGeom/model/segment.h>
#include <PathGeom/utility/boundingbox.h>
#include <PathGeom/utility/vector2.h>

#include <boost/optional.hpp>

#include <vector>

namespace pathGeom {
namespace model {

/// An ordered list of segments, as produced by a path parser. Segments are stored by value.
/// Nothing requires consecutive segments to touch; see 'approxContinuous'.
class Path
{
public:
    using Segments = std::vector< Segment >;

    Path();
    explicit Path( const Segments& );

    void add( const Segment& );

    size_t size() const;
    bool empty() const;
    /// Throws 'RuntimeError' if 'i' is out of range.
    const Segment& segment( size_t i ) const;
    const Segments& segments() const;

    /// Union of the segment boxes, or boost::none for an empty path.
    boost::optional< BoundingBoxd > boundingBox() const;
    /// Sum of the segment lengths.
    double length() const;
    /// Throws 'InvalidLengthOptionsException'.
    double length( const LengthOptions& ) const;

    /// boost::none for an empty path.
    boost::optional< Vector2 > startPosition() const;
    boost::optional< Vector2 > endPosition() const;

    /// Position at 't' on segment 'segmentIndex'. Throws 'RuntimeError' if the index is out of range.
    Vector2 position( size_t segmentIndex, double t ) const;

    /// Return whether each segment starts within 'maxGap' of where the previous one ends.
    bool approxContinuous( double maxGap = defaultMaxGap ) const;
    /// Return whether the path ends exactly where it starts (says nothing about continuity in between).
    bool endpointsEqual() const;

    static constexpr double defaultMaxGap = 1e-6;
private:
    Segments _segments;
};

} // model
} // pathGeom

#endif // #include
