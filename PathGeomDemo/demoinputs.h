#ifndef PATHGEOMDEMO_DEMOINPUTS_H
#define PATHGEOMDEMO_DEMOINPUTS_H

#include <PathGeom/curves/lengthoptions.h>
#include <PathGeom/model/path.h>
#include <PathGeom/utility/boundingbox.h>

#include <string>

namespace pathGeomDemo {

/// The inputs to a demonstration scenario.
struct DemoInputs
{
    /// Used to construct the path for saving the output image.
    std::string name;

    pathGeom::model::Path path;

    /// Compared against the default length approximation in the report.
    pathGeom::LengthOptions altLengthOptions;

    /// The canvas-space rectangle drawn in the exported image.
    pathGeom::BoundingBoxd canvasBounds;
};

} // pathGeomDemo

#endif // #include
