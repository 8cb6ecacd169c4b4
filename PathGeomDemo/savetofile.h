#ifndef PATHGEOMDEMO_SAVETOFILE_H
#define PATHGEOMDEMO_SAVETOFILE_H

#include <PathGeom/model/path.h>
#include <PathGeom/utility/boundingbox.h>

#include <filesystem>

namespace pathGeomDemo {

/// Save an EPS vector image showing 'path', the bounding box of each of its segments,
/// and the bounding box of the whole path. Use 'canvasBounds' as the view window.
void savePathEPS(
    const pathGeom::model::Path&,
    const std::filesystem::path&,
    const pathGeom::BoundingBoxd& canvasBounds );

} // pathGeomDemo

#endif // #include
