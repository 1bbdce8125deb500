#pragma once
#include <ostream>
#include <string>
#include <vector>
#include "../config.hpp"
#include "../floorplan_processing.hpp"

namespace floorplan {

/* -------------------------------------------------------------- *
 * ObjExporter: walls of a ProcessingResult as Wavefront OBJ boxes *
 * -------------------------------------------------------------- */
/**
 * @brief Emit one axis-aligned box per wall contour.
 *
 * Pixel (x, y) maps to world (x*u, -y*u) on the ground plane, boxes are
 * extruded from 0 to the wall height. Vertex indices are 1-based and keep
 * increasing across walls.
 */
class ObjExporter
{
public:
    explicit ObjExporter(const ProcessingResult& r, const ExportConfig& cfg = {})
        : walls_(r.walls), unitsPerPixel_(cfg.unitsPerPixel), wallHeight_(cfg.wallHeight) {}

    /** Whole OBJ document. */
    std::string str() const;

    /** Stream the document into @p os. */
    void write(std::ostream& os) const;

    /** Number of wall boxes that will be emitted (walls with >= 3 points). */
    std::size_t boxCount() const;

    /**
     * 8 "v" and 6 "f" lines for one wall, first vertex numbered
     * @p baseIndex.
     */
    std::string wallBox(const Contour& wall, std::size_t baseIndex) const;

private:
    std::vector<Contour> walls_; ///< copied, the result may be a temporary
    double               unitsPerPixel_;
    double               wallHeight_;
};

} // namespace floorplan
