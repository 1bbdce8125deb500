#pragma once
/*-----------------------------------------------------------------------------
 *  contour.hpp
 *
 *  Plain geometry shared by every pipeline stage: the structural element
 *  categories, a traced contour and its axis-aligned bounds.
 *---------------------------------------------------------------------------*/
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace floorplan {

/** Structural category assigned to a traced region. */
enum class ElementType
{
    Wall,
    Door,
    Window,
    Room
};

/** All categories in export order (walls, doors, windows, rooms). */
inline constexpr ElementType kElementTypes[] = {
    ElementType::Wall, ElementType::Door, ElementType::Window, ElementType::Room
};

/** "wall", "door", "window" or "room". */
std::string toString(ElementType t);

/** Inverse of toString(); std::nullopt for unknown names. */
std::optional<ElementType> elementTypeFromString(const std::string& name);

/* ---------- bounding box -------------------------------------------------- */
/**
 * @brief Axis-aligned bounds of a point set, inclusive pixel coordinates.
 *
 * width()/height() are coordinate spans (max - min), so a single pixel has
 * zero extent.
 */
struct Bounds
{
    int minX{0};
    int minY{0};
    int maxX{0};
    int maxY{0};

    [[nodiscard]] int width () const noexcept { return maxX - minX; }
    [[nodiscard]] int height() const noexcept { return maxY - minY; }

    /** True when any side lies within @p margin pixels of the image border. */
    [[nodiscard]] bool nearBorder(const cv::Size& image, int margin) const noexcept
    {
        return minX <= margin || minY <= margin ||
               maxX >= image.width - margin || maxY >= image.height - margin;
    }
};

/* ---------- contour ------------------------------------------------------- */
/**
 * @brief One connected edge region with its derived area and category.
 */
struct Contour
{
    std::vector<cv::Point> points; ///< region pixels, tracer order
    double                 area{0.0}; ///< |shoelace(points)|
    ElementType            type{ElementType::Wall}; ///< assigned by the classifier
};

/**
 * @brief Absolute polygon area of the points taken in stored order
 *        (shoelace formula). Fewer than three points give 0.
 */
double shoelaceArea(const std::vector<cv::Point>& points);

/**
 * @brief Tight axis-aligned bounds of @p points.
 * @throws std::invalid_argument on an empty point list.
 */
Bounds boundsOf(const std::vector<cv::Point>& points);

} // namespace floorplan
