#include "objexporter.h"

#include <algorithm>
#include <array>
#include <limits>
#include <sstream>

using namespace std;

namespace floorplan {

/* 1. one box ---------------------------------------------------- */
string ObjExporter::wallBox(const Contour& wall, size_t baseIndex) const
{
    double minX =  numeric_limits<double>::infinity();
    double maxX = -numeric_limits<double>::infinity();
    double minZ =  numeric_limits<double>::infinity();
    double maxZ = -numeric_limits<double>::infinity();

    for (const auto& p : wall.points)
    {
        const double x = p.x * unitsPerPixel_;
        // image rows grow downwards; avoid printing "-0" for row 0
        const double z = p.y == 0 ? 0.0 : -p.y * unitsPerPixel_;
        minX = min(minX, x);  maxX = max(maxX, x);
        minZ = min(minZ, z);  maxZ = max(maxZ, z);
    }

    const double h = wallHeight_;
    const array<array<double, 3>, 8> vertices = {{
        {minX, 0, minZ}, {maxX, 0, minZ}, {maxX, 0, maxZ}, {minX, 0, maxZ},
        {minX, h, minZ}, {maxX, h, minZ}, {maxX, h, maxZ}, {minX, h, maxZ},
    }};

    ostringstream oss;
    for (const auto& v : vertices)
        oss << "v " << v[0] << ' ' << v[1] << ' ' << v[2] << '\n';

    const size_t b = baseIndex;
    oss << "f " << b     << ' ' << b + 1 << ' ' << b + 2 << ' ' << b + 3 << '\n'  // bottom
        << "f " << b + 4 << ' ' << b + 7 << ' ' << b + 6 << ' ' << b + 5 << '\n'  // top
        << "f " << b     << ' ' << b + 4 << ' ' << b + 5 << ' ' << b + 1 << '\n'  // front
        << "f " << b + 2 << ' ' << b + 6 << ' ' << b + 7 << ' ' << b + 3 << '\n'  // back
        << "f " << b + 3 << ' ' << b + 7 << ' ' << b + 4 << ' ' << b     << '\n'  // left
        << "f " << b + 1 << ' ' << b + 5 << ' ' << b + 6 << ' ' << b + 2 << '\n'; // right
    return oss.str();
}

/* 2. whole document --------------------------------------------- */
void ObjExporter::write(ostream& os) const
{
    os << "# Floor Plan 3D Model\n";
    size_t vertexIndex = 1;
    for (const auto& wall : walls_)
    {
        if (wall.points.size() < 3) continue;
        os << wallBox(wall, vertexIndex);
        vertexIndex += 8;
    }
}

string ObjExporter::str() const
{
    ostringstream oss;
    write(oss);
    return oss.str();
}

size_t ObjExporter::boxCount() const
{
    return static_cast<size_t>(count_if(walls_.begin(), walls_.end(),
                                        [](const Contour& c){ return c.points.size() >= 3; }));
}

} // namespace floorplan
