#include "jsonexporter.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace floorplan {

json toJson(const cv::Point& p)
{
    return json{{"x", p.x}, {"y", p.y}};
}

json toJson(const Contour& c)
{
    json pts = json::array();
    for (const auto& p : c.points)
        pts.push_back(toJson(p));

    json j;
    j["points"] = std::move(pts);
    j["area"]   = c.area;
    j["type"]   = toString(c.type);
    return j;
}

json toJson(const ProcessingResult& result, const std::string& exportDate)
{
    auto list = [](const std::vector<Contour>& contours) {
        json arr = json::array();
        for (const auto& c : contours)
            arr.push_back(toJson(c));
        return arr;
    };

    json j;
    j["metadata"] = {
        {"scale",       result.scale},
        {"imageWidth",  result.imageWidth},
        {"imageHeight", result.imageHeight},
        {"exportDate",  exportDate}
    };
    j["elements"] = {
        {"walls",   list(result.walls)},
        {"doors",   list(result.doors)},
        {"windows", list(result.windows)},
        {"rooms",   list(result.rooms)}
    };
    return j;
}

std::string exportJson(const ProcessingResult& result, const std::string& exportDate)
{
    return toJson(result, exportDate).dump(2);
}

std::string exportJson(const ProcessingResult& result)
{
    return exportJson(result, currentIsoTimestamp());
}

std::string currentIsoTimestamp()
{
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto ms  = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    const std::time_t t = system_clock::to_time_t(now);

    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &t);
#else
    gmtime_r(&t, &utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
    return oss.str();
}

} // namespace floorplan
