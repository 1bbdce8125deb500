#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "../floorplan_processing.hpp"

namespace floorplan {

using json = nlohmann::json;

/** {"x": .., "y": ..} */
json toJson(const cv::Point& p);

/** {"points": [...], "area": .., "type": "wall"|"door"|"window"|"room"} */
json toJson(const Contour& c);

/**
 * @brief Full export document.
 *
 *  {
 *    "metadata": { "scale", "imageWidth", "imageHeight", "exportDate" },
 *    "elements": { "walls": [...], "doors": [...], "windows": [...], "rooms": [...] }
 *  }
 *
 * @param exportDate  ISO-8601 timestamp written into the metadata.
 */
json toJson(const ProcessingResult& result, const std::string& exportDate);

/** Pretty-printed (2-space) document stamped with the current UTC time. */
std::string exportJson(const ProcessingResult& result);

/** Pretty-printed (2-space) document with a caller supplied date. */
std::string exportJson(const ProcessingResult& result, const std::string& exportDate);

/** Current UTC time as YYYY-MM-DDTHH:MM:SS.mmmZ */
std::string currentIsoTimestamp();

} // namespace floorplan
