#include "config.hpp"

#include <stdexcept>

namespace floorplan {

namespace {

/* copies node[key] into value when present */
template<typename T>
void readIfPresent(const YAML::Node& node, const char* key, T& value)
{
    if (node && node[key])
        value = node[key].as<T>();
}

} // namespace

PipelineConfig pipelineConfigFromYaml(const YAML::Node& root)
{
    PipelineConfig cfg;
    if (!root || root.IsNull())
        return cfg;
    if (!root.IsMap())
        throw std::runtime_error("pipeline config: top level must be a map");

    try
    {
        if (auto n = root["raster"])
            readIfPresent(n, "max_dimension", cfg.rasterConfig.maxDimension);

        if (auto n = root["edges"])
            readIfPresent(n, "magnitude_threshold", cfg.edgeConfig.magnitudeThreshold);

        if (auto n = root["tracing"])
        {
            readIfPresent(n, "min_points", cfg.traceConfig.minPoints);
            readIfPresent(n, "max_points", cfg.traceConfig.maxPoints);
        }

        if (auto n = root["classifier"])
        {
            auto& c = cfg.classifierConfig;
            readIfPresent(n, "large_area",         c.largeArea);
            readIfPresent(n, "medium_area",        c.mediumArea);
            readIfPresent(n, "small_area",         c.smallArea);
            readIfPresent(n, "boundary_margin_px", c.boundaryMarginPx);
            readIfPresent(n, "wall_aspect_high",   c.wallAspectHigh);
            readIfPresent(n, "wall_aspect_low",    c.wallAspectLow);
            readIfPresent(n, "door_aspect_low",    c.doorAspectLow);
            readIfPresent(n, "door_aspect_high",   c.doorAspectHigh);
            readIfPresent(n, "window_aspect_high", c.windowAspectHigh);
            readIfPresent(n, "window_aspect_low",  c.windowAspectLow);
        }

        if (auto n = root["export"])
        {
            auto& e = cfg.exportConfig;
            readIfPresent(n, "units_per_pixel", e.unitsPerPixel);
            readIfPresent(n, "wall_height",     e.wallHeight);
            readIfPresent(n, "output_dir",      e.outputDir);
            readIfPresent(n, "json",            e.writeJson);
            readIfPresent(n, "obj",             e.writeObj);
            readIfPresent(n, "overlay",         e.writeOverlay);
        }
    }
    catch (const YAML::Exception& e)
    {
        throw std::runtime_error(std::string("pipeline config: ") + e.what());
    }

    validate(cfg);
    return cfg;
}

PipelineConfig loadPipelineConfig(const std::string& path)
{
    YAML::Node root;
    try
    {
        root = YAML::LoadFile(path);
    }
    catch (const YAML::Exception& e)
    {
        throw std::runtime_error("Failed to load config file '" + path + "': " + e.what());
    }
    return pipelineConfigFromYaml(root);
}

void validate(const PipelineConfig& config)
{
    if (config.rasterConfig.maxDimension <= 0)
        throw std::invalid_argument("raster.max_dimension must be positive");

    if (config.edgeConfig.magnitudeThreshold < 0.0)
        throw std::invalid_argument("edges.magnitude_threshold must not be negative");

    const auto& t = config.traceConfig;
    if (t.minPoints < 0)
        throw std::invalid_argument("tracing.min_points must not be negative");
    if (t.maxPoints <= t.minPoints)
        throw std::invalid_argument("tracing.max_points must exceed tracing.min_points");

    const auto& c = config.classifierConfig;
    if (c.smallArea < 0.0 || c.mediumArea <= c.smallArea || c.largeArea <= c.mediumArea)
        throw std::invalid_argument("classifier area bands must satisfy 0 <= small < medium < large");
    if (c.boundaryMarginPx < 0)
        throw std::invalid_argument("classifier.boundary_margin_px must not be negative");
    if (c.doorAspectLow >= c.doorAspectHigh)
        throw std::invalid_argument("classifier.door_aspect_low must be below door_aspect_high");

    const auto& e = config.exportConfig;
    if (e.unitsPerPixel <= 0.0)
        throw std::invalid_argument("export.units_per_pixel must be positive");
    if (e.wallHeight <= 0.0)
        throw std::invalid_argument("export.wall_height must be positive");
}

} // namespace floorplan
