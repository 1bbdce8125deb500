#pragma once
#include <string>

#include <yaml-cpp/yaml.h>

namespace floorplan {

    /** Configuration for decoding and downscaling the source image. */
    struct RasterConfig {
        int maxDimension = 800; ///< upper bound for max(width, height) of the working image
    };

    /** Configuration for the Sobel edge detector. */
    struct EdgeConfig {
        double magnitudeThreshold = 50.0; ///< pixel is an edge iff |grad| > threshold
    };

    /** Configuration for the connected region tracer. */
    struct TraceConfig {
        int minPoints = 10;   ///< regions with this many points or fewer are dropped
        int maxPoints = 1000; ///< per-region point cap
    };

    /**
     * Thresholds of the element decision table. Area bands are
     * (smallArea, mediumArea], (mediumArea, largeArea] and (largeArea, inf).
     */
    struct ClassifierConfig {
        double largeArea  = 5000.0;    ///< above: wall or room
        double mediumArea = 1000.0;    ///< above: door or wall
        double smallArea  = 200.0;     ///< above: window or dropped; at/below: dropped
        int    boundaryMarginPx = 5;   ///< "touches the border" distance

        double wallAspectHigh  = 3.0;  ///< large region stretched horizontally
        double wallAspectLow   = 0.33; ///< large region stretched vertically
        double doorAspectLow   = 0.4;  ///< medium region door window (exclusive)
        double doorAspectHigh  = 2.5;
        double windowAspectHigh = 2.0; ///< small region must be thinner than this
        double windowAspectLow  = 0.5;
    };

    /** Parameters of the external export formats. */
    struct ExportConfig {
        double unitsPerPixel = 0.01; ///< world units per working-image pixel
        double wallHeight    = 3.0;  ///< extrusion height of OBJ wall boxes
        std::string outputDir = "."; ///< where the CLI writes its files
        bool writeJson    = true;
        bool writeObj     = true;
        bool writeOverlay = true;
    };

    /** Combined configuration for the full pipeline. */
    struct PipelineConfig {
        RasterConfig     rasterConfig;     ///< rasterizer parameters
        EdgeConfig       edgeConfig;       ///< edge detector parameters
        TraceConfig      traceConfig;      ///< region tracer parameters
        ClassifierConfig classifierConfig; ///< decision table thresholds
        ExportConfig     exportConfig;     ///< exporter / CLI output parameters
    };

    /**
     * Overlay values found in @p root onto the defaults. Unknown keys are
     * ignored, missing keys keep their default.
     * @throws std::invalid_argument if a value is out of range.
     */
    PipelineConfig pipelineConfigFromYaml(const YAML::Node& root);

    /**
     * Load a YAML file and build the configuration from it.
     * @throws std::runtime_error if the file cannot be read or parsed.
     */
    PipelineConfig loadPipelineConfig(const std::string& path);

    /** Reject inconsistent parameters with std::invalid_argument. */
    void validate(const PipelineConfig& config);

} // namespace floorplan
