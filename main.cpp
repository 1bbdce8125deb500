#include <iostream>
#include <fstream>
#include <iomanip>
#include <string>
#include <filesystem>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/highgui.hpp>

#include "config.hpp"
#include "floorplan_processing.hpp"
#include "exporters/jsonexporter.h"
#include "exporters/objexporter.h"
#include "utils.hpp"
#include "visualization.hpp"

using namespace floorplan;

static void printStats(const ProcessingResult& result)
{
    const ProcessingStats stats = summarize(result);
    std::cout << "Working image: " << result.imageWidth << "x" << result.imageHeight
              << " (scale " << std::fixed << std::setprecision(3) << result.scale << "x)" << std::endl;
    for (ElementType t : kElementTypes)
    {
        std::cout << "  " << std::left << std::setw(8) << toString(t) << std::right
                  << std::setw(5) << stats[t].count
                  << "   area " << std::setprecision(1) << stats[t].area << " px2" << std::endl;
    }
    std::cout << "  total   " << std::setw(5) << stats.total << std::endl;
}

int main(int argc, char** argv)
{
    if(argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <floorplan image> [config.yaml]" << std::endl;
        return 1;
    }

    std::string imageFile = argv[1];
    // explicit config, else default.yml next to the working directory, else built-in defaults
    std::string configFile = (argc >= 3) ? argv[2] : "default.yml";

    PipelineConfig config;
    if (argc >= 3 || std::filesystem::exists(configFile)) {
        try {
            config = loadPipelineConfig(configFile);
        } catch(const std::exception &e) {
            std::cerr << "Failed to load config file: " << e.what() << std::endl;
            return 1;
        }
        std::cout << "Loaded config from: " << configFile << std::endl;
    } else {
        std::cout << "Config file not found (" << configFile << "); using defaults." << std::endl;
    }

    std::vector<uchar> bytes;
    if (!readFileBytes(imageFile, bytes)) {
        std::cerr << "Failed to read image file: " << imageFile << std::endl;
        return 1;
    }

    ProcessingRun run;
    try {
        FloorPlanProcessor processor(config);
        run = processor.run(bytes);
    } catch (const DecodeError &e) {
        std::cerr << "Failed to process floor plan: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Loaded image: " << imageFile << " ("
              << run.raster.originalSize.width << "x" << run.raster.originalSize.height << ")" << std::endl;

    showMatDebug("Working Image", run.raster.rgba, /*isRGB=*/true);
    showMatDebug("Edge Mask", renderEdgeMask(run.edges));

    const ProcessingResult& result = run.result;
    printStats(result);

    const auto& exportCfg = config.exportConfig;
    const std::filesystem::path outDir(exportCfg.outputDir);
    int failures = 0;

    if (exportCfg.writeJson) {
        const auto path = outDir / "floorplan-3d-data.json";
        if (writeTextFile(path, exportJson(result)))
            std::cout << "JSON written to: " << path.string() << std::endl;
        else {
            std::cerr << "Failed to write " << path.string() << std::endl;
            ++failures;
        }
    }

    if (exportCfg.writeObj) {
        const auto path = outDir / "floorplan-3d-model.obj";
        ObjExporter obj(result, exportCfg);
        if (writeTextFile(path, obj.str()))
            std::cout << "OBJ written to: " << path.string()
                      << " (" << obj.boxCount() << " wall boxes)" << std::endl;
        else {
            std::cerr << "Failed to write " << path.string() << std::endl;
            ++failures;
        }
    }

    cv::Mat vis = renderElementsOverlay(result, run.raster.rgba, 0.8);
    if (exportCfg.writeOverlay) {
        const auto path = outDir / "classification_overlay.png";
        bool ok = false;
        try {
            ok = cv::imwrite(path.string(), vis);
        } catch (const cv::Exception &e) {
            std::cerr << "imwrite: " << e.what() << std::endl;
        }
        if (ok)
            std::cout << "Overlay written to: " << path.string() << std::endl;
        else {
            std::cerr << "Failed to write " << path.string() << std::endl;
            ++failures;
        }
    }

    if(!isHeadlessMode())
    {
        cv::imshow("classified", vis);
        std::cout << "Press any key to exit..." << std::endl;
        cv::waitKey(0);
    }
    return failures == 0 ? 0 : 1;
}
