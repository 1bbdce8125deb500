#ifndef UTILS_H
#define UTILS_H

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/highgui.hpp>

// Read a whole file into a byte buffer. Returns false if it cannot be opened.
static bool readFileBytes(const std::filesystem::path& path, std::vector<uchar>& out)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

// Write a text payload, creating parent directories as needed.
static bool writeTextFile(const std::filesystem::path& path, const std::string& text)
{
    std::error_code ec;
    if (path.has_parent_path())
        std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream out(path, std::ios::binary);
    if (!out)
        return false;
    out << text;
    return static_cast<bool>(out);
}

// True when no window can be shown (no display, or forced by env variable).
static bool isHeadlessMode()
{
    const char* forced = std::getenv("PLANANNOTATOR_HEADLESS");
    if (forced && std::string(forced) != "0")
        return true;
#if defined(_WIN32) || defined(__APPLE__)
    return false;
#else
    return std::getenv("DISPLAY") == nullptr && std::getenv("WAYLAND_DISPLAY") == nullptr;
#endif
}

/// Readable cv::Mat::type(), e.g. "CV_8UC4"
static std::string matTypeStr(int t)
{
    const int depth = t & CV_MAT_DEPTH_MASK;
    const int chans = 1 + (t >> CV_CN_SHIFT);

    const char* depthStr =
        depth == CV_8U  ? "CV_8U"  :
        depth == CV_8S  ? "CV_8S"  :
        depth == CV_16U ? "CV_16U" :
        depth == CV_16S ? "CV_16S" :
        depth == CV_32S ? "CV_32S" :
        depth == CV_32F ? "CV_32F" :
        depth == CV_64F ? "CV_64F" : "UNKNOWN";

    std::ostringstream oss;
    oss << depthStr << 'C' << chans;
    return oss.str();
}

/**
 *  Converts an arbitrary cv::Mat into something imshow/imwrite accept:
 *  CV_8U with 1 or 3 channels (BGR).
 *
 *  @param  src     any matrix (depth 8/16/32/64, 1, 3 or 4 channels)
 *  @param  dst     result
 *  @param  isRGB   true if a 3/4-channel @p src is in RGB(A) order
 */
static inline bool toDisplayable(const cv::Mat& src, cv::Mat& dst, bool isRGB = false)
{
    if (src.empty())
        return false;

    /* ---------- depth to 8 bit ------------------------------------------ */
    cv::Mat tmp;
    if (src.depth() == CV_8U) {
        tmp = src;
    } else {
        double minVal, maxVal;
        cv::minMaxLoc(src.reshape(1), &minVal, &maxVal);
        if (maxVal - minVal < 1e-12) maxVal = minVal + 1.0;

        double scale = 255.0 / (maxVal - minVal);
        double shift = -minVal * scale;
        src.convertTo(tmp, CV_8U, scale, shift);
    }

    /* ---------- channels ------------------------------------------------- */
    switch (tmp.channels()) {
        case 1: dst = tmp; break;
        case 3: if (isRGB) cv::cvtColor(tmp, dst, cv::COLOR_RGB2BGR);  else dst = tmp; break;
        case 4: cv::cvtColor(tmp, dst, isRGB ? cv::COLOR_RGBA2BGR : cv::COLOR_BGRA2BGR); break;
        default:
            std::cerr << "[toDisplayable] unsupported type " << matTypeStr(src.type()) << std::endl;
            return false;
    }
    return true;
}

// Show an intermediate image unless running headless.
static void showMatDebug(const std::string& windowName, const cv::Mat& mat, bool isRGB = false)
{
    if (isHeadlessMode())
        return;

    cv::Mat vis;
    if (toDisplayable(mat, vis, isRGB))
    {
        cv::namedWindow(windowName, cv::WINDOW_NORMAL | cv::WINDOW_KEEPRATIO);
        cv::resizeWindow(windowName, vis.cols, vis.rows);
        cv::imshow(windowName, vis);
    }
}

#endif // UTILS_H
