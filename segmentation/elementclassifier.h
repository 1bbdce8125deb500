#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "../config.hpp"
#include "../geometry/contour.hpp"

namespace floorplan {

/** Geometric features a classification decision is based on. */
struct ElementFeatures
{
    double area{0.0};              ///< absolute shoelace area (px²)
    double aspect{0.0};            ///< bounds width / (bounds height + 1e-9)
    bool   touchesBoundary{false}; ///< bounds within the margin of an image edge
};

/**
 * @brief Rule-based classifier assigning structural types to contours.
 *
 * The rules form an ordered decision table; the first rule whose condition
 * holds decides. A rule without a type drops the contour.
 */
class ElementClassifier
{
    struct Rule
    {
        std::string                                 name;  ///< rule identifier
        std::function<bool(const ElementFeatures&)> when;  ///< condition
        std::optional<ElementType>                  type;  ///< std::nullopt = drop
    };

public:
    explicit ElementClassifier(const ClassifierConfig& config = {});

    /** Features of a region with the given area and bounds. */
    ElementFeatures features(double area, const Bounds& bounds,
                             const cv::Size& imageSize) const;

    /** Classify from pre-computed features; std::nullopt = no category. */
    std::optional<ElementType> classify(const ElementFeatures& f) const;

    /** Convenience overload computing the features first. */
    std::optional<ElementType> classify(double area, const Bounds& bounds,
                                        const cv::Size& imageSize) const;

    /** Name of the rule that decides @p f, or "none" if no rule matches. */
    std::string matchingRule(const ElementFeatures& f) const;

    const ClassifierConfig& config() const noexcept { return config_; }

private:
    /** Build rules_ from the thresholds in config_. */
    void buildRules();

    const Rule* firstMatch(const ElementFeatures& f) const;

    ClassifierConfig  config_;
    std::vector<Rule> rules_;   ///< evaluated front to back
};

} // namespace floorplan
