#include "elementclassifier.h"

namespace floorplan {

namespace {
constexpr double kAspectEpsilon = 1e-9;
}

ElementClassifier::ElementClassifier(const ClassifierConfig& config)
    : config_(config)
{
    buildRules();
}

void ElementClassifier::buildRules()
{
    const ClassifierConfig c = config_;

    auto large  = [c](const ElementFeatures& f) { return f.area > c.largeArea; };
    auto medium = [c](const ElementFeatures& f) { return f.area > c.mediumArea && f.area <= c.largeArea; };
    auto small  = [c](const ElementFeatures& f) { return f.area > c.smallArea  && f.area <= c.mediumArea; };

    rules_.clear();

    /* 1. large regions: outer/long structures are walls, the rest rooms */
    rules_.push_back({"large_wall",
        [=](const ElementFeatures& f) {
            return large(f) && (f.touchesBoundary ||
                                f.aspect > c.wallAspectHigh ||
                                f.aspect < c.wallAspectLow);
        },
        ElementType::Wall});
    rules_.push_back({"large_room", large, ElementType::Room});

    /* 2. medium regions: door-like proportions, otherwise wall segments */
    rules_.push_back({"medium_door",
        [=](const ElementFeatures& f) {
            return medium(f) && f.aspect > c.doorAspectLow && f.aspect < c.doorAspectHigh;
        },
        ElementType::Door});
    rules_.push_back({"medium_wall", medium, ElementType::Wall});

    /* 3. small regions: only elongated ones are windows */
    rules_.push_back({"small_window",
        [=](const ElementFeatures& f) {
            return small(f) && (f.aspect > c.windowAspectHigh || f.aspect < c.windowAspectLow);
        },
        ElementType::Window});
    rules_.push_back({"small_drop", small, std::nullopt});

    // area <= smallArea: no rule, dropped
}

ElementFeatures ElementClassifier::features(double area, const Bounds& bounds,
                                            const cv::Size& imageSize) const
{
    ElementFeatures f;
    f.area            = area;
    f.aspect          = bounds.width() / (bounds.height() + kAspectEpsilon);
    f.touchesBoundary = bounds.nearBorder(imageSize, config_.boundaryMarginPx);
    return f;
}

const ElementClassifier::Rule* ElementClassifier::firstMatch(const ElementFeatures& f) const
{
    for (const auto& rule : rules_)
        if (rule.when(f))
            return &rule;
    return nullptr;
}

std::optional<ElementType> ElementClassifier::classify(const ElementFeatures& f) const
{
    const Rule* rule = firstMatch(f);
    return rule ? rule->type : std::nullopt;
}

std::optional<ElementType> ElementClassifier::classify(double area, const Bounds& bounds,
                                                       const cv::Size& imageSize) const
{
    return classify(features(area, bounds, imageSize));
}

std::string ElementClassifier::matchingRule(const ElementFeatures& f) const
{
    const Rule* rule = firstMatch(f);
    return rule ? rule->name : "none";
}

} // namespace floorplan
