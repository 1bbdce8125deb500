#include <rclcpp/rclcpp.hpp>
#include <sensor_msgs/msg/compressed_image.hpp>
#include <sensor_msgs/msg/image.hpp>
#include <std_msgs/msg/string.hpp>
#include <opencv2/highgui.hpp>
#include "config.hpp"
#include "floorplan_processing.hpp"
#include "exporters/jsonexporter.h"
#include "utils.hpp"
#include "visualization.hpp"

using namespace std::placeholders;

using floorplan::FloorPlanProcessor;
using floorplan::PipelineConfig;

class PlanAnnotatorNode : public rclcpp::Node
{
public:
    PlanAnnotatorNode() : Node("plan_annotator_node"), processor_(makeConfig())
    {
        image_topic_    = this->declare_parameter("image_topic", std::string("/floorplan/image/compressed"));
        elements_topic_ = this->declare_parameter("elements_topic", std::string("/floorplan/elements"));
        overlay_topic_  = this->declare_parameter("overlay_topic", std::string("/floorplan/overlay"));

        image_sub_ = this->create_subscription<sensor_msgs::msg::CompressedImage>(
            image_topic_, 10, std::bind(&PlanAnnotatorNode::imageCallback, this, _1));
        elements_pub_ = this->create_publisher<std_msgs::msg::String>(elements_topic_, 10);
        overlay_pub_  = this->create_publisher<sensor_msgs::msg::Image>(overlay_topic_, 10);
    }

private:
    PipelineConfig makeConfig()
    {
        PipelineConfig cfg;

        const std::string configFile = this->declare_parameter("config_file", std::string(""));
        if (!configFile.empty())
            cfg = floorplan::loadPipelineConfig(configFile);

        cfg.rasterConfig.maxDimension =
            this->declare_parameter("raster.max_dimension", cfg.rasterConfig.maxDimension);
        cfg.edgeConfig.magnitudeThreshold =
            this->declare_parameter("edges.magnitude_threshold", cfg.edgeConfig.magnitudeThreshold);
        cfg.traceConfig.minPoints =
            this->declare_parameter("tracing.min_points", cfg.traceConfig.minPoints);
        cfg.traceConfig.maxPoints =
            this->declare_parameter("tracing.max_points", cfg.traceConfig.maxPoints);
        return cfg;
    }

    void imageCallback(const sensor_msgs::msg::CompressedImage::SharedPtr msg)
    {
        floorplan::ProcessingRun run;
        try
        {
            run = processor_.run(std::vector<uchar>(msg->data.begin(), msg->data.end()));
        }
        catch (const floorplan::DecodeError &e)
        {
            RCLCPP_WARN(this->get_logger(), "Skipping floor plan (%s): %s",
                        msg->format.c_str(), e.what());
            return;
        }

        std_msgs::msg::String out;
        out.data = floorplan::exportJson(run.result);
        elements_pub_->publish(out);

        cv::Mat vis = floorplan::renderElementsOverlay(run.result, run.raster.rgba, 0.8);
        if(!isHeadlessMode())
        {
            cv::imshow("classified", vis);
            cv::waitKey(1);
        }

        sensor_msgs::msg::Image img_msg;
        img_msg.header = msg->header;
        img_msg.height = vis.rows;
        img_msg.width = vis.cols;
        img_msg.encoding = "bgr8";
        img_msg.step = static_cast<sensor_msgs::msg::Image::_step_type>(vis.step);
        img_msg.data.assign(vis.datastart, vis.dataend);
        overlay_pub_->publish(img_msg);
    }

    rclcpp::Subscription<sensor_msgs::msg::CompressedImage>::SharedPtr image_sub_;
    rclcpp::Publisher<std_msgs::msg::String>::SharedPtr elements_pub_;
    rclcpp::Publisher<sensor_msgs::msg::Image>::SharedPtr overlay_pub_;
    std::string image_topic_;
    std::string elements_topic_;
    std::string overlay_topic_;
    FloorPlanProcessor processor_;
};

int main(int argc, char **argv)
{
    rclcpp::init(argc, argv);
    auto node = std::make_shared<PlanAnnotatorNode>();
    rclcpp::spin(node);
    rclcpp::shutdown();
    return 0;
}
