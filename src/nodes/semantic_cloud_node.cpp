#include <rclcpp/rclcpp.hpp>
#include <sensor_msgs/msg/camera_info.hpp>
#include <sensor_msgs/msg/image.hpp>
#include <sensor_msgs/msg/point_cloud2.hpp>
#include <sensor_msgs/image_encodings.hpp>
#include <cv_bridge/cv_bridge.h>
#include <pcl_conversions/pcl_conversions.h>
#include <pcl/point_cloud.h>
#include <pcl/point_types.h>

#include "semcloud/core/pipeline_config.hpp"
#include "semcloud/core/pipeline_controller.hpp"
#include "semcloud/projection/projection_cloud_generator.hpp"
#include "semcloud/segmentation/dnn_segmentation_model.hpp"
#include "semcloud/utils/errors.hpp"

#include <chrono>
#include <cmath>
#include <filesystem>
#include <memory>
#include <vector>

namespace semcloud {

class SemanticCloudNode : public rclcpp::Node {
public:
    SemanticCloudNode() : Node("semantic_cloud_node") {
        RCLCPP_INFO(get_logger(), "Initializing Semantic Cloud Node");

        declare_parameter("config_file", "");
        declare_parameter("stats_interval_ms", 10000);

        const std::string config_file = get_parameter("config_file").as_string();
        if (config_file.empty() || !std::filesystem::exists(config_file)) {
            throw ConfigurationError("Parameter config_file must name an existing YAML file, got '" +
                                     config_file + "'");
        }
        config_ = core::PipelineConfig::loadFromFile(config_file);

        std::shared_ptr<segmentation::SegmentationModel> model;
        if (config_.usesModel()) {
            RCLCPP_INFO(get_logger(), "Setting up segmentation model...");
            model = std::make_shared<segmentation::DnnSegmentationModel>(config_.model);
        }
        auto generator = std::make_shared<projection::ProjectionCloudGenerator>(config_.cloud);

        pipeline_ = std::make_unique<core::PipelineController>(config_, model, generator);

        setupROS2Interface();

        const int stats_interval = static_cast<int>(get_parameter("stats_interval_ms").as_int());
        if (stats_interval > 0) {
            stats_timer_ = create_wall_timer(
                std::chrono::milliseconds(stats_interval),
                [this]() { logStatistics(); });
        }

        RCLCPP_INFO(get_logger(), "Semantic Cloud Node ready (%s)",
                    fusion::fusion_utils::modeToString(config_.mode));
    }

private:
    void setupROS2Interface() {
        auto qos = rclcpp::SensorDataQoS().keep_last(1);

        cloud_pub_ = create_publisher<sensor_msgs::msg::PointCloud2>(config_.topics.cloud_topic, 1);
        semantic_image_pub_ = create_publisher<sensor_msgs::msg::Image>(
            config_.topics.semantic_image_topic, 1);

        pipeline_->setCloudSink([this](const pcl::PCLPointCloud2& cloud, double stamp) {
            publishCloud(cloud, stamp);
        });
        pipeline_->setSemanticImageSink(
            [this](const cv::Mat& image, double stamp) { publishSemanticImage(image, stamp); },
            [this]() { return semantic_image_pub_->get_subscription_count() > 0; });

        image_sub_ = create_subscription<sensor_msgs::msg::Image>(
            config_.topics.color_image_topic, qos,
            [this](sensor_msgs::msg::Image::ConstSharedPtr msg) { imageCallback(msg); });

        scan_sub_ = create_subscription<sensor_msgs::msg::PointCloud2>(
            config_.topics.lidar_topic, qos,
            [this](sensor_msgs::msg::PointCloud2::ConstSharedPtr msg) { scanCallback(msg); });

        camera_info_sub_ = create_subscription<sensor_msgs::msg::CameraInfo>(
            config_.topics.intrinsic_topic, rclcpp::QoS(1),
            [this](sensor_msgs::msg::CameraInfo::ConstSharedPtr msg) { cameraInfoCallback(msg); });

        RCLCPP_INFO(get_logger(), "Subscribed to %s, %s and %s",
                    config_.topics.color_image_topic.c_str(),
                    config_.topics.lidar_topic.c_str(),
                    config_.topics.intrinsic_topic.c_str());
    }

    void imageCallback(const sensor_msgs::msg::Image::ConstSharedPtr& msg) {
        // The synchronizer may hold the image past this callback, so take a copy
        cv_bridge::CvImagePtr cv_image;
        try {
            cv_image = cv_bridge::toCvCopy(msg, sensor_msgs::image_encodings::BGR8);
        } catch (const cv_bridge::Exception& e) {
            RCLCPP_ERROR(get_logger(), "cv_bridge exception: %s", e.what());
            return;
        }

        camera_frame_id_ = msg->header.frame_id;
        pipeline_->onImage(cv_image->image, rclcpp::Time(msg->header.stamp).seconds());
    }

    void scanCallback(const sensor_msgs::msg::PointCloud2::ConstSharedPtr& msg) {
        auto cloud = std::make_shared<pcl::PointCloud<pcl::PointXYZ>>();
        try {
            pcl::fromROSMsg(*msg, *cloud);
        } catch (const std::exception& e) {
            RCLCPP_ERROR(get_logger(), "Failed to convert scan: %s", e.what());
            return;
        }

        pipeline_->onScan(cloud, rclcpp::Time(msg->header.stamp).seconds());
    }

    void cameraInfoCallback(const sensor_msgs::msg::CameraInfo::ConstSharedPtr& msg) {
        const std::vector<double> K(msg->k.begin(), msg->k.end());
        if (pipeline_->onCameraInfo(K)) {
            RCLCPP_INFO_ONCE(get_logger(), "Intrinsics updated from %s",
                             config_.topics.intrinsic_topic.c_str());
        }
    }

    void publishCloud(const pcl::PCLPointCloud2& cloud, double stamp) {
        sensor_msgs::msg::PointCloud2 msg;
        pcl_conversions::fromPCL(cloud, msg);
        msg.header.stamp = toStamp(stamp);
        msg.header.frame_id = config_.cloud.frame_id;
        cloud_pub_->publish(msg);
    }

    void publishSemanticImage(const cv::Mat& image, double stamp) {
        std_msgs::msg::Header header;
        header.stamp = toStamp(stamp);
        header.frame_id = camera_frame_id_;
        semantic_image_pub_->publish(
            *cv_bridge::CvImage(header, sensor_msgs::image_encodings::BGR8, image).toImageMsg());
    }

    static builtin_interfaces::msg::Time toStamp(double seconds) {
        return rclcpp::Time(static_cast<int64_t>(std::llround(seconds * 1e9)));
    }

    void logStatistics() {
        const auto& stats = pipeline_->getStats();
        const auto& sync_stats = pipeline_->synchronizer().getStats();
        RCLCPP_INFO(get_logger(),
                    "Frames: %ld processed, %ld dropped, last %.1f ms | sync: %ld pairs, "
                    "%ld images dropped, %ld scans dropped",
                    static_cast<long>(stats.frames_processed.get()),
                    static_cast<long>(stats.frames_dropped.get()),
                    stats.getLastProcessingTimeMs(),
                    static_cast<long>(sync_stats.pairs_emitted.get()),
                    static_cast<long>(sync_stats.images_dropped.get()),
                    static_cast<long>(sync_stats.scans_dropped.get()));
    }

    core::PipelineConfig config_;
    std::unique_ptr<core::PipelineController> pipeline_;
    std::string camera_frame_id_;

    rclcpp::Subscription<sensor_msgs::msg::Image>::SharedPtr image_sub_;
    rclcpp::Subscription<sensor_msgs::msg::PointCloud2>::SharedPtr scan_sub_;
    rclcpp::Subscription<sensor_msgs::msg::CameraInfo>::SharedPtr camera_info_sub_;

    rclcpp::Publisher<sensor_msgs::msg::PointCloud2>::SharedPtr cloud_pub_;
    rclcpp::Publisher<sensor_msgs::msg::Image>::SharedPtr semantic_image_pub_;

    rclcpp::TimerBase::SharedPtr stats_timer_;
};

} // namespace semcloud

int main(int argc, char** argv) {
    rclcpp::init(argc, argv);

    try {
        auto node = std::make_shared<semcloud::SemanticCloudNode>();
        rclcpp::spin(node);
    } catch (const std::exception& e) {
        RCLCPP_ERROR(rclcpp::get_logger("main"), "Exception in Semantic Cloud Node: %s", e.what());
        rclcpp::shutdown();
        return 1;
    }

    rclcpp::shutdown();
    return 0;
}
