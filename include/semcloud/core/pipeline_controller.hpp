#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <vector>
#include <opencv2/core.hpp>
#include <pcl/PCLPointCloud2.h>

#include "semcloud/core/calibration_store.hpp"
#include "semcloud/core/pipeline_config.hpp"
#include "semcloud/fusion/fusion_strategy.hpp"
#include "semcloud/projection/cloud_generator.hpp"
#include "semcloud/segmentation/segmentation_model.hpp"
#include "semcloud/sync/frame_synchronizer.hpp"
#include "semcloud/utils/common_types.hpp"

namespace semcloud {
namespace core {

/**
 * @brief Owns the fusion pipeline and drives it from sensor events
 *
 * Image and scan events go through the FrameSynchronizer; every emitted pair
 * runs the selected FusionStrategy and the CloudGenerator. A failing frame is
 * logged and dropped without publishing anything for it.
 */
class PipelineController {
public:
    using CloudSink = std::function<void(const pcl::PCLPointCloud2& cloud, double stamp)>;
    using ImageSink = std::function<void(const cv::Mat& image, double stamp)>;
    using ConsumerProbe = std::function<bool()>;

    struct Stats {
        utils::AtomicCounter frames_processed;
        utils::AtomicCounter frames_dropped;
        utils::AtomicCounter semantic_images_published;
        std::atomic<int64_t> last_processing_us{0};

        double getLastProcessingTimeMs() const {
            return static_cast<double>(last_processing_us.load()) / 1000.0;
        }
    };

    /**
     * @brief Build the pipeline
     * @param config Validated configuration
     * @param model Segmentation model, required unless the mode is COLOR
     * @param generator Cloud builder
     * @throws ConfigurationError on missing collaborators or invalid config
     * @throws InvalidCalibration if the configured extrinsics are invalid
     */
    PipelineController(const PipelineConfig& config,
                       std::shared_ptr<segmentation::SegmentationModel> model,
                       std::shared_ptr<projection::CloudGenerator> generator);

    PipelineController(const PipelineController&) = delete;
    PipelineController& operator=(const PipelineController&) = delete;

    void setCloudSink(CloudSink sink) { cloud_sink_ = std::move(sink); }

    /**
     * @brief Register the decoded semantic image output
     * @param probe Reports whether anyone listens; images are only produced when it returns true
     */
    void setSemanticImageSink(ImageSink sink, ConsumerProbe probe) {
        image_sink_ = std::move(sink);
        image_probe_ = std::move(probe);
    }

    void onImage(const cv::Mat& image, double stamp);
    void onScan(pcl::PointCloud<pcl::PointXYZ>::ConstPtr points, double stamp);

    /**
     * @brief Replace intrinsics from a row-major 3x3 matrix
     * @return false if the matrix was rejected
     */
    bool onCameraInfo(const std::vector<double>& K);

    /**
     * @brief Run one synchronized frame through the pipeline
     * @return true if a cloud was produced
     */
    bool processFrame(const sync::Frame& frame);

    CalibrationStore& calibration() { return *calibration_; }
    const sync::FrameSynchronizer& synchronizer() const { return synchronizer_; }
    const fusion::FusionStrategy& strategy() const { return *strategy_; }
    const fusion::FusionProducts& lastProducts() const { return products_; }
    const PipelineConfig& getConfig() const { return config_; }
    const Stats& getStats() const { return stats_; }

private:
    PipelineConfig config_;

    std::unique_ptr<CalibrationStore> calibration_;
    std::shared_ptr<segmentation::SegmentationModel> model_;
    std::shared_ptr<projection::CloudGenerator> generator_;
    std::unique_ptr<fusion::FusionStrategy> strategy_;
    sync::FrameSynchronizer synchronizer_;

    fusion::FusionProducts products_;   // Reused every frame

    CloudSink cloud_sink_;
    ImageSink image_sink_;
    ConsumerProbe image_probe_;

    Stats stats_;
};

} // namespace core
} // namespace semcloud
