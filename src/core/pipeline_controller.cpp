#include "semcloud/core/pipeline_controller.hpp"

#include <algorithm>
#include <chrono>
#include <utility>
#include <rclcpp/rclcpp.hpp>

#include "semcloud/segmentation/class_remapper.hpp"
#include "semcloud/segmentation/color_map.hpp"
#include "semcloud/segmentation/segmentation_adapter.hpp"
#include "semcloud/segmentation/semantic_decoder.hpp"
#include "semcloud/utils/errors.hpp"

namespace semcloud {
namespace core {

namespace {

rclcpp::Logger logger() {
    return rclcpp::get_logger("semcloud.pipeline");
}

} // namespace

PipelineController::PipelineController(const PipelineConfig& config,
                                       std::shared_ptr<segmentation::SegmentationModel> model,
                                       std::shared_ptr<projection::CloudGenerator> generator)
    : config_(config),
      model_(std::move(model)),
      generator_(std::move(generator)),
      synchronizer_(config.sync) {

    config_.validate();

    if (!generator_) {
        throw ConfigurationError("PipelineController requires a cloud generator");
    }
    if (config_.usesModel() && !model_) {
        throw ConfigurationError(std::string("Fusion mode ") +
                                 fusion::fusion_utils::modeToString(config_.mode) +
                                 " requires a segmentation model");
    }

    calibration_ = CalibrationStore::fromJson(
        config_.extrinsics_json, calibration_utils::makeIntrinsics(config_.fx, config_.fy, config_.cx, config_.cy));

    fusion::FusionContext context;
    context.output_size = cv::Size(config_.width, config_.height);
    if (config_.usesModel()) {
        context.adapter = std::make_shared<segmentation::SegmentationAdapter>(model_, config_.adapter);
        context.remapper = std::make_shared<segmentation::ClassRemapper>(
            config_.resolvedRemapTable(), config_.resolvedBackgroundId());
        // Bayesian ranks carry raw ids, which may exceed the semantic class count
        const int palette_size = config_.mode == fusion::FusionMode::SEMANTICS_BAYESIAN
            ? std::max(config_.num_classes, config_.model.num_classes)
            : config_.num_classes;
        context.decoder = std::make_shared<segmentation::SemanticDecoder>(
            segmentation::buildColorMap(palette_size));
    }
    strategy_ = fusion::createFusionStrategy(config_.mode, context);

    synchronizer_.setCallback([this](const sync::Frame& frame) {
        processFrame(frame);
    });

    RCLCPP_INFO(logger(), "Pipeline ready: %s fusion, output %dx%d, slop %.3f s",
                strategy_->getName(), config_.width, config_.height, config_.sync.slop);
}

void PipelineController::onImage(const cv::Mat& image, double stamp) {
    sync::ImageEvent event;
    event.image = image;
    event.stamp = stamp;
    synchronizer_.addImage(std::move(event));
}

void PipelineController::onScan(pcl::PointCloud<pcl::PointXYZ>::ConstPtr points, double stamp) {
    sync::ScanEvent event;
    event.points = std::move(points);
    event.stamp = stamp;
    synchronizer_.addScan(std::move(event));
}

bool PipelineController::onCameraInfo(const std::vector<double>& K) {
    try {
        calibration_->updateIntrinsics(K);
    } catch (const InvalidCalibration& e) {
        RCLCPP_WARN(logger(), "Ignoring camera info: %s", e.what());
        return false;
    }
    return true;
}

bool PipelineController::processFrame(const sync::Frame& frame) {
    const auto start = std::chrono::steady_clock::now();

    try {
        if (frame.image.empty() || !frame.points) {
            throw FrameError("Incomplete frame");
        }

        // One calibration snapshot per frame
        const CalibrationSet calibration = calibration_->snapshot();

        strategy_->fuse(frame.image, products_);
        products_.stamp = frame.stamp;

        projection::CloudGenerationInput input;
        input.image = &frame.image;
        input.points = frame.points;
        input.products = &products_;
        input.calibration = calibration;
        input.stamp = frame.stamp;
        input.include_background = config_.include_background;
        input.mode = config_.mode;

        pcl::PCLPointCloud2 cloud = generator_->generate(input);

        if (config_.usesModel() && image_sink_ && image_probe_ && image_probe_()) {
            image_sink_(products_.semantic_colors[0], frame.stamp);
            stats_.semantic_images_published++;
        }

        if (cloud_sink_) {
            cloud_sink_(cloud, frame.stamp);
        }
    } catch (const std::exception& e) {
        stats_.frames_dropped++;
        RCLCPP_ERROR(logger(), "Dropping frame at %.3f: %s", frame.stamp, e.what());
        return false;
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    stats_.last_processing_us.store(elapsed.count());
    stats_.frames_processed++;

    RCLCPP_DEBUG(logger(), "Frame %.3f processed in %.2f ms", frame.stamp, stats_.getLastProcessingTimeMs());
    return true;
}

} // namespace core
} // namespace semcloud
