#include "semcloud/segmentation/segmentation_adapter.hpp"

#include <sstream>
#include <utility>
#include <opencv2/imgproc.hpp>

#include "semcloud/segmentation/image_resize.hpp"
#include "semcloud/utils/common_types.hpp"
#include "semcloud/utils/errors.hpp"

namespace semcloud {
namespace segmentation {

void SegmentationAdapter::Config::loadFromYaml(const YAML::Node& node) {
    using utils::ConfigLoader;

    input_size.width = ConfigLoader::readParam(node, "model_input_width", input_size.width);
    input_size.height = ConfigLoader::readParam(node, "model_input_height", input_size.height);
    flip_channels = ConfigLoader::readParam(node, "flip_channels", flip_channels);
    rotate_180 = ConfigLoader::readParam(node, "rotate_180", rotate_180);
}

SegmentationAdapter::SegmentationAdapter(std::shared_ptr<SegmentationModel> model,
                                         const Config& config)
    : model_(std::move(model)), config_(config) {
    if (!model_) {
        throw ConfigurationError("SegmentationAdapter requires a model");
    }
    if (config_.input_size.width <= 0 || config_.input_size.height <= 0) {
        throw ConfigurationError("Model input size must be positive");
    }
}

cv::Mat SegmentationAdapter::prepareInput(const cv::Mat& image) const {
    cv::Mat input;
    resizeSmooth(image, input, config_.input_size);

    if (config_.flip_channels && input.channels() == 3) {
        cv::cvtColor(input, input, cv::COLOR_BGR2RGB);
    }

    if (config_.rotate_180) {
        cv::flip(input, input, -1);
    }

    return input;
}

cv::Mat SegmentationAdapter::predict(const cv::Mat& image) const {
    cv::Mat output = model_->infer(prepareInput(image));

    if (output.empty()) {
        throw FrameError("Segmentation model returned an empty output");
    }
    if (output.depth() != CV_32F) {
        throw FrameError("Segmentation model output must be 32-bit float");
    }
    if (output.size() != config_.input_size) {
        std::ostringstream ss;
        ss << "Segmentation model output is " << output.cols << "x" << output.rows
           << ", expected " << config_.input_size.width << "x" << config_.input_size.height;
        throw FrameError(ss.str());
    }

    if (!config_.rotate_180) {
        return output;
    }

    // The model may hand back a buffer it still owns
    cv::Mat unrotated;
    cv::flip(output, unrotated, -1);
    return unrotated;
}

} // namespace segmentation
} // namespace semcloud
