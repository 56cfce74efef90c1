#pragma once

#include <memory>
#include <yaml-cpp/yaml.h>
#include <opencv2/core.hpp>

#include "semcloud/segmentation/segmentation_model.hpp"

namespace semcloud {
namespace segmentation {

/**
 * @brief Prepares sensor images for the segmentation model and restores its output orientation
 *
 * Steps per call:
 * 1. Convert to float and anti-aliased resize to the model input size
 * 2. Reverse channel order if flip_channels
 * 3. Rotate by 180 degrees if rotate_180 (camera mounted upside down)
 * 4. Run the model and validate its output
 * 5. Undo the rotation on the probability map
 *
 * Exceptions raised by the model are not caught here.
 */
class SegmentationAdapter {
public:
    struct Config {
        cv::Size input_size{0, 0};      // Model canonical resolution
        bool flip_channels{true};       // BGR <-> RGB
        bool rotate_180{true};

        void loadFromYaml(const YAML::Node& node);
    };

    SegmentationAdapter(std::shared_ptr<SegmentationModel> model, const Config& config);

    /**
     * @brief Run the model on a sensor image
     * @param image BGR8 image at sensor resolution
     * @return CV_32FC(C) probability map at model resolution, sensor orientation
     * @throws FrameError if the model output is empty, not float or the wrong size
     */
    cv::Mat predict(const cv::Mat& image) const;

    /**
     * @brief Preprocessing only, exposed for inspection
     */
    cv::Mat prepareInput(const cv::Mat& image) const;

    const Config& getConfig() const { return config_; }
    int numClasses() const { return model_->numClasses(); }

private:
    std::shared_ptr<SegmentationModel> model_;
    Config config_;
};

} // namespace segmentation
} // namespace semcloud
