#pragma once

#include <string>
#include <opencv2/dnn.hpp>

#include "semcloud/segmentation/segmentation_model.hpp"

namespace semcloud {
namespace segmentation {

/**
 * @brief SegmentationModel backed by the OpenCV DNN module
 *
 * Loads any network format cv::dnn::readNet understands (ONNX, Caffe,
 * TensorFlow, Darknet). The network is expected to produce a single
 * NCHW blob with one channel per raw class.
 */
class DnnSegmentationModel : public SegmentationModel {
public:
    struct Config {
        std::string model_path;         // Weights file
        std::string config_path;        // Optional network description
        std::string device{"cpu"};      // cpu, cuda, cuda:N, opencl
        int num_classes{0};
        bool apply_softmax{false};      // Network emits logits
    };

    /**
     * @throws ConfigurationError for unknown devices or unreadable networks
     */
    explicit DnnSegmentationModel(const Config& config);

    cv::Mat infer(const cv::Mat& input) override;

    int numClasses() const override { return config_.num_classes; }

private:
    void selectDevice(const std::string& device);

    Config config_;
    cv::dnn::Net net_;
};

/**
 * @brief Convert an NCHW float blob (N == 1) to a CV_32FC(C) image
 */
cv::Mat blobToChannels(const cv::Mat& blob);

/**
 * @brief In-place per-pixel softmax over channels
 */
void softmaxChannels(cv::Mat& probabilities);

} // namespace segmentation
} // namespace semcloud
