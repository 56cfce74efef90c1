#include "semcloud/segmentation/dnn_segmentation_model.hpp"

#include <algorithm>
#include <cmath>
#include <vector>
#include <rclcpp/rclcpp.hpp>

#include "semcloud/utils/errors.hpp"

namespace semcloud {
namespace segmentation {

namespace {

rclcpp::Logger logger() {
    return rclcpp::get_logger("semcloud.dnn_model");
}

} // namespace

DnnSegmentationModel::DnnSegmentationModel(const Config& config)
    : config_(config) {
    if (config_.model_path.empty()) {
        throw ConfigurationError("DnnSegmentationModel requires a model path");
    }
    if (config_.num_classes <= 0 || config_.num_classes > CV_CN_MAX) {
        throw ConfigurationError("num_classes must be in [1, " + std::to_string(CV_CN_MAX) + "]");
    }

    try {
        net_ = cv::dnn::readNet(config_.model_path, config_.config_path);
    } catch (const cv::Exception& e) {
        throw ConfigurationError("Failed to load network '" + config_.model_path + "': " + e.what());
    }
    if (net_.empty()) {
        throw ConfigurationError("Network '" + config_.model_path + "' is empty");
    }

    selectDevice(config_.device);

    RCLCPP_INFO(logger(), "Loaded network %s (%d classes, device %s)",
                config_.model_path.c_str(), config_.num_classes, config_.device.c_str());
}

void DnnSegmentationModel::selectDevice(const std::string& device) {
    if (device == "cpu") {
        net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
        net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
    } else if (device == "cuda" || device.rfind("cuda:", 0) == 0) {
        if (device.size() > 5) {
            // OpenCV runs on the current CUDA device; the index is informational
            RCLCPP_WARN(logger(), "Device index in '%s' is not selectable, using the current CUDA device",
                        device.c_str());
        }
        net_.setPreferableBackend(cv::dnn::DNN_BACKEND_CUDA);
        net_.setPreferableTarget(cv::dnn::DNN_TARGET_CUDA);
    } else if (device == "opencl") {
        net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
        net_.setPreferableTarget(cv::dnn::DNN_TARGET_OPENCL);
    } else {
        throw ConfigurationError("Unsupported compute device: " + device);
    }
}

cv::Mat DnnSegmentationModel::infer(const cv::Mat& input) {
    cv::Mat blob = cv::dnn::blobFromImage(input, 1.0, cv::Size(), cv::Scalar(), false, false, CV_32F);
    net_.setInput(blob);
    cv::Mat output = net_.forward();

    cv::Mat probabilities = blobToChannels(output);
    if (probabilities.channels() != config_.num_classes) {
        throw FrameError("Network produced " + std::to_string(probabilities.channels()) +
                         " classes, expected " + std::to_string(config_.num_classes));
    }

    if (config_.apply_softmax) {
        softmaxChannels(probabilities);
    }
    return probabilities;
}

cv::Mat blobToChannels(const cv::Mat& blob) {
    if (blob.dims != 4 || blob.size[0] != 1 || blob.depth() != CV_32F) {
        throw FrameError("Expected a 1xCxHxW float blob from the network");
    }

    const int channels = blob.size[1];
    const int height = blob.size[2];
    const int width = blob.size[3];
    if (channels > CV_CN_MAX) {
        throw FrameError("Network output has too many channels: " + std::to_string(channels));
    }

    std::vector<cv::Mat> planes;
    planes.reserve(channels);
    for (int c = 0; c < channels; ++c) {
        const float* plane = blob.ptr<float>(0, c);
        planes.emplace_back(height, width, CV_32FC1, const_cast<float*>(plane));
    }

    cv::Mat merged;
    cv::merge(planes, merged);
    return merged;
}

void softmaxChannels(cv::Mat& probabilities) {
    const int channels = probabilities.channels();
    for (int v = 0; v < probabilities.rows; ++v) {
        float* row = probabilities.ptr<float>(v);
        for (int u = 0; u < probabilities.cols; ++u) {
            float* px = row + static_cast<size_t>(u) * channels;
            const float peak = *std::max_element(px, px + channels);
            float sum = 0.0f;
            for (int c = 0; c < channels; ++c) {
                px[c] = std::exp(px[c] - peak);
                sum += px[c];
            }
            for (int c = 0; c < channels; ++c) {
                px[c] /= sum;
            }
        }
    }
}

} // namespace segmentation
} // namespace semcloud
