#pragma once

#include <opencv2/core.hpp>

#include "semcloud/segmentation/color_map.hpp"

namespace semcloud {
namespace segmentation {

/**
 * @brief Converts class-label images to color images through a ColorMap
 */
class SemanticDecoder {
public:
    explicit SemanticDecoder(ColorMap color_map);

    /**
     * @brief Decode a CV_32SC1 label image into a BGR8 image
     *
     * Labels outside [0, size) decode to black. output is reallocated only
     * when its size or type differ.
     */
    void decode(const cv::Mat& labels, cv::Mat& output) const;

    cv::Mat decode(const cv::Mat& labels) const {
        cv::Mat output;
        decode(labels, output);
        return output;
    }

    const ColorMap& colorMap() const { return color_map_; }

private:
    ColorMap color_map_;
    std::vector<cv::Vec3b> bgr_table_;
};

} // namespace segmentation
} // namespace semcloud
