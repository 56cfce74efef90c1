#pragma once

#include <opencv2/core.hpp>
#include <pcl/PCLPointCloud2.h>
#include <pcl/point_cloud.h>
#include <pcl/point_types.h>

#include "semcloud/core/calibration_store.hpp"
#include "semcloud/fusion/fusion_strategy.hpp"

namespace semcloud {
namespace projection {

/**
 * @brief Everything needed to build one output cloud
 *
 * products is borrowed from the controller and only valid during
 * CloudGenerator::generate().
 */
struct CloudGenerationInput {
    const cv::Mat* image{nullptr};                          // BGR8 sensor image
    pcl::PointCloud<pcl::PointXYZ>::ConstPtr points;
    const fusion::FusionProducts* products{nullptr};
    core::CalibrationSet calibration;
    double stamp{0.0};
    bool include_background{false};
    fusion::FusionMode mode{fusion::FusionMode::COLOR};
};

/**
 * @brief Interface to the point-cloud builder
 */
class CloudGenerator {
public:
    virtual ~CloudGenerator() = default;

    virtual pcl::PCLPointCloud2 generate(const CloudGenerationInput& input) = 0;
};

} // namespace projection
} // namespace semcloud
