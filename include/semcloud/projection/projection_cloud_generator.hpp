#pragma once

#include <optional>
#include <string>
#include <Eigen/Dense>
#include <opencv2/core.hpp>
#include <yaml-cpp/yaml.h>

#include "semcloud/projection/cloud_generator.hpp"

namespace semcloud {
namespace projection {

/**
 * @brief Pixel hit by a scan point
 */
struct PixelHit {
    int u;
    int v;
};

/**
 * @brief Builds colored/semantic clouds by pinhole projection of scan points
 *
 * Scan points are moved into the camera frame with the extrinsics and
 * projected with the intrinsics (no distortion). Points in front of the
 * camera landing inside the image sample the image and the fusion products
 * at the nearest pixel. Other points are kept with zero confidence and a
 * black semantic color when include_background is set, otherwise omitted.
 *
 * Output layouts: Color mode uses x y z rgb, Max mode adds semantic_color
 * and confidence, Bayesian mode adds semantic_color1..3 and confidence1..3.
 */
class ProjectionCloudGenerator : public CloudGenerator {
public:
    struct Config {
        std::string frame_id{"lidar_link"};
        double min_depth{1e-3};     // Points closer to the image plane are not projected [m]

        void loadFromYaml(const YAML::Node& node);
    };

    explicit ProjectionCloudGenerator(const Config& config = Config());

    pcl::PCLPointCloud2 generate(const CloudGenerationInput& input) override;

    /**
     * @brief Project one scan point
     * @return Pixel coordinates, or nullopt if behind the camera or outside image_size
     */
    std::optional<PixelHit> projectPoint(const Eigen::Vector3d& point,
                                         const core::CalibrationSet& calibration,
                                         const cv::Size& image_size) const;

    const Config& getConfig() const { return config_; }

private:
    template<typename PointT, typename FillFn>
    pcl::PCLPointCloud2 buildCloud(const CloudGenerationInput& input, FillFn fill) const;

    Config config_;
};

} // namespace projection
} // namespace semcloud
