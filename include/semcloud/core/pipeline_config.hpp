#pragma once

#include <string>
#include <yaml-cpp/yaml.h>

#include "semcloud/fusion/fusion_strategy.hpp"
#include "semcloud/projection/projection_cloud_generator.hpp"
#include "semcloud/segmentation/class_remapper.hpp"
#include "semcloud/segmentation/dnn_segmentation_model.hpp"
#include "semcloud/segmentation/segmentation_adapter.hpp"
#include "semcloud/sync/frame_synchronizer.hpp"

namespace semcloud {
namespace core {

/**
 * @brief Topic names used by the ROS node
 */
struct TopicConfig {
    std::string color_image_topic{"/left/camera/image_color"};
    std::string lidar_topic{"/velodyne_points"};
    std::string intrinsic_topic{"/mapping/left/camera_info"};
    std::string semantic_image_topic{"/semantic_pcl/semantic_image"};
    std::string cloud_topic{"/semantic_pcl/semantic_pcl"};
};

/**
 * @brief Complete pipeline configuration
 *
 * Layout of the YAML file:
 * @code
 * camera:
 *   width: 1384
 *   height: 1032
 *   fx: ...  fy: ...  cx: ...  cy: ...
 *   extrinsics: "[[...], [...], [...], [0, 0, 0, 1]]"
 *   intrinsic_topic: /mapping/left/camera_info
 * semantic_pcl:
 *   point_type: 1
 *   num_classes: 8
 *   class_remap: [7, 1, 3, 7, 2, 0, 5, 1, 0, 0]
 *   ...
 * synchronization:
 *   slop: 0.3
 * device: "cuda:0"
 * @endcode
 */
struct PipelineConfig {
    fusion::FusionMode mode{fusion::FusionMode::SEMANTICS_MAX};

    // Sensor
    int width{0};
    int height{0};
    double fx{0.0};
    double fy{0.0};
    double cx{0.0};
    double cy{0.0};
    std::string extrinsics_json;

    // Semantics
    int num_classes{0};                                     // Semantic classes, sizes the color map
    segmentation::ClassRemapper::RemapTable class_remap;    // Indexed by raw class, empty means identity
    int background_id{-1};                                  // -1 resolves to num_classes - 1
    bool include_background{false};

    segmentation::DnnSegmentationModel::Config model;       // model.num_classes counts raw classes
    segmentation::SegmentationAdapter::Config adapter;
    projection::ProjectionCloudGenerator::Config cloud;
    sync::FrameSynchronizer::Config sync;
    TopicConfig topics;

    /**
     * @brief Read all recognized keys, keeping defaults for missing ones
     * @throws ConfigurationError on malformed values
     */
    void loadFromYaml(const YAML::Node& root);

    /**
     * @brief Load from file and validate
     * @throws ConfigurationError if the file cannot be read or fails validation
     */
    static PipelineConfig loadFromFile(const std::string& path);

    /**
     * @brief Check cross-field consistency
     * @throws ConfigurationError describing the first problem found
     */
    void validate() const;

    /// Background id after resolving the default
    int resolvedBackgroundId() const {
        return background_id >= 0 ? background_id : num_classes - 1;
    }

    /// Remap table after resolving the identity default
    segmentation::ClassRemapper::RemapTable resolvedRemapTable() const;

    bool usesModel() const { return mode != fusion::FusionMode::COLOR; }
};

} // namespace core
} // namespace semcloud
