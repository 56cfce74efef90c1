#include "semcloud/core/pipeline_config.hpp"

#include <rclcpp/rclcpp.hpp>

#include "semcloud/utils/common_types.hpp"
#include "semcloud/utils/errors.hpp"

namespace semcloud {
namespace core {

namespace {

rclcpp::Logger logger() {
    return rclcpp::get_logger("semcloud.config");
}

segmentation::ClassRemapper::RemapTable parseRemapTable(const YAML::Node& node) {
    if (!node.IsSequence()) {
        throw ConfigurationError("semantic_pcl.class_remap must be a list");
    }

    segmentation::ClassRemapper::RemapTable table;
    table.reserve(node.size());
    for (const auto& entry : node) {
        if (entry.IsNull()) {
            table.emplace_back(std::nullopt);
        } else {
            table.emplace_back(entry.as<int>());
        }
    }
    return table;
}

} // namespace

void PipelineConfig::loadFromYaml(const YAML::Node& root) {
    using utils::ConfigLoader;

    try {
        // Fusion mode accepts both the numeric point type and its name
        if (ConfigLoader::hasNestedParam(root, "semantic_pcl.point_type")) {
            const auto point_type =
                ConfigLoader::readNestedParam<std::string>(root, "semantic_pcl.point_type", "");
            mode = fusion::fusion_utils::stringToMode(point_type);
        }

        width = ConfigLoader::readNestedParam(root, "camera.width", width);
        height = ConfigLoader::readNestedParam(root, "camera.height", height);
        fx = ConfigLoader::readNestedParam(root, "camera.fx", fx);
        fy = ConfigLoader::readNestedParam(root, "camera.fy", fy);
        cx = ConfigLoader::readNestedParam(root, "camera.cx", cx);
        cy = ConfigLoader::readNestedParam(root, "camera.cy", cy);
        extrinsics_json = ConfigLoader::readNestedParam(root, "camera.extrinsics", extrinsics_json);
        topics.intrinsic_topic =
            ConfigLoader::readNestedParam(root, "camera.intrinsic_topic", topics.intrinsic_topic);

        const YAML::Node semantic = ConfigLoader::findNested(root, "semantic_pcl");
        if (semantic) {
            num_classes = ConfigLoader::readParam(semantic, "num_classes", num_classes);
            background_id = ConfigLoader::readParam(semantic, "background_id", background_id);
            include_background = ConfigLoader::readParam(semantic, "include_background", include_background);
            if (semantic["class_remap"] && !semantic["class_remap"].IsNull()) {
                class_remap = parseRemapTable(semantic["class_remap"]);
            }

            model.model_path = ConfigLoader::readParam(semantic, "model_path", model.model_path);
            model.config_path = ConfigLoader::readParam(semantic, "config_path", model.config_path);
            model.apply_softmax = ConfigLoader::readParam(semantic, "apply_softmax", model.apply_softmax);

            adapter.loadFromYaml(semantic);
            cloud.loadFromYaml(semantic);

            topics.color_image_topic =
                ConfigLoader::readParam(semantic, "color_image_topic", topics.color_image_topic);
            topics.lidar_topic = ConfigLoader::readParam(semantic, "lidar_topic", topics.lidar_topic);
            topics.semantic_image_topic =
                ConfigLoader::readParam(semantic, "semantic_image_topic", topics.semantic_image_topic);
            topics.cloud_topic = ConfigLoader::readParam(semantic, "cloud_topic", topics.cloud_topic);
        }

        // Device may sit at the top level or under semantic_pcl
        model.device = ConfigLoader::readParam(root, "device", model.device);
        model.device = ConfigLoader::readNestedParam(root, "semantic_pcl.device", model.device);
        // Raw model classes default to the remap table length
        const int raw_default = class_remap.empty() ? num_classes : static_cast<int>(class_remap.size());
        model.num_classes = ConfigLoader::readNestedParam(root, "semantic_pcl.num_raw_classes", raw_default);

        sync.slop = ConfigLoader::readNestedParam(root, "synchronization.slop", sync.slop);

        // Model runs at sensor resolution unless told otherwise
        if (adapter.input_size.width <= 0) {
            adapter.input_size.width = width;
        }
        if (adapter.input_size.height <= 0) {
            adapter.input_size.height = height;
        }
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("Malformed configuration value: ") + e.what());
    }
}

PipelineConfig PipelineConfig::loadFromFile(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Failed to load config file '" + path + "': " + e.what());
    }

    PipelineConfig config;
    config.loadFromYaml(root);
    config.validate();

    RCLCPP_INFO(logger(), "Loaded %s: mode %s, %dx%d, %d classes",
                path.c_str(), fusion::fusion_utils::modeToString(config.mode),
                config.width, config.height, config.num_classes);
    return config;
}

void PipelineConfig::validate() const {
    if (width <= 0 || height <= 0) {
        throw ConfigurationError("camera.width and camera.height must be positive");
    }
    if (fx <= 0.0 || fy <= 0.0) {
        throw ConfigurationError("camera.fx and camera.fy must be positive");
    }
    if (extrinsics_json.empty()) {
        throw ConfigurationError("camera.extrinsics is required");
    }
    if (!(sync.slop >= 0.0)) {
        throw ConfigurationError("synchronization.slop must be non-negative");
    }

    if (!usesModel()) {
        return;
    }

    if (num_classes <= 0 || num_classes > CV_CN_MAX) {
        throw ConfigurationError("semantic_pcl.num_classes must be in [1, " +
                                 std::to_string(CV_CN_MAX) + "]");
    }
    if (model.num_classes <= 0 || model.num_classes > CV_CN_MAX) {
        throw ConfigurationError("semantic_pcl.num_raw_classes must be in [1, " +
                                 std::to_string(CV_CN_MAX) + "]");
    }
    if (mode == fusion::FusionMode::SEMANTICS_BAYESIAN && model.num_classes < fusion::kTopK) {
        throw ConfigurationError("Bayesian fusion needs at least " +
                                 std::to_string(fusion::kTopK) + " raw classes");
    }
    if (!class_remap.empty() && static_cast<int>(class_remap.size()) != model.num_classes) {
        throw ConfigurationError("semantic_pcl.class_remap must have one entry per raw class");
    }

    const int background = resolvedBackgroundId();
    if (background < 0 || background >= num_classes) {
        throw ConfigurationError("semantic_pcl.background_id must be in [0, num_classes)");
    }
    for (size_t i = 0; i < class_remap.size(); ++i) {
        const auto& target = class_remap[i];
        if (target && (*target < 0 || *target >= num_classes)) {
            throw ConfigurationError("semantic_pcl.class_remap[" + std::to_string(i) +
                                     "] = " + std::to_string(*target) + " is outside [0, num_classes)");
        }
    }

    if (adapter.input_size.width <= 0 || adapter.input_size.height <= 0) {
        throw ConfigurationError("Model input size must be positive");
    }
}

segmentation::ClassRemapper::RemapTable PipelineConfig::resolvedRemapTable() const {
    if (!class_remap.empty()) {
        return class_remap;
    }

    segmentation::ClassRemapper::RemapTable identity;
    identity.reserve(model.num_classes);
    for (int i = 0; i < model.num_classes; ++i) {
        identity.emplace_back(i);
    }
    return identity;
}

} // namespace core
} // namespace semcloud
