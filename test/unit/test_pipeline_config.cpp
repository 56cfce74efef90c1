#include <gtest/gtest.h>
#include "semcloud/core/pipeline_config.hpp"
#include "semcloud/utils/errors.hpp"

#include <filesystem>
#include <fstream>
#include <functional>

using namespace semcloud;
using namespace semcloud::core;

class PipelineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "test_semcloud_config";
        std::filesystem::create_directories(test_dir_);
        config_path_ = test_dir_ / "semantic_cloud.yaml";
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    void writeConfig(const std::string& contents) {
        std::ofstream file(config_path_);
        file << contents;
    }

    static std::string baseYaml() {
        return
            "camera:\n"
            "  intrinsic_topic: /mapping/left/camera_info\n"
            "  fx: 1458.20218\n"
            "  fy: 1460.09074\n"
            "  cx: 684.44996\n"
            "  cy: 538.93562\n"
            "  width: 1384\n"
            "  height: 1032\n"
            "  extrinsics: \"[[1, 0, 0, 0], [0, 1, 0, 0], [0, 0, 1, 0], [0, 0, 0, 1]]\"\n"
            "semantic_pcl:\n"
            "  color_image_topic: /left/camera/image_color\n"
            "  lidar_topic: /velodyne_points\n"
            "  point_type: 1\n"
            "  frame_id: lidar_link\n"
            "  model_path: /models/seg.onnx\n"
            "  num_classes: 8\n"
            "  class_remap: [7, 1, 3, 7, 2, 0, 5, 1, 0, 0]\n"
            "  include_background: false\n"
            "device: \"cuda:0\"\n";
    }

    std::filesystem::path test_dir_;
    std::filesystem::path config_path_;
};

TEST_F(PipelineConfigTest, LoadsAllSections) {
    writeConfig(baseYaml());
    PipelineConfig config = PipelineConfig::loadFromFile(config_path_.string());

    EXPECT_EQ(config.mode, fusion::FusionMode::SEMANTICS_MAX);
    EXPECT_EQ(config.width, 1384);
    EXPECT_EQ(config.height, 1032);
    EXPECT_DOUBLE_EQ(config.fx, 1458.20218);
    EXPECT_DOUBLE_EQ(config.cy, 538.93562);
    EXPECT_EQ(config.num_classes, 8);
    ASSERT_EQ(config.class_remap.size(), 10u);
    EXPECT_EQ(*config.class_remap[0], 7);
    EXPECT_EQ(*config.class_remap[6], 5);
    EXPECT_FALSE(config.include_background);

    EXPECT_EQ(config.model.model_path, "/models/seg.onnx");
    EXPECT_EQ(config.model.device, "cuda:0");
    EXPECT_EQ(config.model.num_classes, 10);

    EXPECT_EQ(config.cloud.frame_id, "lidar_link");
    EXPECT_EQ(config.topics.color_image_topic, "/left/camera/image_color");
    EXPECT_EQ(config.topics.lidar_topic, "/velodyne_points");
    EXPECT_EQ(config.topics.intrinsic_topic, "/mapping/left/camera_info");
}

TEST_F(PipelineConfigTest, DefaultsResolveFromOtherKeys) {
    writeConfig(baseYaml());
    PipelineConfig config = PipelineConfig::loadFromFile(config_path_.string());

    EXPECT_EQ(config.resolvedBackgroundId(), 7);
    EXPECT_EQ(config.adapter.input_size, cv::Size(1384, 1032));
    EXPECT_TRUE(config.adapter.flip_channels);
    EXPECT_TRUE(config.adapter.rotate_180);
    EXPECT_FALSE(config.model.apply_softmax);
    EXPECT_DOUBLE_EQ(config.sync.slop, 0.3);
}

TEST_F(PipelineConfigTest, ExplicitOverrides) {
    writeConfig(baseYaml() +
        "synchronization:\n"
        "  slop: 0.05\n");
    YAML::Node root = YAML::LoadFile(config_path_.string());
    root["semantic_pcl"]["point_type"] = "bayesian";
    root["semantic_pcl"]["background_id"] = 0;
    root["semantic_pcl"]["model_input_width"] = 512;
    root["semantic_pcl"]["model_input_height"] = 384;
    root["semantic_pcl"]["rotate_180"] = false;
    root["semantic_pcl"]["device"] = "cpu";

    PipelineConfig config;
    config.loadFromYaml(root);
    config.validate();

    EXPECT_EQ(config.mode, fusion::FusionMode::SEMANTICS_BAYESIAN);
    EXPECT_EQ(config.resolvedBackgroundId(), 0);
    EXPECT_EQ(config.adapter.input_size, cv::Size(512, 384));
    EXPECT_FALSE(config.adapter.rotate_180);
    EXPECT_EQ(config.model.device, "cpu");
    EXPECT_DOUBLE_EQ(config.sync.slop, 0.05);
}

TEST_F(PipelineConfigTest, NullRemapEntriesAreUnset) {
    YAML::Node root = YAML::Load(baseYaml());
    root["semantic_pcl"]["class_remap"] = YAML::Load("[1, ~, 0]");

    PipelineConfig config;
    config.loadFromYaml(root);

    ASSERT_EQ(config.class_remap.size(), 3u);
    EXPECT_TRUE(config.class_remap[0].has_value());
    EXPECT_FALSE(config.class_remap[1].has_value());
    EXPECT_EQ(config.model.num_classes, 3);
    EXPECT_NO_THROW(config.validate());
}

TEST_F(PipelineConfigTest, IdentityRemapWhenTableMissing) {
    YAML::Node root = YAML::Load(baseYaml());
    root["semantic_pcl"].remove("class_remap");

    PipelineConfig config;
    config.loadFromYaml(root);
    config.validate();

    auto table = config.resolvedRemapTable();
    ASSERT_EQ(table.size(), 8u);
    EXPECT_EQ(*table[5], 5);
}

TEST_F(PipelineConfigTest, InvalidValuesRejected) {
    auto expectInvalid = [](const std::function<void(YAML::Node&)>& edit) {
        YAML::Node root = YAML::Load(baseYaml());
        edit(root);
        PipelineConfig config;
        EXPECT_THROW({
            config.loadFromYaml(root);
            config.validate();
        }, ConfigurationError);
    };

    expectInvalid([](YAML::Node& root) { root["semantic_pcl"]["point_type"] = 3; });
    expectInvalid([](YAML::Node& root) { root["semantic_pcl"]["point_type"] = "rainbow"; });
    expectInvalid([](YAML::Node& root) { root["camera"]["width"] = 0; });
    expectInvalid([](YAML::Node& root) { root["camera"].remove("extrinsics"); });
    expectInvalid([](YAML::Node& root) { root["semantic_pcl"]["num_classes"] = 0; });
    expectInvalid([](YAML::Node& root) { root["semantic_pcl"]["background_id"] = 8; });
    expectInvalid([](YAML::Node& root) {
        root["semantic_pcl"]["class_remap"] = YAML::Load("[0, 9]");
    });
    expectInvalid([](YAML::Node& root) { root["semantic_pcl"]["num_raw_classes"] = 12; });
    expectInvalid([](YAML::Node& root) { root["semantic_pcl"]["class_remap"] = "not a list"; });
    expectInvalid([](YAML::Node& root) { root["camera"]["fx"] = "fast"; });
    expectInvalid([](YAML::Node& root) { root["synchronization"]["slop"] = -1.0; });
    expectInvalid([](YAML::Node& root) {
        root["semantic_pcl"]["point_type"] = 2;
        root["semantic_pcl"]["class_remap"] = YAML::Load("[0, 1]");
    });
}

TEST_F(PipelineConfigTest, ColorModeNeedsNoSemantics) {
    YAML::Node root = YAML::Load(baseYaml());
    root["semantic_pcl"]["point_type"] = 0;
    root["semantic_pcl"]["num_classes"] = 0;
    root["semantic_pcl"].remove("class_remap");

    PipelineConfig config;
    config.loadFromYaml(root);
    EXPECT_NO_THROW(config.validate());
    EXPECT_FALSE(config.usesModel());
}

TEST_F(PipelineConfigTest, MissingFileRejected) {
    EXPECT_THROW(PipelineConfig::loadFromFile((test_dir_ / "missing.yaml").string()),
                 ConfigurationError);
}
