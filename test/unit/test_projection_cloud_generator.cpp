#include <gtest/gtest.h>
#include "semcloud/projection/projection_cloud_generator.hpp"
#include "semcloud/projection/semantic_point_types.hpp"
#include "semcloud/utils/errors.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <pcl/conversions.h>

using namespace semcloud;
using namespace semcloud::projection;

class ProjectionCloudGeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        image_ = cv::Mat(10, 20, CV_8UC3, cv::Scalar(1, 1, 1));
        image_.at<cv::Vec3b>(5, 10) = cv::Vec3b(10, 20, 30);

        calibration_.extrinsics.setIdentity();
        calibration_.intrinsics = core::calibration_utils::makeIntrinsics(100.0, 100.0, 10.0, 5.0);

        points_ = std::make_shared<pcl::PointCloud<pcl::PointXYZ>>();
        points_->push_back(pcl::PointXYZ(0.0f, 0.0f, 1.0f));     // Image center
        points_->push_back(pcl::PointXYZ(0.0f, 0.0f, -1.0f));    // Behind the camera
        points_->push_back(pcl::PointXYZ(10.0f, 0.0f, 1.0f));    // Right of the image

        config_.frame_id = "lidar_link";
    }

    CloudGenerationInput makeInput(fusion::FusionMode mode) const {
        CloudGenerationInput input;
        input.image = &image_;
        input.points = points_;
        input.products = &products_;
        input.calibration = calibration_;
        input.stamp = 12.5;
        input.mode = mode;
        return input;
    }

    void fillProducts(size_t slots) {
        products_.resizeSlots(slots);
        for (size_t k = 0; k < slots; ++k) {
            products_.semantic_colors[k] = cv::Mat(10, 20, CV_8UC3, cv::Scalar(0, 0, 0));
            products_.semantic_colors[k].at<cv::Vec3b>(5, 10) =
                cv::Vec3b(static_cast<uchar>(k), 0, 128);
            products_.confidences[k] = cv::Mat(10, 20, CV_32FC1, cv::Scalar(0.0f));
            products_.confidences[k].at<float>(5, 10) = 0.75f - 0.25f * k;
        }
    }

    static bool hasField(const pcl::PCLPointCloud2& cloud, const std::string& name) {
        return std::any_of(cloud.fields.begin(), cloud.fields.end(),
                           [&](const pcl::PCLPointField& f) { return f.name == name; });
    }

    cv::Mat image_;
    core::CalibrationSet calibration_;
    pcl::PointCloud<pcl::PointXYZ>::Ptr points_;
    fusion::FusionProducts products_;
    ProjectionCloudGenerator::Config config_;
};

TEST_F(ProjectionCloudGeneratorTest, ProjectsPointsInFrontOfCamera) {
    ProjectionCloudGenerator generator(config_);
    const Eigen::Vector3d center(0.0, 0.0, 1.0);

    auto hit = generator.projectPoint(center, calibration_, image_.size());
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->u, 10);
    EXPECT_EQ(hit->v, 5);

    EXPECT_FALSE(generator.projectPoint(Eigen::Vector3d(0, 0, -1), calibration_, image_.size()).has_value());
    EXPECT_FALSE(generator.projectPoint(Eigen::Vector3d(10, 0, 1), calibration_, image_.size()).has_value());
}

TEST_F(ProjectionCloudGeneratorTest, RejectsProjectionsBeyondIntRange) {
    ProjectionCloudGenerator generator(config_);
    const double z = 2.0 * config_.min_depth;

    EXPECT_FALSE(generator.projectPoint(Eigen::Vector3d(1e7, 0.0, z), calibration_, image_.size()).has_value());
    EXPECT_FALSE(generator.projectPoint(Eigen::Vector3d(-1e7, 0.0, z), calibration_, image_.size()).has_value());
    EXPECT_FALSE(generator.projectPoint(Eigen::Vector3d(0.0, 1e7, z), calibration_, image_.size()).has_value());
}

TEST_F(ProjectionCloudGeneratorTest, AppliesExtrinsics) {
    // Scanner x forward, y left, z up into camera z forward, x right, y down
    calibration_.extrinsics << 0, -1,  0, 0,
                               0,  0, -1, 0,
                               1,  0,  0, 0,
                               0,  0,  0, 1;
    ProjectionCloudGenerator generator(config_);

    auto hit = generator.projectPoint(Eigen::Vector3d(5.0, 0.0, 0.0), calibration_, image_.size());
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->u, 10);
    EXPECT_EQ(hit->v, 5);

    EXPECT_FALSE(generator.projectPoint(Eigen::Vector3d(-5.0, 0.0, 0.0), calibration_, image_.size()).has_value());
}

TEST_F(ProjectionCloudGeneratorTest, ColorCloudSamplesImage) {
    ProjectionCloudGenerator generator(config_);
    pcl::PCLPointCloud2 output = generator.generate(makeInput(fusion::FusionMode::COLOR));

    EXPECT_EQ(output.header.frame_id, "lidar_link");
    EXPECT_EQ(output.header.stamp, 12500000u);
    EXPECT_TRUE(hasField(output, "rgb"));
    EXPECT_FALSE(hasField(output, "confidence"));

    pcl::PointCloud<pcl::PointXYZRGB> cloud;
    pcl::fromPCLPointCloud2(output, cloud);
    ASSERT_EQ(cloud.size(), 1u);
    EXPECT_EQ(cloud[0].r, 30);
    EXPECT_EQ(cloud[0].g, 20);
    EXPECT_EQ(cloud[0].b, 10);
}

TEST_F(ProjectionCloudGeneratorTest, MaxCloudCarriesSemanticColorAndConfidence) {
    fillProducts(1);
    ProjectionCloudGenerator generator(config_);
    pcl::PCLPointCloud2 output = generator.generate(makeInput(fusion::FusionMode::SEMANTICS_MAX));

    EXPECT_TRUE(hasField(output, "semantic_color"));
    EXPECT_TRUE(hasField(output, "confidence"));

    pcl::PointCloud<PointXYZRGBSemanticMax> cloud;
    pcl::fromPCLPointCloud2(output, cloud);
    ASSERT_EQ(cloud.size(), 1u);
    EXPECT_EQ(unpackRgb(cloud[0].semantic_color), 128u << 16);
    EXPECT_FLOAT_EQ(cloud[0].confidence, 0.75f);
    EXPECT_EQ(cloud[0].r, 30);
}

TEST_F(ProjectionCloudGeneratorTest, BackgroundPointsKeptWhenRequested) {
    fillProducts(1);
    ProjectionCloudGenerator generator(config_);

    auto input = makeInput(fusion::FusionMode::SEMANTICS_MAX);
    input.include_background = true;
    pcl::PointCloud<PointXYZRGBSemanticMax> cloud;
    pcl::fromPCLPointCloud2(generator.generate(input), cloud);

    ASSERT_EQ(cloud.size(), 3u);
    EXPECT_FLOAT_EQ(cloud[0].confidence, 0.75f);
    EXPECT_FLOAT_EQ(cloud[1].confidence, 0.0f);
    EXPECT_EQ(unpackRgb(cloud[1].semantic_color), 0u);
    EXPECT_FLOAT_EQ(cloud[2].z, 1.0f);
    EXPECT_FLOAT_EQ(cloud[2].confidence, 0.0f);
}

TEST_F(ProjectionCloudGeneratorTest, BayesianCloudCarriesThreeHypotheses) {
    fillProducts(fusion::kTopK);
    ProjectionCloudGenerator generator(config_);
    pcl::PCLPointCloud2 output = generator.generate(makeInput(fusion::FusionMode::SEMANTICS_BAYESIAN));

    for (const char* field : {"semantic_color1", "semantic_color2", "semantic_color3",
                              "confidence1", "confidence2", "confidence3"}) {
        EXPECT_TRUE(hasField(output, field)) << field;
    }

    pcl::PointCloud<PointXYZRGBSemanticBayesian> cloud;
    pcl::fromPCLPointCloud2(output, cloud);
    ASSERT_EQ(cloud.size(), 1u);
    EXPECT_FLOAT_EQ(cloud[0].confidence1, 0.75f);
    EXPECT_FLOAT_EQ(cloud[0].confidence2, 0.5f);
    EXPECT_FLOAT_EQ(cloud[0].confidence3, 0.25f);
    EXPECT_EQ(unpackRgb(cloud[0].semantic_color3), (128u << 16) | 2u);
}

TEST_F(ProjectionCloudGeneratorTest, ProductsAtOtherResolutionAreScaled) {
    products_.resizeSlots(1);
    products_.semantic_colors[0] = cv::Mat(5, 10, CV_8UC3, cv::Scalar(0, 0, 0));
    products_.semantic_colors[0].at<cv::Vec3b>(2, 5) = cv::Vec3b(0, 128, 0);
    products_.confidences[0] = cv::Mat(5, 10, CV_32FC1, cv::Scalar(0.0f));
    products_.confidences[0].at<float>(2, 5) = 0.6f;

    ProjectionCloudGenerator generator(config_);
    pcl::PointCloud<PointXYZRGBSemanticMax> cloud;
    pcl::fromPCLPointCloud2(generator.generate(makeInput(fusion::FusionMode::SEMANTICS_MAX)), cloud);

    ASSERT_EQ(cloud.size(), 1u);
    EXPECT_FLOAT_EQ(cloud[0].confidence, 0.6f);
    EXPECT_EQ(unpackRgb(cloud[0].semantic_color), 128u << 8);
}

TEST_F(ProjectionCloudGeneratorTest, MissingProductsRejected) {
    ProjectionCloudGenerator generator(config_);

    auto input = makeInput(fusion::FusionMode::SEMANTICS_MAX);
    input.products = nullptr;
    EXPECT_THROW(generator.generate(input), FrameError);

    fillProducts(1);
    EXPECT_THROW(generator.generate(makeInput(fusion::FusionMode::SEMANTICS_BAYESIAN)), FrameError);

    auto no_image = makeInput(fusion::FusionMode::COLOR);
    no_image.image = nullptr;
    EXPECT_THROW(generator.generate(no_image), FrameError);
}
