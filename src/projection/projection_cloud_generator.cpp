#include "semcloud/projection/projection_cloud_generator.hpp"

#include <cmath>
#include <cstdint>
#include <pcl/conversions.h>

#include "semcloud/projection/semantic_point_types.hpp"
#include "semcloud/utils/common_types.hpp"
#include "semcloud/utils/errors.hpp"

namespace semcloud {
namespace projection {

namespace {

inline float packBgr(const cv::Vec3b& bgr) {
    return packRgb(bgr[2], bgr[1], bgr[0]);
}

// Sample a product at the pixel matching (u, v) of the source image
template<typename T>
inline T sampleScaled(const cv::Mat& product, int u, int v, const cv::Size& image_size) {
    const int pu = static_cast<int>(static_cast<int64_t>(u) * product.cols / image_size.width);
    const int pv = static_cast<int>(static_cast<int64_t>(v) * product.rows / image_size.height);
    return product.at<T>(pv, pu);
}

void checkProducts(const fusion::FusionProducts& products, size_t slots) {
    if (products.slotCount() < slots) {
        throw FrameError("Fusion products hold " + std::to_string(products.slotCount()) +
                         " slots, expected " + std::to_string(slots));
    }
    for (size_t k = 0; k < slots; ++k) {
        if (products.semantic_colors[k].type() != CV_8UC3 ||
            products.confidences[k].type() != CV_32FC1) {
            throw FrameError("Fusion product slot " + std::to_string(k) + " is malformed");
        }
    }
}

} // namespace

void ProjectionCloudGenerator::Config::loadFromYaml(const YAML::Node& node) {
    using utils::ConfigLoader;

    frame_id = ConfigLoader::readParam(node, "frame_id", frame_id);
    min_depth = ConfigLoader::readParam(node, "min_depth", min_depth);
}

ProjectionCloudGenerator::ProjectionCloudGenerator(const Config& config)
    : config_(config) {}

std::optional<PixelHit> ProjectionCloudGenerator::projectPoint(
    const Eigen::Vector3d& point,
    const core::CalibrationSet& calibration,
    const cv::Size& image_size) const {

    const Eigen::Vector3d camera_point =
        calibration.extrinsics.block<3, 3>(0, 0) * point + calibration.extrinsics.block<3, 1>(0, 3);

    // Only points in front of camera
    if (camera_point.z() <= config_.min_depth) {
        return std::nullopt;
    }

    const double u = calibration.fx() * camera_point.x() / camera_point.z() + calibration.cx();
    const double v = calibration.fy() * camera_point.y() / camera_point.z() + calibration.cy();

    // Bounds are checked before narrowing; grazing points can land far outside int range
    const double ru = std::round(u);
    const double rv = std::round(v);
    if (!(ru >= 0.0 && ru < image_size.width && rv >= 0.0 && rv < image_size.height)) {
        return std::nullopt;
    }

    return PixelHit{static_cast<int>(ru), static_cast<int>(rv)};
}

template<typename PointT, typename FillFn>
pcl::PCLPointCloud2 ProjectionCloudGenerator::buildCloud(const CloudGenerationInput& input,
                                                         FillFn fill) const {
    const cv::Mat& image = *input.image;
    const cv::Size image_size = image.size();

    pcl::PointCloud<PointT> cloud;
    cloud.reserve(input.points->size());

    for (const auto& src : input.points->points) {
        if (!std::isfinite(src.x) || !std::isfinite(src.y) || !std::isfinite(src.z)) {
            continue;
        }

        auto hit = projectPoint(Eigen::Vector3d(src.x, src.y, src.z), input.calibration, image_size);
        if (!hit && !input.include_background) {
            continue;
        }

        PointT point;
        point.x = src.x;
        point.y = src.y;
        point.z = src.z;
        fill(point, hit ? &*hit : nullptr);
        cloud.push_back(point);
    }

    cloud.header.frame_id = config_.frame_id;
    cloud.header.stamp = static_cast<std::uint64_t>(std::llround(input.stamp * 1e6));
    cloud.width = static_cast<std::uint32_t>(cloud.size());
    cloud.height = 1;
    cloud.is_dense = true;

    pcl::PCLPointCloud2 output;
    pcl::toPCLPointCloud2(cloud, output);
    return output;
}

pcl::PCLPointCloud2 ProjectionCloudGenerator::generate(const CloudGenerationInput& input) {
    if (!input.image || input.image->empty() || input.image->type() != CV_8UC3) {
        throw FrameError("Cloud generation requires a BGR8 image");
    }
    if (!input.points) {
        throw FrameError("Cloud generation requires scan points");
    }

    const cv::Mat& image = *input.image;
    const cv::Size image_size = image.size();

    switch (input.mode) {
        case fusion::FusionMode::COLOR:
            return buildCloud<pcl::PointXYZRGB>(input,
                [&](pcl::PointXYZRGB& point, const PixelHit* hit) {
                    point.rgb = hit ? packBgr(image.at<cv::Vec3b>(hit->v, hit->u)) : packRgb(0, 0, 0);
                });

        case fusion::FusionMode::SEMANTICS_MAX: {
            if (!input.products) {
                throw FrameError("Max cloud requires fusion products");
            }
            checkProducts(*input.products, 1);
            const auto& products = *input.products;

            return buildCloud<PointXYZRGBSemanticMax>(input,
                [&](PointXYZRGBSemanticMax& point, const PixelHit* hit) {
                    if (!hit) {
                        point.rgb = packRgb(0, 0, 0);
                        point.semantic_color = packRgb(0, 0, 0);
                        point.confidence = 0.0f;
                        return;
                    }
                    point.rgb = packBgr(image.at<cv::Vec3b>(hit->v, hit->u));
                    point.semantic_color = packBgr(
                        sampleScaled<cv::Vec3b>(products.semantic_colors[0], hit->u, hit->v, image_size));
                    point.confidence =
                        sampleScaled<float>(products.confidences[0], hit->u, hit->v, image_size);
                });
        }

        case fusion::FusionMode::SEMANTICS_BAYESIAN: {
            if (!input.products) {
                throw FrameError("Bayesian cloud requires fusion products");
            }
            checkProducts(*input.products, fusion::kTopK);
            const auto& products = *input.products;

            return buildCloud<PointXYZRGBSemanticBayesian>(input,
                [&](PointXYZRGBSemanticBayesian& point, const PixelHit* hit) {
                    float* colors[fusion::kTopK] = {
                        &point.semantic_color1, &point.semantic_color2, &point.semantic_color3};
                    float* confidences[fusion::kTopK] = {
                        &point.confidence1, &point.confidence2, &point.confidence3};

                    point.rgb = hit ? packBgr(image.at<cv::Vec3b>(hit->v, hit->u)) : packRgb(0, 0, 0);
                    for (int k = 0; k < fusion::kTopK; ++k) {
                        if (!hit) {
                            *colors[k] = packRgb(0, 0, 0);
                            *confidences[k] = 0.0f;
                            continue;
                        }
                        *colors[k] = packBgr(
                            sampleScaled<cv::Vec3b>(products.semantic_colors[k], hit->u, hit->v, image_size));
                        *confidences[k] =
                            sampleScaled<float>(products.confidences[k], hit->u, hit->v, image_size);
                    }
                });
        }
    }

    throw FrameError("Unknown fusion mode");
}

} // namespace projection
} // namespace semcloud
