#pragma once

#include <cstdint>
#include <cstring>
#include <pcl/point_types.h>
#include <pcl/register_point_struct.h>

namespace semcloud {
namespace projection {

/**
 * @brief Point with camera color, best class color and its confidence
 */
struct PointXYZRGBSemanticMax {
    PCL_ADD_POINT4D;
    PCL_ADD_RGB;
    float semantic_color;       // Packed like rgb
    float confidence;
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW
} EIGEN_ALIGN16;

/**
 * @brief Point with camera color and the three best class hypotheses
 */
struct PointXYZRGBSemanticBayesian {
    PCL_ADD_POINT4D;
    PCL_ADD_RGB;
    float semantic_color1;
    float semantic_color2;
    float semantic_color3;
    float confidence1;
    float confidence2;
    float confidence3;
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW
} EIGEN_ALIGN16;

/**
 * @brief Pack 8-bit channels into the float layout PCL uses for rgb fields
 */
inline float packRgb(uint8_t r, uint8_t g, uint8_t b) {
    const uint32_t packed = (static_cast<uint32_t>(r) << 16) |
                            (static_cast<uint32_t>(g) << 8) |
                            static_cast<uint32_t>(b);
    float value;
    std::memcpy(&value, &packed, sizeof(value));
    return value;
}

inline uint32_t unpackRgb(float value) {
    uint32_t packed;
    std::memcpy(&packed, &value, sizeof(packed));
    return packed;
}

} // namespace projection
} // namespace semcloud

POINT_CLOUD_REGISTER_POINT_STRUCT(semcloud::projection::PointXYZRGBSemanticMax,
    (float, x, x) (float, y, y) (float, z, z) (float, rgb, rgb)
    (float, semantic_color, semantic_color) (float, confidence, confidence)
)

POINT_CLOUD_REGISTER_POINT_STRUCT(semcloud::projection::PointXYZRGBSemanticBayesian,
    (float, x, x) (float, y, y) (float, z, z) (float, rgb, rgb)
    (float, semantic_color1, semantic_color1) (float, semantic_color2, semantic_color2)
    (float, semantic_color3, semantic_color3)
    (float, confidence1, confidence1) (float, confidence2, confidence2)
    (float, confidence3, confidence3)
)
