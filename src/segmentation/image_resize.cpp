#include "semcloud/segmentation/image_resize.hpp"

#include <algorithm>
#include <cmath>
#include <opencv2/imgproc.hpp>

namespace semcloud {
namespace segmentation {

namespace {

// Gaussian truncated at four sigma, matching common anti-aliasing filters
int kernelSize(double sigma) {
    if (sigma <= 0.0) {
        return 1;
    }
    return 2 * static_cast<int>(std::ceil(4.0 * sigma)) + 1;
}

} // namespace

void resizeSmooth(const cv::Mat& src, cv::Mat& dst, const cv::Size& size) {
    cv::Mat input;
    src.convertTo(input, CV_MAKETYPE(CV_32F, src.channels()));

    if (input.size() == size) {
        input.copyTo(dst);
        return;
    }

    const double scale_x = static_cast<double>(input.cols) / size.width;
    const double scale_y = static_cast<double>(input.rows) / size.height;
    const double sigma_x = std::max(0.0, (scale_x - 1.0) / 2.0);
    const double sigma_y = std::max(0.0, (scale_y - 1.0) / 2.0);

    if (sigma_x > 0.0 || sigma_y > 0.0) {
        cv::Mat smoothed;
        cv::GaussianBlur(input, smoothed,
                         cv::Size(kernelSize(sigma_x), kernelSize(sigma_y)),
                         sigma_x, sigma_y, cv::BORDER_REFLECT_101);
        input = smoothed;
    }

    cv::resize(input, dst, size, 0.0, 0.0, cv::INTER_LINEAR);
}

void resizeNearest(const cv::Mat& src, cv::Mat& dst, const cv::Size& size) {
    if (src.size() == size) {
        src.copyTo(dst);
        return;
    }
    // Pixel-center sampling, the same grid INTER_LINEAR uses for confidences
    cv::resize(src, dst, size, 0.0, 0.0, cv::INTER_NEAREST_EXACT);
}

} // namespace segmentation
} // namespace semcloud
