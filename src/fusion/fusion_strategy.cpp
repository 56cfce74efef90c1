#include "semcloud/fusion/fusion_strategy.hpp"

#include <algorithm>
#include <cctype>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include "semcloud/segmentation/image_resize.hpp"
#include "semcloud/utils/errors.hpp"

namespace semcloud {
namespace fusion {

namespace {

void clampUnit(cv::Mat& confidence) {
    cv::max(confidence, 0.0, confidence);
    cv::min(confidence, 1.0, confidence);
}

void checkProbabilities(const cv::Mat& probabilities) {
    if (probabilities.empty() || probabilities.depth() != CV_32F) {
        throw FrameError("Probability map must be a non-empty float image");
    }
}

void checkContext(const FusionContext& context, const char* name) {
    if (!context.decoder) {
        throw ConfigurationError(std::string(name) + " requires a semantic decoder");
    }
    if (context.output_size.width <= 0 || context.output_size.height <= 0) {
        throw ConfigurationError(std::string(name) + " requires a positive output size");
    }
}

} // namespace

// =============================================================================
// ColorFusion
// =============================================================================

void ColorFusion::fuse(const cv::Mat& image, FusionProducts& products) {
    utils::ScopedTimer timer(products.processing_time);

    products.resizeSlots(1);
    image.copyTo(products.semantic_colors[0]);
    products.confidences[0].release();
    products.labels[0].release();

    products.input_count = image.total();
    products.output_count = image.total();
}

// =============================================================================
// MaxConfidenceFusion
// =============================================================================

MaxConfidenceFusion::MaxConfidenceFusion(const FusionContext& context)
    : context_(context) {
    checkContext(context_, getName());
    if (!context_.remapper) {
        throw ConfigurationError("MaxConfidence fusion requires a class remapper");
    }
}

void MaxConfidenceFusion::fuse(const cv::Mat& image, FusionProducts& products) {
    if (!context_.adapter) {
        throw ConfigurationError("MaxConfidence fusion requires a segmentation model");
    }

    utils::ScopedTimer timer(products.processing_time);
    cv::Mat probabilities = context_.adapter->predict(image);
    fuseProbabilities(probabilities, products);
    products.input_count = image.total();
}

void MaxConfidenceFusion::fuseProbabilities(const cv::Mat& probabilities,
                                            FusionProducts& products) const {
    checkProbabilities(probabilities);

    cv::Mat labels, confidence;
    fusion_utils::argmaxChannels(probabilities, labels, confidence);
    context_.remapper->remap(labels, labels);

    products.resizeSlots(1);
    segmentation::resizeNearest(labels, products.labels[0], context_.output_size);
    segmentation::resizeSmooth(confidence, products.confidences[0], context_.output_size);
    clampUnit(products.confidences[0]);
    context_.decoder->decode(products.labels[0], products.semantic_colors[0]);

    products.output_count = products.labels[0].total();
}

// =============================================================================
// BayesianTopKFusion
// =============================================================================

BayesianTopKFusion::BayesianTopKFusion(const FusionContext& context)
    : context_(context) {
    checkContext(context_, getName());
}

void BayesianTopKFusion::fuse(const cv::Mat& image, FusionProducts& products) {
    if (!context_.adapter) {
        throw ConfigurationError("BayesianTopK fusion requires a segmentation model");
    }

    utils::ScopedTimer timer(products.processing_time);
    cv::Mat probabilities = context_.adapter->predict(image);
    fuseProbabilities(probabilities, products);
    products.input_count = image.total();
}

void BayesianTopKFusion::fuseProbabilities(const cv::Mat& probabilities,
                                           FusionProducts& products) const {
    checkProbabilities(probabilities);
    if (probabilities.channels() < kTopK) {
        throw FrameError("Top-" + std::to_string(kTopK) + " fusion needs at least " +
                         std::to_string(kTopK) + " classes, got " +
                         std::to_string(probabilities.channels()));
    }

    std::vector<cv::Mat> labels, confidences;
    fusion_utils::topKChannels(probabilities, kTopK, labels, confidences);

    products.resizeSlots(kTopK);
    for (int k = 0; k < kTopK; ++k) {
        segmentation::resizeNearest(labels[k], products.labels[k], context_.output_size);
        context_.decoder->decode(products.labels[k], products.semantic_colors[k]);
        segmentation::resizeSmooth(confidences[k], products.confidences[k], context_.output_size);
        clampUnit(products.confidences[k]);
    }

    products.output_count = products.labels[0].total();
}

// =============================================================================
// Factory
// =============================================================================

std::unique_ptr<FusionStrategy> createFusionStrategy(FusionMode mode, const FusionContext& context) {
    switch (mode) {
        case FusionMode::COLOR:
            return std::make_unique<ColorFusion>();
        case FusionMode::SEMANTICS_MAX:
            return std::make_unique<MaxConfidenceFusion>(context);
        case FusionMode::SEMANTICS_BAYESIAN:
            return std::make_unique<BayesianTopKFusion>(context);
    }
    throw ConfigurationError("Unknown fusion mode");
}

// =============================================================================
// Utility Functions
// =============================================================================

namespace fusion_utils {

const char* modeToString(FusionMode mode) {
    switch (mode) {
        case FusionMode::COLOR: return "COLOR";
        case FusionMode::SEMANTICS_MAX: return "SEMANTICS_MAX";
        case FusionMode::SEMANTICS_BAYESIAN: return "SEMANTICS_BAYESIAN";
        default: return "UNKNOWN";
    }
}

FusionMode stringToMode(const std::string& mode_str) {
    std::string lower(mode_str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "0" || lower == "color") return FusionMode::COLOR;
    if (lower == "1" || lower == "max" || lower == "semantics_max") return FusionMode::SEMANTICS_MAX;
    if (lower == "2" || lower == "bayesian" || lower == "semantics_bayesian") {
        return FusionMode::SEMANTICS_BAYESIAN;
    }

    throw ConfigurationError("Unknown fusion mode: " + mode_str);
}

FusionMode intToMode(int value) {
    switch (value) {
        case 0: return FusionMode::COLOR;
        case 1: return FusionMode::SEMANTICS_MAX;
        case 2: return FusionMode::SEMANTICS_BAYESIAN;
        default:
            throw ConfigurationError("Unknown fusion mode: " + std::to_string(value));
    }
}

void argmaxChannels(const cv::Mat& probabilities, cv::Mat& labels, cv::Mat& confidence) {
    const int channels = probabilities.channels();
    labels.create(probabilities.size(), CV_32SC1);
    confidence.create(probabilities.size(), CV_32FC1);

    tbb::parallel_for(tbb::blocked_range<int>(0, probabilities.rows),
        [&](const tbb::blocked_range<int>& range) {
            for (int v = range.begin(); v != range.end(); ++v) {
                const float* row = probabilities.ptr<float>(v);
                int* label_row = labels.ptr<int>(v);
                float* conf_row = confidence.ptr<float>(v);

                for (int u = 0; u < probabilities.cols; ++u) {
                    const float* px = row + static_cast<size_t>(u) * channels;
                    int best = 0;
                    for (int c = 1; c < channels; ++c) {
                        if (px[c] > px[best]) {
                            best = c;
                        }
                    }
                    label_row[u] = best;
                    conf_row[u] = px[best];
                }
            }
        });
}

void topKChannels(const cv::Mat& probabilities, int k,
                  std::vector<cv::Mat>& labels, std::vector<cv::Mat>& confidences) {
    const int channels = probabilities.channels();
    if (k <= 0 || k > channels) {
        throw FrameError("Cannot select top " + std::to_string(k) + " of " +
                         std::to_string(channels) + " classes");
    }

    labels.resize(k);
    confidences.resize(k);
    for (int r = 0; r < k; ++r) {
        labels[r].create(probabilities.size(), CV_32SC1);
        confidences[r].create(probabilities.size(), CV_32FC1);
    }

    tbb::parallel_for(tbb::blocked_range<int>(0, probabilities.rows),
        [&](const tbb::blocked_range<int>& range) {
            std::vector<int> best_idx(k);
            std::vector<float> best_val(k);

            for (int v = range.begin(); v != range.end(); ++v) {
                const float* row = probabilities.ptr<float>(v);

                for (int u = 0; u < probabilities.cols; ++u) {
                    const float* px = row + static_cast<size_t>(u) * channels;
                    int filled = 0;

                    // Classes visited in ascending order; strict comparison keeps
                    // the lower index ahead on equal probability
                    for (int c = 0; c < channels; ++c) {
                        const float p = px[c];
                        if (filled == k && !(p > best_val[k - 1])) {
                            continue;
                        }
                        int pos = std::min(filled, k - 1);
                        while (pos > 0 && p > best_val[pos - 1]) {
                            best_val[pos] = best_val[pos - 1];
                            best_idx[pos] = best_idx[pos - 1];
                            --pos;
                        }
                        best_val[pos] = p;
                        best_idx[pos] = c;
                        if (filled < k) {
                            ++filled;
                        }
                    }

                    for (int r = 0; r < k; ++r) {
                        labels[r].ptr<int>(v)[u] = best_idx[r];
                        confidences[r].ptr<float>(v)[u] = best_val[r];
                    }
                }
            }
        });
}

} // namespace fusion_utils

} // namespace fusion
} // namespace semcloud
