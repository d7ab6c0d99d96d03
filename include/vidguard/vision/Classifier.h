#pragma once
#include <opencv2/core.hpp>
#include "Types.h"

namespace vision {

// 图像分类器接口: image -> {label, score}
// classify() may be called from several threads at once.
class Classifier {
public:
    virtual ~Classifier() = default;

    virtual bool isReady() const = 0;

    // rgb: 8-bit 3-channel RGB image of any size. Throws std::exception on inference failure.
    virtual ClassifierOutput classify(const cv::Mat& rgb) = 0;
};

} // namespace vision
