#pragma once
#include <onnxruntime_cxx_api.h>
#include <opencv2/core.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "Classifier.h"

namespace vision {

class OrtClassifier : public Classifier {
public:
    struct SessionOptions {
        std::string model_path = "assets/models/nsfw_classifier.onnx";
        int input_w = 224;
        int input_h = 224;
        std::vector<std::string> labels = { "normal", "nsfw" };
        float norm_mean = 0.5f;
        float norm_std  = 0.5f;
        int intra_threads = 0;      // 0 = auto decide threads usage
        bool fake_infer = false;
    };

    explicit OrtClassifier(const SessionOptions& opt);
    ~OrtClassifier() override = default;

    bool isReady() const override;
    ClassifierOutput classify(const cv::Mat& rgb) override;

    // one inference on a solid red image; marks the classifier unavailable on failure
    bool selfTest();

private:
    ClassifierOutput fakeClassify(const cv::Mat& rgb) const;
    std::vector<float> toInputTensor(const cv::Mat& rgb) const;
    std::string labelOf(int cls_id) const;

    SessionOptions opt_;
    std::atomic<bool> ready_{false};

    // onnx runtime session
    Ort::Env env_;                          // env object
    Ort::SessionOptions session_options_;   // session options config
    std::unique_ptr<Ort::Session> session_; // session instance
    std::string input_name_;
    std::string output_name_;
};

} // namespace vision
