#include "vidguard/vision/OrtClassifier.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace vision {

    // OrtClassifier initializor
    OrtClassifier::OrtClassifier(const SessionOptions& opt)
        : opt_(opt),
          env_(ORT_LOGGING_LEVEL_WARNING, "vidguard-classifier"),
          session_options_()
    {
        if (opt_.fake_infer) {
            ready_ = true;
            std::cout << "[OrtClassifier] fake_infer enabled, no model loaded\n";
            return;
        }

        if (!std::filesystem::exists(opt_.model_path)) {
            std::cerr << "[OrtClassifier] Model file not found: " << opt_.model_path << "\n";
            return;
        }

        session_options_.SetIntraOpNumThreads(opt_.intra_threads);

        try {
#ifdef _WIN32
            std::wstring model_path_w(opt_.model_path.begin(), opt_.model_path.end());
            session_ = std::make_unique<Ort::Session>(env_, model_path_w.c_str(), session_options_);
#else
            session_ = std::make_unique<Ort::Session>(env_, opt_.model_path.c_str(), session_options_);
#endif
            // I/O node names ("pixel_values" -> "logits" for HF image classifiers)
            Ort::AllocatorWithDefaultOptions allocator;
            input_name_  = session_->GetInputNameAllocated(0, allocator).get();
            output_name_ = session_->GetOutputNameAllocated(0, allocator).get();
            ready_ = true;
            std::cout << "[OrtClassifier] ONNX session created with model: " << opt_.model_path
                      << " (input " << input_name_ << ", output " << output_name_ << ")\n";
        } catch (const Ort::Exception& ex) {
            std::cerr << "[OrtClassifier] Failed to create ONNX session: " << ex.what() << "\n";
            session_.reset();
            ready_ = false; // remain not ready; classify() will throw
        }
    }

    bool OrtClassifier::isReady() const { return ready_.load(); }

    bool OrtClassifier::selfTest() {
        if (!ready_) return false;
        cv::Mat red(opt_.input_h, opt_.input_w, CV_8UC3, cv::Scalar(255, 0, 0));   // RGB
        try {
            auto out = classify(red);
            std::cout << "[OrtClassifier] Self test result: " << out.label << " (" << out.score << ")\n";
            return true;
        } catch (const std::exception& ex) {
            std::cerr << "[OrtClassifier] Self test failed: " << ex.what() << "\n";
            ready_ = false;
            return false;
        }
    }

    ClassifierOutput OrtClassifier::classify(const cv::Mat& rgb) {
        if (rgb.empty() || rgb.type() != CV_8UC3) {
            throw std::invalid_argument("classifier expects a non-empty 8-bit 3-channel image");
        }

        // ========= fake infer: brightness decides the class ===========
        if (opt_.fake_infer) {
            return fakeClassify(rgb);
        }

        if (!session_ || !ready_) {
            throw std::runtime_error("classifier session is not loaded");
        }

        // 1/ Preprocess (resize, hwc -> nchw, normalize)
        std::vector<float> input_tensor_val = toInputTensor(rgb);
        std::vector<int64_t> input_shape = {1, 3, opt_.input_h, opt_.input_w};
        Ort::MemoryInfo memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
        Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
            memory_info,
            input_tensor_val.data(),    // float* p_data
            input_tensor_val.size(),    // size_t p_data_element_count
            input_shape.data(),         // int64_t* shape
            input_shape.size()          // size_t shape_len
        );

        // 2/ Inference run (Ort::Session::Run is safe to call concurrently)
        const char* input_names[]  = {input_name_.c_str()};
        const char* output_names[] = {output_name_.c_str()};
        auto output_tensors = session_->Run(
            Ort::RunOptions{nullptr},
            input_names,  &input_tensor, 1,
            output_names, 1
        );

        // 3/ Output logits [1, num_classes] -> softmax -> arg-max
        const float* logits = output_tensors[0].GetTensorData<float>();
        auto output_shape = output_tensors[0].GetTensorTypeAndShapeInfo().GetShape();
        int num_classes = static_cast<int>(output_shape.empty() ? 0 : output_shape.back());
        if (num_classes <= 0) {
            throw std::runtime_error("classifier produced an empty output tensor");
        }

        float max_logit = *std::max_element(logits, logits + num_classes);
        float sum = 0.f;
        std::vector<float> probs(num_classes);
        for (int c = 0; c < num_classes; ++c) {
            probs[c] = std::exp(logits[c] - max_logit);
            sum += probs[c];
        }
        int best_cls = static_cast<int>(std::max_element(probs.begin(), probs.end()) - probs.begin());

        return ClassifierOutput{ labelOf(best_cls), probs[best_cls] / sum };
    }

    std::vector<float> OrtClassifier::toInputTensor(const cv::Mat& rgb) const {
        cv::Mat resized;
        cv::resize(rgb, resized, cv::Size(opt_.input_w, opt_.input_h));

        std::vector<float> input_tensor_val(1 * 3 * opt_.input_w * opt_.input_h);
        for (int c = 0; c < 3; ++c) {
            for (int h = 0; h < opt_.input_h; ++h) {
                const auto* row = resized.ptr<cv::Vec3b>(h);
                for (int w = 0; w < opt_.input_w; ++w) {
                    int idx = c * opt_.input_h * opt_.input_w + h * opt_.input_w + w;
                    input_tensor_val[idx] = (row[w][c] / 255.0f - opt_.norm_mean) / opt_.norm_std;
                }
            }
        }
        return input_tensor_val;
    }

    ClassifierOutput OrtClassifier::fakeClassify(const cv::Mat& rgb) const {
        cv::Scalar mean = cv::mean(rgb);
        float brightness = static_cast<float>((mean[0] + mean[1] + mean[2]) / (3.0 * 255.0));
        // bright frames -> benign, dark frames -> flagged
        if (brightness >= 0.5f) return ClassifierOutput{ labelOf(0), brightness };
        return ClassifierOutput{ labelOf(1), 1.f - brightness };
    }

    std::string OrtClassifier::labelOf(int cls_id) const {
        if (cls_id >= 0 && cls_id < static_cast<int>(opt_.labels.size())) return opt_.labels[cls_id];
        return "class_" + std::to_string(cls_id);
    }

} // namespace vision
