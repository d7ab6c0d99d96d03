#include "vidguard/Runtime.h"

#include <QDebug>

namespace vidguard {

vision::OrtClassifier::SessionOptions classifierOptions(const ServerConfig& cfg) {
    vision::OrtClassifier::SessionOptions opt;
    opt.model_path    = cfg.model_path;
    opt.input_w       = cfg.input_w;
    opt.input_h       = cfg.input_h;
    opt.labels        = cfg.labels;
    opt.norm_mean     = cfg.norm_mean;
    opt.norm_std      = cfg.norm_std;
    opt.intra_threads = cfg.intra_threads;
    opt.fake_infer    = cfg.fake_infer;
    return opt;
}

std::unique_ptr<vision::OrtClassifier> loadClassifier(const ServerConfig& cfg) {
    auto classifier = std::make_unique<vision::OrtClassifier>(classifierOptions(cfg));
    if (classifier->isReady() && classifier->selfTest()) {
        qInfo() << "[Runtime] Classifier loaded" << (cfg.fake_infer ? "(fake_infer)" : "")
                << QString::fromStdString(cfg.model_path);
    } else {
        qWarning() << "[Runtime] Classifier unavailable, sessions will be refused:"
                   << QString::fromStdString(cfg.model_path);
    }
    return classifier;
}

} // namespace vidguard
