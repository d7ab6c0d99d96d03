#include <iostream>
#include <mutex>
#include <string>

#include "vidguard/Config.h"
#include "vidguard/Errors.h"
#include "vidguard/Runtime.h"
#include "vidguard/session/Events.h"
#include "vidguard/session/MessageChannel.h"
#include "vidguard/session/SessionRegistry.h"
#include "vidguard/session/VideoStore.h"
#include "vidguard/vision/VideoAnnotator.h"

// Usage:
//   scan_cli <video_path> [--config assets/config/server.yml]
//   scan_cli <video_path> --annotate out.mp4 [--frame-skip 30] [--config file]
// Runs one session offline through the registry + coordinator and prints every event as a JSON line.
// With --annotate, writes a copy of the video with the classification drawn on every frame instead.

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) if (flag == argv[i]) return true; return false;
}
static const char* getOpt(int argc, char** argv, const std::string& key, const char* defv=nullptr) {
    for (int i = 1; i + 1 < argc; ++i) if (key == argv[i]) return argv[i+1]; return defv;
}

// JSONL to stdout
class StdoutChannel : public vidguard::MessageChannel {
public:
    bool send(const nlohmann::json& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << event.dump() << std::endl;
        return static_cast<bool>(std::cout);
    }
    void close(const std::string& reason) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cerr << "[scan_cli] channel closed: " << reason << "\n";
    }
private:
    std::mutex mutex_;
};

int main(int argc, char** argv) {
    if (argc < 2 || hasFlag(argc, argv, "-h") || hasFlag(argc, argv, "--help")) {
        std::cout << "Usage: scan_cli <video_path> [--config file] [--annotate out.mp4 [--frame-skip N]]\n";
        return 0;
    }
    const std::string video_path = argv[1];
    const vidguard::ServerConfig cfg =
        vidguard::ServerConfig::fromFile(getOpt(argc, argv, "--config", "assets/config/server.yml"));

    if (const char* out = getOpt(argc, argv, "--annotate")) {
        auto classifier = vidguard::loadClassifier(cfg);
        if (!classifier->isReady()) {
            std::cerr << "[scan_cli] ClassifierUnavailable: Classifier not loaded\n";
            return 2;
        }
        vision::AnnotateOptions opt;
        opt.benign_label = cfg.benign_label;
        try {
            opt.frame_skip = std::stoi(getOpt(argc, argv, "--frame-skip", "30"));
        } catch (const std::exception&) {
            std::cerr << "[scan_cli] --frame-skip expects an integer\n";
            return 1;
        }
        try {
            const auto stats = vision::annotateVideo(video_path, out, *classifier, opt);
            std::cout << nlohmann::json{{"output", out},
                                        {"frames", stats.frames_written},
                                        {"classified", stats.frames_classified},
                                        {"errors", stats.classification_errors}}.dump() << std::endl;
        } catch (const std::runtime_error& e) {
            std::cerr << "[scan_cli] " << e.what() << "\n";
            return 2;
        }
        return 0;
    }

    vidguard::VideoStore store(cfg);
    if (!store.prepareDirectories()) return 1;

    auto classifier = vidguard::loadClassifier(cfg);
    vidguard::SessionRegistry registry(classifier.get(), cfg);
    auto channel = std::make_shared<StdoutChannel>();

    const std::string sid = registry.create();
    int rc = 0;
    try {
        // 拷贝一份, 拆除时删除的是副本
        const auto stored = store.import(sid, video_path);
        registry.bindConnection(sid, channel);
        channel->send(vidguard::events::connectionEstablished(sid));

        if (!registry.classifierReady()) {
            throw vidguard::ScanException(vidguard::ScanError::ClassifierUnavailable, "Classifier not loaded");
        }
        const auto props = registry.attach(sid, stored);
        channel->send(vidguard::events::videoInfo(props));

        registry.startStreaming(sid);
        registry.waitForScan(sid);
    } catch (const vidguard::ScanException& e) {
        channel->send(vidguard::events::error(e.what()));
        std::cerr << "[scan_cli] " << vidguard::toString(e.code()) << ": " << e.what() << "\n";
        rc = 2;
    }

    registry.remove(sid);
    return rc;
}
