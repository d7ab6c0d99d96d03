#pragma once
#include <string>
#include <vector>

namespace vidguard {

// vidguard server running config (load from server.yml)
struct ServerConfig {
    // ===================== 字段fields ===================== //

    // WebSocket 监听地址
    std::string host = "0.0.0.0";
    int         port = 8000;

    // storage roots
    std::string upload_dir = "videos";      // imported videos, named <session_id><ext>
    std::string temp_dir   = "temp";        // scratch files, removed by cleanup
    int max_upload_mb      = 100;
    std::vector<std::string> supported_extensions = { ".mp4", ".avi", ".mov", ".webm" };

    // 分类模型
    std::string model_path   = "assets/models/nsfw_classifier.onnx";
    int input_w = 224;
    int input_h = 224;
    std::vector<std::string> labels = { "normal", "nsfw" };   // output index -> label
    std::string benign_label = "normal";                      // anything else is flagged
    float norm_mean = 0.5f;
    float norm_std  = 0.5f;
    int intra_threads = 0;      // 0=auto
    bool fake_infer   = false;  // deterministic stand-in, no model needed

    // 扫描节奏
    double scan_interval_s = 0.5;   // virtual clock advance per tick
    double tick_delay_s    = 0.1;   // real pause between ticks
    int    idle_timeout_s  = 30;    // keepalive ping after this long without inbound messages

    // ===================== 方法methods ===================== //

    static ServerConfig fromYaml(const std::string& yaml_path);
    static ServerConfig fromJson(const std::string& json_path);

    // pick loader by extension (.json -> fromJson, otherwise yaml)
    static ServerConfig fromFile(const std::string& path);
};

} // namespace vidguard
