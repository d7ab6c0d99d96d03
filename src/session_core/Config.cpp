#include "vidguard/Config.h"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>

using nlohmann::json;

namespace vidguard {

static void try_get(const YAML::Node& n, const char* key, std::string& v) { if (n[key]) v = n[key].as<std::string>(); }
static void try_get(const YAML::Node& n, const char* key, int& v)         { if (n[key]) v = n[key].as<int>(); }
static void try_get(const YAML::Node& n, const char* key, float& v)       { if (n[key]) v = n[key].as<float>(); }
static void try_get(const YAML::Node& n, const char* key, double& v)      { if (n[key]) v = n[key].as<double>(); }
static void try_get(const YAML::Node& n, const char* key, bool& v)        { if (n[key]) v = n[key].as<bool>(); }
static void try_get(const YAML::Node& n, const char* key, std::vector<std::string>& v) {
    if (!n[key]) return;
    v.clear();
    for (const auto& it : n[key]) v.push_back(it.as<std::string>());
}

ServerConfig ServerConfig::fromYaml(const std::string& yaml_path) {
    ServerConfig c;
    try {
        YAML::Node r = YAML::LoadFile(yaml_path);
        try_get(r, "host", c.host);
        try_get(r, "port", c.port);

        try_get(r, "upload_dir",    c.upload_dir);
        try_get(r, "temp_dir",      c.temp_dir);
        try_get(r, "max_upload_mb", c.max_upload_mb);
        try_get(r, "supported_extensions", c.supported_extensions);

        try_get(r, "model_path",    c.model_path);
        try_get(r, "input_w",       c.input_w);
        try_get(r, "input_h",       c.input_h);
        try_get(r, "labels",        c.labels);
        try_get(r, "benign_label",  c.benign_label);
        try_get(r, "norm_mean",     c.norm_mean);
        try_get(r, "norm_std",      c.norm_std);
        try_get(r, "intra_threads", c.intra_threads);
        try_get(r, "fake_infer",    c.fake_infer);

        try_get(r, "scan_interval_s", c.scan_interval_s);
        try_get(r, "tick_delay_s",    c.tick_delay_s);
        try_get(r, "idle_timeout_s",  c.idle_timeout_s);
    } catch (const YAML::Exception& ex) {
        std::cerr << "[ServerConfig] Failed to load " << yaml_path << ": " << ex.what() << ", keeping defaults\n";
        return ServerConfig{};
    }
    return c;
}

ServerConfig ServerConfig::fromJson(const std::string& json_path) {
    ServerConfig c;
    try {
        std::ifstream ifs(json_path);
        if (!ifs) {
            std::cerr << "[ServerConfig] Cannot open " << json_path << ", keeping defaults\n";
            return c;
        }
        json r; ifs >> r;
        auto get_s = [&](const char* k, std::string& v){ if (r.contains(k)) v = r[k].get<std::string>(); };
        auto get_i = [&](const char* k, int& v){ if (r.contains(k)) v = r[k].get<int>(); };
        auto get_f = [&](const char* k, float& v){ if (r.contains(k)) v = r[k].get<float>(); };
        auto get_d = [&](const char* k, double& v){ if (r.contains(k)) v = r[k].get<double>(); };
        auto get_b = [&](const char* k, bool& v){ if (r.contains(k)) v = r[k].get<bool>(); };
        auto get_list = [&](const char* k, std::vector<std::string>& v) {
            if (!r.contains(k)) return;
            v.clear();
            for (auto& it : r[k]) v.push_back(it.get<std::string>());
        };

        get_s("host", c.host);
        get_i("port", c.port);

        get_s("upload_dir", c.upload_dir);
        get_s("temp_dir", c.temp_dir);
        get_i("max_upload_mb", c.max_upload_mb);
        get_list("supported_extensions", c.supported_extensions);

        get_s("model_path", c.model_path);
        get_i("input_w", c.input_w);
        get_i("input_h", c.input_h);
        get_list("labels", c.labels);
        get_s("benign_label", c.benign_label);
        get_f("norm_mean", c.norm_mean);
        get_f("norm_std", c.norm_std);
        get_i("intra_threads", c.intra_threads);
        get_b("fake_infer", c.fake_infer);

        get_d("scan_interval_s", c.scan_interval_s);
        get_d("tick_delay_s", c.tick_delay_s);
        get_i("idle_timeout_s", c.idle_timeout_s);
    } catch (const json::exception& ex) {
        std::cerr << "[ServerConfig] Failed to parse " << json_path << ": " << ex.what() << ", keeping defaults\n";
        return ServerConfig{};
    }
    return c;
}

ServerConfig ServerConfig::fromFile(const std::string& path) {
    const auto ext = std::filesystem::path(path).extension().string();
    if (ext == ".json") return fromJson(path);
    return fromYaml(path);
}

} // namespace vidguard
