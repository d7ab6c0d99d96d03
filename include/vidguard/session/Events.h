#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include "vidguard/vision/Types.h"

namespace vidguard {
namespace events {

// 出站事件 (outbound event payloads, "type" is the discriminator)
nlohmann::json connectionEstablished(const std::string& session_id);
nlohmann::json videoInfo(const vision::VideoProperties& props);
nlohmann::json classification(const vision::ClassificationResult& result);
nlohmann::json error(const std::string& message);
nlohmann::json ping();

// health check reply
nlohmann::json health(bool classifier_loaded);

} // namespace events
} // namespace vidguard
