#pragma once
#include "RTB/Error.h"
#include "RTB/StreamTypes.hpp"
#include <expected>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace RTB::JsonHelpers {
    using json = nlohmann::json;

    /**
     * @brief Build a StreamConfig from { "sample_rate": <int>, "module": <string> }.
     *
     * Both keys are optional. A rate that is not a positive integer, or a
     * module that is not a non-empty string, is an Initialization error.
     */
    std::expected<StreamConfig, StartStreamError> streamConfigFromJson(const json& j);

    std::expected<StreamConfig, StartStreamError> loadStreamConfig(const std::string& path);

    json toJson(const StreamInfo& info);
    json toJson(const DeviceInfo& device);
    json devicesToJson(const std::vector<DeviceInfo>& inputs, const std::vector<DeviceInfo>& outputs);
}
