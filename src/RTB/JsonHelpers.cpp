#include "RTB/JsonHelpers.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <limits>

namespace RTB::JsonHelpers {
    std::expected<StreamConfig, StartStreamError> streamConfigFromJson(const json& j) {
        StreamConfig config;
        if (!j.is_object()) {
            spdlog::error("streamConfigFromJson: expected an object, got {}", j.type_name());
            return std::unexpected(StartStreamError::Initialization);
        }

        if (auto it = j.find("sample_rate"); it != j.end() && !it->is_null()) {
            if (!it->is_number_integer()) {
                spdlog::error("streamConfigFromJson: sample_rate must be an integer");
                return std::unexpected(StartStreamError::Initialization);
            }
            const auto rate = it->get<int64_t>();
            if (rate <= 0 || rate > std::numeric_limits<uint32_t>::max()) {
                spdlog::error("streamConfigFromJson: sample_rate {} out of range", rate);
                return std::unexpected(StartStreamError::Initialization);
            }
            config.sampleRate = static_cast<uint32_t>(rate);
        }

        if (auto it = j.find("module"); it != j.end()) {
            if (!it->is_string() || it->get<std::string>().empty()) {
                spdlog::error("streamConfigFromJson: module must be a non-empty string");
                return std::unexpected(StartStreamError::Initialization);
            }
            config.moduleName = it->get<std::string>();
        }
        return config;
    }

    std::expected<StreamConfig, StartStreamError> loadStreamConfig(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            spdlog::error("loadStreamConfig: cannot open '{}'", path);
            return std::unexpected(StartStreamError::Initialization);
        }
        json j = json::parse(in, nullptr, false);
        if (j.is_discarded()) {
            spdlog::error("loadStreamConfig: '{}' is not valid JSON", path);
            return std::unexpected(StartStreamError::Initialization);
        }
        return streamConfigFromJson(j);
    }

    json toJson(const StreamInfo& info) {
        json j;
        j["sample_rate"] = info.sampleRate;
        j["max_block_frames"] = info.maxBlockFrames;
        j["num_stream_in_channels"] = info.numStreamInChannels;
        j["num_stream_out_channels"] = info.numStreamOutChannels;
        j["input_device_name"] = info.inputDeviceName ? json(*info.inputDeviceName) : json(nullptr);
        j["output_device_name"] = info.outputDeviceName ? json(*info.outputDeviceName) : json(nullptr);
        return j;
    }

    json toJson(const DeviceInfo& device) {
        return json{
            {"name", device.name},
            {"num_channels", device.numChannels},
            {"is_default", device.isDefault}
        };
    }

    json devicesToJson(const std::vector<DeviceInfo>& inputs, const std::vector<DeviceInfo>& outputs) {
        json j;
        j["inputs"] = json::array();
        j["outputs"] = json::array();
        for (const auto& device : inputs) {
            j["inputs"].push_back(toJson(device));
        }
        for (const auto& device : outputs) {
            j["outputs"].push_back(toJson(device));
        }
        return j;
    }
}
