#include <gtest/gtest.h>
#include "RTB/JsonHelpers.hpp"
#include "RTB/AudioBackend.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

using namespace RTB;
using json = nlohmann::json;

TEST(JsonHelpersTest, EmptyObject_GivesDefaults) {
    auto config = JsonHelpers::streamConfigFromJson(json::object());
    ASSERT_TRUE(config.has_value());
    EXPECT_FALSE(config->sampleRate.has_value());
    EXPECT_EQ(config->moduleName, kDefaultModuleName);
}

TEST(JsonHelpersTest, ParsesRateAndModule) {
    auto config = JsonHelpers::streamConfigFromJson(json{{"sample_rate", 44100}, {"module", "custom-host"}});
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->sampleRate, std::optional<uint32_t>(44100));
    EXPECT_EQ(config->moduleName, "custom-host");
}

TEST(JsonHelpersTest, NullRate_MeansNegotiate) {
    auto config = JsonHelpers::streamConfigFromJson(json{{"sample_rate", nullptr}});
    ASSERT_TRUE(config.has_value());
    EXPECT_FALSE(config->sampleRate.has_value());
}

TEST(JsonHelpersTest, InvalidValues_Rejected) {
    const json cases[] = {
        json::array(),
        json{{"sample_rate", 0}},
        json{{"sample_rate", -48000}},
        json{{"sample_rate", 48000.5}},
        json{{"sample_rate", "48000"}},
        json{{"module", ""}},
        json{{"module", 5}},
    };
    for (const auto& j : cases) {
        auto config = JsonHelpers::streamConfigFromJson(j);
        ASSERT_FALSE(config.has_value()) << j.dump();
        EXPECT_EQ(config.error(), StartStreamError::Initialization);
    }
}

TEST(JsonHelpersTest, LoadStreamConfig_FromFile) {
    const auto path = std::filesystem::temp_directory_path() / "rtb_json_helpers_test.json";
    {
        std::ofstream out(path);
        out << R"({ "sample_rate": 96000 })";
    }
    auto config = JsonHelpers::loadStreamConfig(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->sampleRate, std::optional<uint32_t>(96000));
}

TEST(JsonHelpersTest, LoadStreamConfig_MissingOrMalformed) {
    EXPECT_FALSE(JsonHelpers::loadStreamConfig("/nonexistent/rtb/config.json").has_value());

    const auto path = std::filesystem::temp_directory_path() / "rtb_json_helpers_bad.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    auto config = JsonHelpers::loadStreamConfig(path.string());
    std::filesystem::remove(path);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error(), StartStreamError::Initialization);
}

TEST(JsonHelpersTest, StreamInfoToJson) {
    StreamInfo info;
    info.sampleRate = 48000;
    info.outputDeviceName = kDefaultOutputName;

    auto j = JsonHelpers::toJson(info);
    EXPECT_EQ(j["sample_rate"], 48000);
    EXPECT_EQ(j["max_block_frames"], kBlockFrames);
    EXPECT_EQ(j["num_stream_in_channels"], 0);
    EXPECT_EQ(j["num_stream_out_channels"], 2);
    EXPECT_TRUE(j["input_device_name"].is_null());
    EXPECT_EQ(j["output_device_name"], kDefaultOutputName);
}

TEST(JsonHelpersTest, DevicesToJson) {
    auto j = JsonHelpers::devicesToJson(AudioBackend::availableInputDevices(),
                                        AudioBackend::availableOutputDevices());
    ASSERT_TRUE(j["inputs"].is_array());
    EXPECT_TRUE(j["inputs"].empty());
    ASSERT_EQ(j["outputs"].size(), 1u);
    EXPECT_EQ(j["outputs"][0]["name"], kDefaultOutputName);
    EXPECT_EQ(j["outputs"][0]["num_channels"], 2);
    EXPECT_EQ(j["outputs"][0]["is_default"], true);
}
