#include <gtest/gtest.h>
#include "vpb_capi.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdlib>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

struct CapturedLogs {
    std::mutex mutex;
    std::vector<std::pair<VPBLogLevel, std::string>> messages;
};

void captureLog(void* user_data, VPBLogLevel level, const char* message) {
    auto* logs = static_cast<CapturedLogs*>(user_data);
    std::lock_guard<std::mutex> lock(logs->mutex);
    logs->messages.emplace_back(level, message ? message : "");
}

} // namespace

class CApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        setenv("VPIO_BACKEND", "synthetic", 1);
        vpb_shutdown();
    }

    void TearDown() override {
        vpb_set_log_callback(nullptr, nullptr);
        vpb_shutdown();
        vpb_set_log_level(VPB_LOG_LEVEL_INFO);
        unsetenv("VPIO_BACKEND");
    }
};

TEST_F(CApiTest, CallsBeforeInit_ReportNotInitialized) {
    EXPECT_EQ(vpb_start_playback_thread(5, 40), VPB_ERR_NOT_INITIALIZED);
    EXPECT_EQ(vpb_record(0.1), VPB_ERR_NOT_INITIALIZED);
    uint8_t frame[4] = {1, 2, 3, 4};
    EXPECT_EQ(vpb_write_frame(frame, sizeof(frame)), 0u);
    EXPECT_EQ(vpb_get_staging_capacity(), 0u);
    EXPECT_EQ(vpb_get_in_sample_rate(), 0.0);
    vpb_stop_stream();
    vpb_debug_dump();
}

TEST_F(CApiTest, StartStream_AllocatesRingsAndStagesFrames) {
    ASSERT_EQ(vpb_start_stream(16000.0, 1, 0), VPB_OK);
    EXPECT_EQ(vpb_get_staging_capacity(), 32000u);

    std::vector<uint8_t> frame(320, 0x22);
    EXPECT_EQ(vpb_write_frame(frame.data(), frame.size()), 320u);
    EXPECT_EQ(vpb_get_staging_level(), 320u);

    EXPECT_EQ(vpb_start_stream(16000.0, 1, 0), VPB_ERR_INVALID_STATE);
    EXPECT_EQ(vpb_get_in_sample_rate(), 16000.0);
    EXPECT_EQ(vpb_get_out_sample_rate(), 16000.0);
}

TEST_F(CApiTest, PacingThread_StartsAndStops) {
    ASSERT_EQ(vpb_start_stream(16000.0, 1, 0), VPB_OK);
    std::vector<uint8_t> frame(320, 0x22);
    for (int i = 0; i < 10; ++i) {
        vpb_write_frame(frame.data(), frame.size());
    }
    EXPECT_EQ(vpb_start_playback_thread(5, 40), VPB_OK);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    vpb_stop_playback_thread();
    vpb_set_target_headroom_ms(20);
    vpb_stop_stream();
    vpb_reset_underflow_count();
    EXPECT_EQ(vpb_get_underflow_count(), 0u);
}

TEST_F(CApiTest, SyntheticClock_ProducesCapture) {
    ASSERT_EQ(vpb_start_stream(16000.0, 1, 0), VPB_OK);

    size_t captureLevel = 0;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (captureLevel == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        vpb_get_ring_levels(&captureLevel, nullptr);
    }
    ASSERT_GT(captureLevel, 0u);

    std::vector<uint8_t> buffer(captureLevel);
    EXPECT_GT(vpb_read_capture(buffer.data(), buffer.size()), 0u);
    vpb_flush_input();
    vpb_flush_playback();
}

TEST_F(CApiTest, DebugJson_ParsesAndReflectsState) {
    ASSERT_EQ(vpb_start_stream(16000.0, 1, 0), VPB_OK);

    char* raw = vpb_get_debug_json();
    ASSERT_NE(raw, nullptr);
    auto j = nlohmann::json::parse(raw);
    vpb_free_string(raw);

    EXPECT_EQ(j["backend"].get<std::string>(), "synthetic");
    EXPECT_TRUE(j["initialized"].get<bool>());
    EXPECT_TRUE(j["streaming"].get<bool>());
    EXPECT_EQ(j["stagingRing"]["capacity"].get<size_t>(), 32000u);
    EXPECT_TRUE(j.contains("config"));
}

TEST_F(CApiTest, DebugJson_WithoutSession_StillValid) {
    char* raw = vpb_get_debug_json();
    ASSERT_NE(raw, nullptr);
    auto j = nlohmann::json::parse(raw);
    vpb_free_string(raw);
    EXPECT_FALSE(j["initialized"].get<bool>());
}

TEST_F(CApiTest, LogCallback_ReceivesDebugMessages) {
    CapturedLogs logs;
    ASSERT_EQ(vpb_set_log_callback(&captureLog, &logs), VPB_OK);
    ASSERT_EQ(vpb_set_log_level(VPB_LOG_LEVEL_DEBUG), VPB_OK);

    const int32_t status = vpb_init(16000.0, 1);
    vpb_debug_dump();
    vpb_set_log_callback(nullptr, nullptr);
    ASSERT_EQ(status, VPB_OK);

    std::lock_guard<std::mutex> lock(logs.mutex);
    EXPECT_FALSE(logs.messages.empty());
    for (const auto& [level, text] : logs.messages) {
        EXPECT_GE(level, VPB_LOG_LEVEL_DEBUG);
        EXPECT_FALSE(text.empty());
    }
}

TEST_F(CApiTest, SetLogLevel_RejectsUnknownLevel) {
    EXPECT_EQ(vpb_set_log_level(static_cast<VPBLogLevel>(42)), VPB_ERR_BAD_ARGUMENT);
}

TEST_F(CApiTest, GetBypass_ValidatesOutPointer) {
    ASSERT_EQ(vpb_init(16000.0, 1), VPB_OK);
    EXPECT_EQ(vpb_get_bypass(nullptr), VPB_ERR_BAD_ARGUMENT);

    unsigned int bypass = 7;
    EXPECT_EQ(vpb_get_bypass(&bypass), VPB_OK);
    EXPECT_EQ(bypass, 0u);
}

TEST_F(CApiTest, RecordWhileStreaming_InvalidState) {
    ASSERT_EQ(vpb_start_stream(16000.0, 1, 0), VPB_OK);
    EXPECT_EQ(vpb_record(0.1), VPB_ERR_INVALID_STATE);
    uint8_t sample[2] = {0, 0};
    EXPECT_EQ(vpb_play(sample, sizeof(sample)), VPB_ERR_INVALID_STATE);
}

TEST_F(CApiTest, Shutdown_ClearsSession) {
    ASSERT_EQ(vpb_init(16000.0, 1), VPB_OK);
    EXPECT_EQ(vpb_get_in_sample_rate(), 16000.0);
    vpb_shutdown();
    EXPECT_EQ(vpb_get_in_sample_rate(), 0.0);
    vpb_shutdown();
}
