#include "macrorec/Settings.hpp"

#include "macrorec/Errors.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace macrorec;
namespace fs = std::filesystem;

namespace {

class SettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = fs::temp_directory_path() /
               (std::string("macrorec_settings_") + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json");
        fs::remove(path);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(path, ec);
    }

    void write(const std::string& text) {
        std::ofstream(path) << text;
    }

    fs::path path;
};

} // namespace

TEST_F(SettingsTest, MissingFileGivesDefaults) {
    Settings settings = loadSettings(path.string());
    EXPECT_DOUBLE_EQ(settings.playbackSpeed, 1.0);
    EXPECT_EQ(settings.recordRateHz, 100);
    EXPECT_EQ(settings.startDelaySec, 0);
    EXPECT_EQ(settings.loopCount, 1);
    EXPECT_EQ(settings.recordingsDir, "recordings");
}

TEST_F(SettingsTest, MissingKeysKeepDefaults) {
    write(R"({"playbackSpeed": 0.5, "loopCount": 3})");
    Settings settings = loadSettings(path.string());
    EXPECT_DOUBLE_EQ(settings.playbackSpeed, 0.5);
    EXPECT_EQ(settings.loopCount, 3);
    EXPECT_EQ(settings.recordRateHz, 100);
    EXPECT_EQ(settings.recordingsDir, "recordings");
}

TEST_F(SettingsTest, SavedSettingsLoadBack) {
    Settings settings;
    settings.playbackSpeed = 2.5;
    settings.recordRateHz = 60;
    settings.startDelaySec = 3;
    settings.loopCount = 4;
    settings.recordingsDir = "captures";
    saveSettings(path.string(), settings);

    Settings loaded = loadSettings(path.string());
    EXPECT_DOUBLE_EQ(loaded.playbackSpeed, 2.5);
    EXPECT_EQ(loaded.recordRateHz, 60);
    EXPECT_EQ(loaded.startDelaySec, 3);
    EXPECT_EQ(loaded.loopCount, 4);
    EXPECT_EQ(loaded.recordingsDir, "captures");
}

TEST_F(SettingsTest, InvalidJsonIsDecodeError) {
    write("{\"playbackSpeed\": ");
    EXPECT_THROW(loadSettings(path.string()), DecodeError);

    write("[1, 2]");
    EXPECT_THROW(loadSettings(path.string()), DecodeError);
}

TEST_F(SettingsTest, WrongTypeIsValueError) {
    write(R"({"recordRateHz": "fast"})");
    EXPECT_THROW(loadSettings(path.string()), ValueError);
}

TEST_F(SettingsTest, OutOfRangeValuesAreRejected) {
    write(R"({"playbackSpeed": 0})");
    EXPECT_THROW(loadSettings(path.string()), ValueError);

    write(R"({"startDelaySec": -1})");
    EXPECT_THROW(loadSettings(path.string()), ValueError);
}

TEST_F(SettingsTest, ValidateNamesTheField) {
    Settings settings;
    settings.loopCount = 0;
    try {
        settings.validate();
        FAIL() << "expected ValueError";
    } catch (const ValueError& e) {
        EXPECT_NE(std::string(e.what()).find("loop count"), std::string::npos);
    }

    settings = Settings{};
    settings.recordRateHz = -1;
    EXPECT_THROW(settings.validate(), ValueError);

    settings = Settings{};
    settings.recordingsDir.clear();
    EXPECT_THROW(settings.validate(), ValueError);
}

TEST_F(SettingsTest, SaveRejectsInvalidSettings) {
    Settings settings;
    settings.playbackSpeed = -1.0;
    EXPECT_THROW(saveSettings(path.string(), settings), ValueError);
    EXPECT_FALSE(fs::exists(path));
}
