#include <gtest/gtest.h>
#include "settings.h"
#include <cstdio>
#include <fstream>

TEST(SettingsTest, DefaultsWhenEmpty) {
    Settings s = settingsFrom(parseSettings(""));
    EXPECT_EQ(s.width, 1024u);
    EXPECT_EQ(s.height, 768u);
    EXPECT_FLOAT_EQ(s.threshold, 0.7f);
    EXPECT_EQ(s.seed, 42u);
    EXPECT_EQ(s.warmupSteps, 100u);
    EXPECT_EQ(s.stepsPerFrame, 1u);
    EXPECT_EQ(s.shaderDir, ZOUNDS_SHADER_DIR);
    EXPECT_TRUE(s.overlay);
}

TEST(SettingsTest, ParsesKeysAndSkipsComments) {
    SettingsData d = parseSettings("# grid\nwidth 320\n\nheight   200\nthreshold 0.5\noverlay 0\n");
    EXPECT_EQ(d.count("#"), 0u);
    Settings s = settingsFrom(d);
    EXPECT_EQ(s.width, 320u);
    EXPECT_EQ(s.height, 200u);
    EXPECT_FLOAT_EQ(s.threshold, 0.5f);
    EXPECT_FALSE(s.overlay);
    EXPECT_EQ(s.seed, 42u);
}

TEST(SettingsTest, UnknownKeysIgnored) {
    Settings s = settingsFrom(parseSettings("zoom 3\nseed 7\n"));
    EXPECT_EQ(s.seed, 7u);
}

TEST(SettingsTest, BadValueKeepsDefault) {
    Settings s = settingsFrom(parseSettings("width wide\nheight -3\nthreshold 0.5x\nseed 5\n"));
    EXPECT_EQ(s.width, 1024u);
    EXPECT_EQ(s.height, 768u);
    EXPECT_FLOAT_EQ(s.threshold, 0.7f);
    EXPECT_EQ(s.seed, 5u);
}

TEST(SettingsTest, MissingFileGivesDefaults) {
    Settings s = loadSettings("no/such/settings.txt");
    EXPECT_EQ(s.width, 1024u);
}

TEST(SettingsTest, SaveThenLoad) {
    Settings s;
    s.width = 640;
    s.height = 480;
    s.threshold = 0.25f;
    s.seed = 9;
    s.warmupSteps = 0;
    s.stepsPerFrame = 3;
    s.shaderDir = "/tmp/shaders";
    s.overlay = false;

    const std::string path = testing::TempDir() + "zounds_settings_test.txt";
    ASSERT_TRUE(saveSettings(path, s));
    Settings r = loadSettings(path);
    std::remove(path.c_str());

    EXPECT_EQ(r.width, 640u);
    EXPECT_EQ(r.height, 480u);
    EXPECT_FLOAT_EQ(r.threshold, 0.25f);
    EXPECT_EQ(r.seed, 9u);
    EXPECT_EQ(r.warmupSteps, 0u);
    EXPECT_EQ(r.stepsPerFrame, 3u);
    EXPECT_EQ(r.shaderDir, "/tmp/shaders");
    EXPECT_FALSE(r.overlay);
}
