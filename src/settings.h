#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#ifndef ZOUNDS_SHADER_DIR
#define ZOUNDS_SHADER_DIR "shaders"
#endif

struct Settings {
    uint32_t width = 1024;
    uint32_t height = 768;
    float threshold = 0.7f;
    uint32_t seed = 42;
    uint32_t warmupSteps = 100;
    uint32_t stepsPerFrame = 1;
    std::string shaderDir = ZOUNDS_SHADER_DIR;
    bool overlay = true;
};

// One "key v1 v2 ..." entry per line
using SettingsData = std::map<std::string, std::vector<std::string>>;

SettingsData parseSettings(const std::string& text);

// A missing file, missing keys and values that do not parse keep their defaults
Settings loadSettings(const std::string& path);
Settings settingsFrom(const SettingsData& data);

bool saveSettings(const std::string& path, const Settings& settings);
