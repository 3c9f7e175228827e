#include "settings.h"
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

SettingsData parseSettings(const std::string& text) {
    SettingsData data;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream ss(line);
        std::string key;
        ss >> key;
        if (key.empty() || key[0] == '#') continue;
        std::vector<std::string> vals;
        std::string v;
        while (ss >> v) vals.push_back(v);
        data[key] = vals;
    }
    return data;
}

static const std::string* firstValue(const SettingsData& data, const char* key) {
    auto it = data.find(key);
    if (it == data.end() || it->second.empty()) return nullptr;
    return &it->second[0];
}

static void readUint(const SettingsData& data, const char* key, uint32_t& out) {
    const std::string* v = firstValue(data, key);
    if (!v) return;
    try {
        size_t used = 0;
        long long n = std::stoll(*v, &used);
        if (used != v->size() || n < 0 || n > 0xFFFFFFFFll) throw std::out_of_range(key);
        out = (uint32_t)n;
    } catch (const std::logic_error&) {
        fprintf(stderr, "[zounds] ignoring bad value for %s: %s\n", key, v->c_str());
    }
}

static void readFloat(const SettingsData& data, const char* key, float& out) {
    const std::string* v = firstValue(data, key);
    if (!v) return;
    try {
        size_t used = 0;
        float f = std::stof(*v, &used);
        if (used != v->size()) throw std::invalid_argument(key);
        out = f;
    } catch (const std::logic_error&) {
        fprintf(stderr, "[zounds] ignoring bad value for %s: %s\n", key, v->c_str());
    }
}

Settings settingsFrom(const SettingsData& data) {
    Settings s;
    readUint(data, "width", s.width);
    readUint(data, "height", s.height);
    readFloat(data, "threshold", s.threshold);
    readUint(data, "seed", s.seed);
    readUint(data, "warmupSteps", s.warmupSteps);
    readUint(data, "stepsPerFrame", s.stepsPerFrame);
    if (const std::string* dir = firstValue(data, "shaderDir")) s.shaderDir = *dir;
    uint32_t overlay = s.overlay ? 1 : 0;
    readUint(data, "overlay", overlay);
    s.overlay = overlay != 0;
    return s;
}

Settings loadSettings(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        printf("[zounds] no settings at %s, using defaults\n", path.c_str());
        return Settings();
    }
    std::stringstream text;
    text << f.rdbuf();
    return settingsFrom(parseSettings(text.str()));
}

bool saveSettings(const std::string& path, const Settings& s) {
    std::ofstream f(path);
    if (!f.is_open()) {
        fprintf(stderr, "[zounds] failed to write settings to %s\n", path.c_str());
        return false;
    }
    f << "width " << s.width << "\n";
    f << "height " << s.height << "\n";
    f << "threshold " << s.threshold << "\n";
    f << "seed " << s.seed << "\n";
    f << "warmupSteps " << s.warmupSteps << "\n";
    f << "stepsPerFrame " << s.stepsPerFrame << "\n";
    f << "shaderDir " << s.shaderDir << "\n";
    f << "overlay " << (s.overlay ? 1 : 0) << "\n";
    return true;
}
