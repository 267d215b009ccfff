#include "EditorConfig.hpp"

#include <fstream>
#include <iostream>

#include "TimelineUtils.hpp"

namespace cutline {

ViewConfig EditorConfig::toViewConfig() const {
    ViewConfig config;
    config.pixelsPerSecond = pixelsPerSecond;
    config.trackHeight = trackHeight;
    config.rulerHeight = rulerHeight;
    config.snapEnabled = snapEnabled;
    config.snapThresholdMs = snapThresholdMs;

    config.minZoomLevel = TimelineUtils::clampZoomLevel(juce::jmin(minZoomLevel, maxZoomLevel));
    config.maxZoomLevel = TimelineUtils::clampZoomLevel(juce::jmax(minZoomLevel, maxZoomLevel));
    config.zoomLevel = juce::jlimit(config.minZoomLevel, config.maxZoomLevel, defaultZoomLevel);

    return config;
}

bool EditorConfig::saveToFile(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file for writing: " << filename << std::endl;
        return false;
    }

    file << "pixelsPerSecond=" << pixelsPerSecond << std::endl;
    file << "defaultZoomLevel=" << defaultZoomLevel << std::endl;
    file << "trackHeight=" << trackHeight << std::endl;
    file << "rulerHeight=" << rulerHeight << std::endl;
    file << "minZoomLevel=" << minZoomLevel << std::endl;
    file << "maxZoomLevel=" << maxZoomLevel << std::endl;
    file << "snapEnabled=" << (snapEnabled ? 1 : 0) << std::endl;
    file << "snapThresholdMs=" << snapThresholdMs << std::endl;
    file << "rippleDeleteByDefault=" << (rippleDeleteByDefault ? 1 : 0) << std::endl;

    file.close();
    if (file.fail()) {
        std::cerr << "Failed to write config file: " << filename << std::endl;
        return false;
    }

    std::cout << "Config saved to: " << filename << std::endl;
    return true;
}

bool EditorConfig::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cout << "Config file not found, using defaults: " << filename << std::endl;
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos)
            continue;

        std::string key = line.substr(0, equalPos);
        std::string value = line.substr(equalPos + 1);

        parseConfigLine(key, value);
    }

    file.close();
    std::cout << "Config loaded from: " << filename << std::endl;
    return true;
}

void EditorConfig::parseConfigLine(const std::string& key, const std::string& value) {
    try {
        double numValue = std::stod(value);

        if (key == "pixelsPerSecond") {
            pixelsPerSecond = numValue;
        } else if (key == "defaultZoomLevel") {
            defaultZoomLevel = numValue;
        } else if (key == "trackHeight") {
            trackHeight = static_cast<int>(numValue);
        } else if (key == "rulerHeight") {
            rulerHeight = static_cast<int>(numValue);
        } else if (key == "minZoomLevel") {
            minZoomLevel = numValue;
        } else if (key == "maxZoomLevel") {
            maxZoomLevel = numValue;
        } else if (key == "snapEnabled") {
            snapEnabled = (numValue != 0);
        } else if (key == "snapThresholdMs") {
            snapThresholdMs = static_cast<TimeMs>(numValue);
        } else if (key == "rippleDeleteByDefault") {
            rippleDeleteByDefault = (numValue != 0);
        }
        // Skip unknown keys silently
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config value: " << key << "=" << value << " (" << e.what()
                  << ")" << std::endl;
    }
}

}  // namespace cutline
