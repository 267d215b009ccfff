#pragma once

#include <string>

#include "CompositionStore.hpp"

namespace cutline {

/**
 * Editor preferences: timeline view defaults, snapping and editing behaviour.
 * Stored as simple key=value lines so users can edit the file by hand.
 */
class EditorConfig {
  public:
    EditorConfig() = default;

    // View Configuration
    double getPixelsPerSecond() const {
        return pixelsPerSecond;
    }
    void setPixelsPerSecond(double pps) {
        pixelsPerSecond = pps;
    }

    double getDefaultZoomLevel() const {
        return defaultZoomLevel;
    }
    void setDefaultZoomLevel(double level) {
        defaultZoomLevel = level;
    }

    int getTrackHeight() const {
        return trackHeight;
    }
    void setTrackHeight(int height) {
        trackHeight = height;
    }

    int getRulerHeight() const {
        return rulerHeight;
    }
    void setRulerHeight(int height) {
        rulerHeight = height;
    }

    // Zoom Configuration
    double getMinZoomLevel() const {
        return minZoomLevel;
    }
    void setMinZoomLevel(double level) {
        minZoomLevel = level;
    }

    double getMaxZoomLevel() const {
        return maxZoomLevel;
    }
    void setMaxZoomLevel(double level) {
        maxZoomLevel = level;
    }

    // Snap Configuration
    bool getSnapEnabled() const {
        return snapEnabled;
    }
    void setSnapEnabled(bool enabled) {
        snapEnabled = enabled;
    }

    TimeMs getSnapThresholdMs() const {
        return snapThresholdMs;
    }
    void setSnapThresholdMs(TimeMs threshold) {
        snapThresholdMs = threshold;
    }

    // Editing Configuration
    bool getRippleDeleteByDefault() const {
        return rippleDeleteByDefault;
    }
    void setRippleDeleteByDefault(bool ripple) {
        rippleDeleteByDefault = ripple;
    }

    /**
     * @brief Initial view settings for a CompositionStore
     *
     * Zoom limits are kept inside the supported [0.1, 10] range and the default
     * zoom inside the limits.
     */
    ViewConfig toViewConfig() const;

    // Save/Load Configuration
    bool saveToFile(const std::string& filename) const;

    /**
     * @return false if the file could not be opened (defaults are kept)
     */
    bool loadFromFile(const std::string& filename);

  private:
    // Helper to parse a single config line
    void parseConfigLine(const std::string& key, const std::string& value);

    // View settings
    double pixelsPerSecond = 100.0;  // At zoom 1.0
    double defaultZoomLevel = 1.0;
    int trackHeight = 80;
    int rulerHeight = 30;

    // Zoom limits
    double minZoomLevel = 0.1;
    double maxZoomLevel = 10.0;

    // Snap settings
    bool snapEnabled = true;
    TimeMs snapThresholdMs = 100;

    // Editing settings
    bool rippleDeleteByDefault = false;
};

}  // namespace cutline
