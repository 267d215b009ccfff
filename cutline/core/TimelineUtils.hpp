#pragma once

#include <juce_core/juce_core.h>

#include <cmath>

#include "TypeIds.hpp"

namespace cutline {

/**
 * @brief Pixel/time conversions and time formatting for the timeline view
 *
 * These are pure functions that can be used by any component. Time is always
 * integer milliseconds; pixels are doubles so callers choose their own rounding.
 */
namespace TimelineUtils {

constexpr double BASE_PIXELS_PER_SECOND = 100.0;
constexpr double MIN_ZOOM = 0.1;
constexpr double MAX_ZOOM = 10.0;

/**
 * Convert a time value to pixel position
 * @param ms Time in milliseconds
 * @param pixelsPerSecond Effective pixels per second (zoom already applied)
 * @return Pixel position
 */
inline double msToPixels(TimeMs ms, double pixelsPerSecond = BASE_PIXELS_PER_SECOND) {
    return (static_cast<double>(ms) / 1000.0) * pixelsPerSecond;
}

/**
 * Convert a pixel position to time, rounded to the nearest millisecond
 * @return 0 when pixelsPerSecond is not positive
 */
inline TimeMs pixelsToMs(double pixels, double pixelsPerSecond = BASE_PIXELS_PER_SECOND) {
    if (pixelsPerSecond <= 0) {
        return 0;
    }
    return static_cast<TimeMs>(std::llround((pixels / pixelsPerSecond) * 1000.0));
}

inline double clampZoomLevel(double zoomLevel) {
    return juce::jlimit(MIN_ZOOM, MAX_ZOOM, zoomLevel);
}

inline double pixelsPerSecondForZoom(double zoomLevel,
                                     double basePixelsPerSecond = BASE_PIXELS_PER_SECOND) {
    return basePixelsPerSecond * zoomLevel;
}

/**
 * Duration that fits into a view of the given width
 * @param containerWidth Width in pixels
 * @return Visible duration in milliseconds
 */
inline TimeMs visibleDurationMs(double containerWidth, double zoomLevel,
                                double basePixelsPerSecond = BASE_PIXELS_PER_SECOND) {
    return pixelsToMs(containerWidth, pixelsPerSecondForZoom(zoomLevel, basePixelsPerSecond));
}

/**
 * Format as MM:SS.mmm (minutes are not wrapped at 60)
 */
inline juce::String formatTimelineTime(TimeMs ms) {
    const TimeMs clamped = juce::jmax<TimeMs>(0, ms);
    const TimeMs totalSeconds = clamped / 1000;
    const TimeMs minutes = totalSeconds / 60;
    const TimeMs seconds = totalSeconds % 60;
    const TimeMs millis = clamped % 1000;

    return juce::String(minutes).paddedLeft('0', 2) + ":" +
           juce::String(seconds).paddedLeft('0', 2) + "." +
           juce::String(millis).paddedLeft('0', 3);
}

/**
 * Format as HH:MM:SS.mmm
 */
inline juce::String formatTimecode(TimeMs ms) {
    const TimeMs clamped = juce::jmax<TimeMs>(0, ms);
    const TimeMs totalSeconds = clamped / 1000;
    const TimeMs hours = totalSeconds / 3600;
    const TimeMs minutes = (totalSeconds / 60) % 60;
    const TimeMs seconds = totalSeconds % 60;
    const TimeMs millis = clamped % 1000;

    return juce::String(hours).paddedLeft('0', 2) + ":" +
           juce::String(minutes).paddedLeft('0', 2) + ":" +
           juce::String(seconds).paddedLeft('0', 2) + "." +
           juce::String(millis).paddedLeft('0', 3);
}

}  // namespace TimelineUtils

}  // namespace cutline
