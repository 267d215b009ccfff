#pragma once

#include <juce_core/juce_core.h>

#include <optional>
#include <vector>

#include "TypeIds.hpp"

namespace cutline {

/**
 * @brief Per-source audio stream descriptor (e.g. system audio + microphone)
 *
 * Carried through edits untouched; mixing is the playback engine's concern.
 */
struct ClipAudioTrack {
    int trackIndex = 0;  // 0-based stream index inside the media file
    juce::String label;
    float volume = 1.0f;
    bool muted = false;

    bool operator==(const ClipAudioTrack& other) const {
        return trackIndex == other.trackIndex && label == other.label &&
               volume == other.volume && muted == other.muted;
    }
};

/**
 * @brief Spatial placement of a clip in the output frame (opaque to the core)
 */
struct ClipTransform {
    double x = 0.0;  // normalised output-space offset
    double y = 0.0;
    double scale = 1.0;
    double rotation = 0.0;  // degrees, clockwise

    bool operator==(const ClipTransform& other) const {
        return x == other.x && y == other.y && scale == other.scale &&
               rotation == other.rotation;
    }
};

/**
 * @brief A trimmed reference to a media source placed on a track
 *
 * The active part of the source is [trimIn, trimOut). On the timeline the clip
 * occupies [startTime, startTime + (trimOut - trimIn)).
 *
 * Optional fields are absent until the user sets them; use the accessors to get
 * the defaulted values instead of reading the optionals directly.
 */
struct ClipInfo {
    ClipId id = INVALID_CLIP_ID;
    TrackId trackId = INVALID_TRACK_ID;
    juce::String sourcePath;

    // Timeline position
    TimeMs startTime = 0;

    // Source range
    TimeMs sourceDuration = 0;  // Length of the underlying media, fixed at creation
    TimeMs trimIn = 0;
    TimeMs trimOut = 0;

    // Fades (absent = 0)
    std::optional<TimeMs> fadeIn;
    std::optional<TimeMs> fadeOut;

    // Carried, not interpreted
    std::optional<float> volume;  // 0.0 - 1.0, absent = unity
    std::optional<bool> muted;
    std::optional<std::vector<ClipAudioTrack>> audioTracks;
    std::optional<ClipTransform> transform;

    // Helpers
    TimeMs getEffectiveDuration() const {
        return trimOut - trimIn;
    }

    TimeMs getEndTime() const {
        return startTime + getEffectiveDuration();
    }

    TimeMs getFadeIn() const {
        return fadeIn.value_or(0);
    }

    TimeMs getFadeOut() const {
        return fadeOut.value_or(0);
    }

    float getVolume() const {
        return volume.value_or(1.0f);
    }

    bool isMuted() const {
        return muted.value_or(false);
    }

    bool containsTime(TimeMs time) const {
        return time >= startTime && time < getEndTime();
    }

    /// startTime >= 0 and 0 <= trimIn < trimOut <= sourceDuration
    bool isStructurallyValid() const {
        return startTime >= 0 && trimIn >= 0 && trimIn < trimOut && trimOut <= sourceDuration;
    }

    /**
     * @brief Build a clip covering the whole source
     */
    static ClipInfo fromSource(const juce::String& path, TimeMs duration, TimeMs startTime = 0) {
        ClipInfo clip;
        clip.sourcePath = path;
        clip.sourceDuration = duration;
        clip.trimIn = 0;
        clip.trimOut = duration;
        clip.startTime = startTime;
        return clip;
    }
};

}  // namespace cutline
