#pragma once

#include <juce_core/juce_core.h>

#include <vector>

#include "ClipInfo.hpp"

namespace cutline {

/**
 * @brief Track types
 */
enum class TrackType {
    Video,  // Composited top-down by track order
    Audio   // Mixed
};

/**
 * @brief Get display name for track type
 */
inline const char* getTrackTypeName(TrackType type) {
    switch (type) {
        case TrackType::Video:
            return "Video";
        case TrackType::Audio:
            return "Audio";
    }
    return "Unknown";
}

/**
 * @brief An ordered, non-overlapping sequence of clips of one media type
 *
 * Clips are kept sorted by startTime by the store.
 */
struct TrackInfo {
    TrackId id = INVALID_TRACK_ID;
    TrackType type = TrackType::Video;
    juce::String name;
    std::vector<ClipInfo> clips;

    bool isEmpty() const {
        return clips.empty();
    }

    const ClipInfo* findClip(ClipId clipId) const {
        for (const auto& clip : clips) {
            if (clip.id == clipId)
                return &clip;
        }
        return nullptr;
    }

    ClipInfo* findClip(ClipId clipId) {
        for (auto& clip : clips) {
            if (clip.id == clipId)
                return &clip;
        }
        return nullptr;
    }

    /// Latest clip end on this track (0 when empty)
    TimeMs getEndTime() const {
        TimeMs maxEnd = 0;
        for (const auto& clip : clips)
            maxEnd = juce::jmax(maxEnd, clip.getEndTime());
        return maxEnd;
    }
};

/**
 * @brief Full multi-track composition plus its derived duration
 *
 * totalDuration is derived; call recalculateDuration() after changing clips
 * rather than assigning it.
 */
struct TimelineInfo {
    std::vector<TrackInfo> tracks;
    TimeMs totalDuration = 0;

    void recalculateDuration() {
        TimeMs maxEnd = 0;
        for (const auto& track : tracks)
            maxEnd = juce::jmax(maxEnd, track.getEndTime());
        totalDuration = maxEnd;
    }

    const TrackInfo* findTrack(TrackId trackId) const {
        for (const auto& track : tracks) {
            if (track.id == trackId)
                return &track;
        }
        return nullptr;
    }

    TrackInfo* findTrack(TrackId trackId) {
        for (auto& track : tracks) {
            if (track.id == trackId)
                return &track;
        }
        return nullptr;
    }

    const ClipInfo* findClip(ClipId clipId) const {
        for (const auto& track : tracks) {
            if (auto* clip = track.findClip(clipId))
                return clip;
        }
        return nullptr;
    }

    std::vector<const TrackInfo*> getVideoTracks() const {
        return getTracksOfType(TrackType::Video);
    }

    std::vector<const TrackInfo*> getAudioTracks() const {
        return getTracksOfType(TrackType::Audio);
    }

  private:
    std::vector<const TrackInfo*> getTracksOfType(TrackType type) const {
        std::vector<const TrackInfo*> result;
        for (const auto& track : tracks) {
            if (track.type == type)
                result.push_back(&track);
        }
        return result;
    }
};

}  // namespace cutline
